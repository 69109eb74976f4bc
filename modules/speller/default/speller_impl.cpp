// This file is part of Corrector
// Copyright (C) 2000-2001 by Kevin Atkinson under the GNU LGPL
// license version 2.0 or 2.1.  You should have received a copy of the
// LGPL license along with this library if you did not you can find it
// at http://www.gnu.org/.

#include "config.hpp"
#include "dict_loader.hpp"
#include "errors.hpp"
#include "file_util.hpp"
#include "fstream.hpp"
#include "getdata.hpp"
#include "gettext.h"
#include "iostream.hpp"
#include "language.hpp"
#include "speller_impl.hpp"
#include "tokenizer.hpp"
#include "unicode.hpp"
#include "verb_forms.hpp"

namespace corrector {

  SpellerImpl::SpellerImpl()
    : lang_(0), verbose_(false) {}

  SpellerImpl::~SpellerImpl() {}

  //////////////////////////////////////////////////////////////////////
  //
  // Spell check methods
  //

  bool SpellerImpl::check(ParmString word) const
  {
    return corrector_->is_correct(word);
  }

  void SpellerImpl::suggest(ParmString word, Vector<String> & out) const
  {
    out.clear();
    Suggestions sugs;
    corrector_->suggest(word, sugs);
    for (Suggestions::const_iterator i = sugs.begin(); i != sugs.end(); ++i)
      out.push_back(i->word);
  }

  bool SpellerImpl::infinitive(ParmString word, String & inf) const
  {
    if (!verbs_) return false;
    return verbs_->infinitive(word, inf);
  }

  PosibErr<void> SpellerImpl::add_to_personal(ParmString word)
  {
    RET_ON_ERR(check_if_valid(*lang_, word));
    FStream out;
    RET_ON_ERR(open_file_append(out, personal_path_));
    out << word << '\n';
    dict_.insert(word, WordEntry());
    return no_err;
  }

  //////////////////////////////////////////////////////////////////////
  //
  // Text methods
  //

  Tokenizer * SpellerImpl::new_text_tokenizer() const
  {
    return new_tokenizer(lang_->mid_chars ? lang_->mid_chars : "");
  }

  // "hispano-americano" is fine if both halves are
  bool SpellerImpl::is_valid_compound(const String & word) const
  {
    Vector<String> parts;
    split_fields(word, '-', parts);
    if (parts.size() < 2) return false;
    for (Vector<String>::const_iterator i = parts.begin(); i != parts.end(); ++i)
      if (i->empty() || !check(*i)) return false;
    return true;
  }

  bool SpellerImpl::needs_correction(const String & word, String & sugs) const
  {
    if (check(word)) return false;
    if (word.find('-') != String::npos && is_valid_compound(word))
      return false;

    Vector<String> words;
    suggest(word, words);
    if (words.empty()) {
      sugs = "?";
      return true;
    }
    if (words.size() == 1 && to_lower(words[0]) == to_lower(word))
      return false;

    sugs.clear();
    for (Vector<String>::const_iterator i = words.begin(); i != words.end(); ++i) {
      if (i != words.begin()) sugs += ',';
      sugs += *i;
    }
    return true;
  }

  void SpellerImpl::correct(ParmString text, String & out) const
  {
    out.clear();
    StackPtr<Tokenizer> tok(new_text_tokenizer());
    tok->reset(text);
    String sugs;
    while (tok->advance()) {
      out.append(tok->begin, tok->end - tok->begin);
      if (tok->type != WordToken) continue;
      if (!needs_correction(tok->word, sugs)) continue;
      out += ' ';
      out += separator_;
      out += sugs;
      out += separator_;
    }
  }

  void SpellerImpl::misspelled(ParmString text, Vector<String> & out) const
  {
    StackPtr<Tokenizer> tok(new_text_tokenizer());
    tok->reset(text);
    String sugs;
    while (tok->advance()) {
      if (tok->type != WordToken) continue;
      if (needs_correction(tok->word, sugs))
        out.push_back(tok->word);
    }
  }

  //////////////////////////////////////////////////////////////////////
  //
  // SpellerImpl setup
  //

  PosibErr<void> SpellerImpl::load_main()
  {
    String file = add_possible_dir(lang_dir_, "words.txt");
    PosibErr<unsigned int> pe = load_words(file, dict_);
    if (pe.has_err(cant_read_file)) {
      CERR.printf(_("Warning: %s\n"), pe.get_err()->mesg);
      CERR.printf(_("Warning: starting with an empty dictionary.\n"));
      return no_err;
    } else if (pe.has_err()) {
      return pe;
    }
    if (verbose_)
      CERR.printf(_("Loaded %u words from \"%s\".\n"), pe.data, file.c_str());
    return no_err;
  }

  PosibErr<void> SpellerImpl::load_personal()
  {
    if (!file_exists(personal_path_)) return no_err;
    RET_ON_ERR_SET(load_words(personal_path_, dict_), unsigned int, num);
    if (verbose_)
      CERR.printf(_("Loaded %u personal words from \"%s\".\n"),
                  num, personal_path_.c_str());
    return no_err;
  }

  PosibErr<void> SpellerImpl::load_custom()
  {
    RET_ON_ERR_SET(config_->retrieve("custom-dict"), String, file);
    if (file.empty()) return no_err;
    RET_ON_ERR_SET(load_words(file, dict_), unsigned int, num);
    if (verbose_)
      CERR.printf(_("Loaded %u words from \"%s\".\n"), num, file.c_str());
    return no_err;
  }

  // Takes ownership of c even when an error is returned.
  PosibErr<void> SpellerImpl::setup(Config * c)
  {
    config_.reset(c);

    RET_ON_ERR_SET(config_->retrieve("lang"), String, lang_name);
    RET_ON_ERR_SET(new_language_policy(lang_name), const LanguagePolicy *, lang);
    lang_ = lang;

    RET_ON_ERR_SET(config_->retrieve("data-dir"), String, data_dir);
    RET_ON_ERR_SET(config_->retrieve("personal"), String, personal);
    RET_ON_ERR_SET(config_->retrieve("separator"), String, sep);
    RET_ON_ERR_SET(config_->retrieve_bool("verbose"), bool, verbose);
    lang_dir_ = add_possible_dir(data_dir, lang_->code);
    personal_path_ = add_possible_dir(lang_dir_, personal);
    separator_ = sep;
    verbose_ = verbose;

    SuggestParms parms;
    RET_ON_ERR(parms.set(*config_));

    RET_ON_ERR(load_main());
    RET_ON_ERR(load_personal());
    RET_ON_ERR(load_custom());

    dict_.set_depluralizer(lang_->depluralizer);

    if (lang_->verb_forms) {
      verbs_.reset(new VerbRecognizer(dict_, *lang_));
      if (verbose_)
        CERR.printf(_("Recognizing forms of %u verbs.\n"),
                    verbs_->infinitive_count());
    }

    corrector_.reset(new SpellingCorrector(dict_, *lang_, verbs_, parms));

    return no_err;
  }

}

namespace ccommon {

  PosibErr<Speller *> new_speller(Config * c)
  {
    StackPtr<corrector::SpellerImpl> sp(new corrector::SpellerImpl());
    RET_ON_ERR(sp->setup(c));
    return static_cast<Speller *>(sp.release());
  }

}
