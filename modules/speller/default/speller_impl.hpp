// This file is part of Corrector
// Copyright (C) 2000-2001 by Kevin Atkinson under the GNU LGPL
// license version 2.0 or 2.1.  You should have received a copy of the
// LGPL license along with this library if you did not you can find it
// at http://www.gnu.org/.

#ifndef __corrector_speller_impl__
#define __corrector_speller_impl__

#include "speller.hpp"
#include "stack_ptr.hpp"
#include "prefix_tree.hpp"
#include "suggest.hpp"

namespace ccommon {
  class Tokenizer;
}

namespace corrector {

  using namespace ccommon;

  struct LanguagePolicy;
  class VerbRecognizer;

  class SpellerImpl : public Speller
  {
  public:
    SpellerImpl();
    ~SpellerImpl();

    PosibErr<void> setup(Config *);

    bool check(ParmString word) const;
    void suggest(ParmString word, Vector<String> & out) const;
    bool infinitive(ParmString word, String & inf) const;
    PosibErr<void> add_to_personal(ParmString word);
    void correct(ParmString text, String & out) const;
    void misspelled(ParmString text, Vector<String> & out) const;

    const LanguagePolicy & lang() const {return *lang_;}
    const PrefixTree & dictionary() const {return dict_;}
    const SpellingCorrector & corrector() const {return *corrector_;}
    // null if the language does not recognize verb forms
    const VerbRecognizer * verbs() const {return verbs_;}

    // <data-dir>/<lang>
    const String & lang_dir() const {return lang_dir_;}
    const String & personal_path() const {return personal_path_;}

  private:
    const LanguagePolicy * lang_;
    PrefixTree dict_;
    StackPtr<VerbRecognizer> verbs_;
    StackPtr<SpellingCorrector> corrector_;
    String lang_dir_;
    String personal_path_;
    String separator_;
    bool verbose_;

    PosibErr<void> load_main();
    PosibErr<void> load_personal();
    PosibErr<void> load_custom();

    Tokenizer * new_text_tokenizer() const;
    // true if a word token should be marked, sugs is then set to the
    // text to put between the separators
    bool needs_correction(const String & word, String & sugs) const;
    bool is_valid_compound(const String & word) const;
  };

}

#endif
