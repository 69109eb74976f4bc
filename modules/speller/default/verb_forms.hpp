// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_verb_forms__
#define __corrector_verb_forms__

#include <map>
#include <set>

#include "parm_string.hpp"
#include "string.hpp"
#include "verb_tables.hpp"

namespace corrector {

  using namespace ccommon;

  class PrefixTree;
  struct LanguagePolicy;

  // Decides whether a word is a conjugated form of a verb in the
  // dictionary.  Nothing is modified after construction.
  class VerbRecognizer {
  public:
    VerbRecognizer(const PrefixTree & dict, const LanguagePolicy & lang,
                   const VerbTables & tables = verb_tables());

    bool is_valid_verb_form(ParmString word) const;

    // Sets inf to the infinitive of word, the pronominal infinitive
    // when the dictionary has one.  Returns false if word is not
    // recognized.
    bool infinitive(ParmString word, String & inf) const;

    unsigned int infinitive_count() const {return infinitives_.size();}
    unsigned int pronominal_count() const {return pronominal_.size();}

  private:
    typedef std::set<String> Infinitives;
    typedef std::map<String, String> Pronominal;

    const VerbTables & tables_;
    const char * const * prefixes_;
    const char * const * clitics_;
    Infinitives infinitives_;
    Pronominal pronominal_;

    bool known(const String & inf) const {
      return infinitives_.find(inf) != infinitives_.end();
    }
    StemChange stem_change(const String & inf) const;

    bool analyze(const String & word, String & inf) const;
    bool core(const String & word, String & inf) const;

    bool irregular(const String & word, String & inf) const;
    bool regular(const String & word, String & inf) const;
    bool future_stem(const String & stem, String & inf) const;
    bool stem_changing(const String & word, String & inf) const;
    bool orthographic(const String & word, String & inf) const;
    bool prefixed(const String & word, String & inf) const;
    bool with_enclitics(const String & word, String & inf) const;
    bool gerund(const String & base, String & inf) const;
    bool imperative(const String & base, String & inf) const;
  };

}

#endif
