// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

#ifndef __corrector_suggest__
#define __corrector_suggest__

#include "parm_string.hpp"
#include "posib_err.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace ccommon {
  class Config;
}

namespace corrector {

  using namespace ccommon;

  class PrefixTree;
  class VerbRecognizer;
  struct LanguagePolicy;

  struct SuggestParms {
    int max_distance;
    int max_suggestions;

    SuggestParms() : max_distance(2), max_suggestions(5) {}

    // reads "max-distance" and "max-suggestions"
    PosibErr<void> set(const Config & c);
  };

  struct Suggestion {
    String       word;
    int          distance;
    unsigned int frequency;
    Suggestion() : distance(0), frequency(0) {}
    Suggestion(const String & w, int d, unsigned int f)
      : word(w), distance(d), frequency(f) {}
  };

  typedef Vector<Suggestion> Suggestions;

  // Distance ascending, then frequency descending, then the word.
  bool operator< (const Suggestion & x, const Suggestion & y);

  class SpellingCorrector {
  public:
    // verbs may be null, none of the references are owned
    SpellingCorrector(const PrefixTree & dict, const LanguagePolicy & lang,
                      const VerbRecognizer * verbs = 0,
                      const SuggestParms & parms = SuggestParms());

    bool is_correct(ParmString word) const;

    // Fills out with the best replacements for word, out is left
    // empty if word is already in the dictionary.
    void suggest(ParmString word, Suggestions & out) const;

    const SuggestParms & parms() const {return parms_;}

    // The dictionary words obtained by writing "g" in place of a
    // single "j" that comes before "e" or "i".
    void j_to_g_variants(const String & word, Vector<String> & out) const;

  private:
    const PrefixTree & dict_;
    const LanguagePolicy & lang_;
    const VerbRecognizer * verbs_;
    SuggestParms parms_;

    bool split_elision(const String & word,
                       String & prefix, String & suffix) const;
    bool is_correct_elision(const String & word) const;
    bool is_word_chars(const String & word) const;
    void truncate(Suggestions & sugs) const;
  };

}

#endif
