// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

#ifndef __corrector_wordinfo__
#define __corrector_wordinfo__

#include "parm_string.hpp"
#include "string.hpp"

namespace corrector {

  using namespace ccommon;

  enum WordCategory {
    Noun, Verb, Adjective, Adverb, Article, Preposition,
    Conjunction, Pronoun, Determiner, OtherCategory
  };

  enum WordGender {Masculine, Feminine, NoGender};

  enum WordNumber {Singular, Plural, NoNumber};

  // Spanish and English names and their abbreviations are accepted,
  // case is ignored.  Anything else maps to the "other" or "none"
  // value.
  WordCategory to_category(ParmString);
  WordGender   to_gender(ParmString);
  WordNumber   to_number(ParmString);

  struct WordEntry {
    WordCategory category;
    WordGender   gender;
    WordNumber   number;
    String       extra;   // opaque tag, not interpreted
    unsigned int frequency;

    WordEntry() 
      : category(OtherCategory), gender(NoGender), number(NoNumber),
        frequency(1) {}
    WordEntry(WordCategory c, WordGender g = NoGender, 
              WordNumber n = NoNumber, unsigned int f = 1)
      : category(c), gender(g), number(n), frequency(f) {}
  };

  // Parses the metadata part of a dictionary line, that is
  // everything after the word: "category|gender|number|extra|frequency".
  // Missing fields keep their defaults, the frequency defaults to 1
  // when missing, zero or not a number.
  WordEntry parse_word_entry(const String * fields, unsigned int num_fields);

}

#endif
