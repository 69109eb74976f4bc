// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

#ifndef __corrector_language__
#define __corrector_language__

#include "parm_string.hpp"
#include "posib_err.hpp"
#include "prefix_tree.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace corrector {

  using namespace ccommon;

  // What a language brings to the speller.  Every list is null
  // terminated, a null list is the same as an empty one.
  struct LanguagePolicy {
    const char * code;
    const char * name;

    // null if plurals can not be derived
    Depluralizer depluralizer;

    // conventional abbreviations accepted as correct words
    const char * const * abbreviations;

    // characters, besides the apostrophes and the hyphen, allowed
    // inside a word (UTF-8)
    const char * mid_chars;

    // derivational verb prefixes, longest first
    const char * const * verb_prefixes;

    // pronouns that may be attached to the end of a verb
    const char * const * clitics;

    // true if conjugated verb forms should be recognized
    bool verb_forms;

    bool is_abbreviation(ParmString word) const;
    bool is_mid_char(Uni32 c) const;
  };

  // Looks up the policy for a language code or one of its names.
  PosibErr<const LanguagePolicy *> new_language_policy(ParmString name);

  // The ordered singular candidates of a Spanish plural.
  void spanish_depluralize(ParmString word, Vector<String> & candidates);

  // Returns invalid_word if the word can not be added to a word list,
  // that is if it is empty, contains white space or characters that
  // are neither letters nor word internal characters, or does not
  // begin and end with a letter.
  PosibErr<void> check_if_valid(const LanguagePolicy & l, ParmString word);

}

#endif
