// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

#include <stdlib.h>

#include "unicode.hpp"
#include "wordinfo.hpp"

namespace corrector {

  struct NameAlias {
    const char * name;
    int value;
  };

  static const NameAlias category_aliases[] = {
    {"sustantivo", Noun}, {"noun", Noun}, {"n", Noun},
    {"verbo", Verb}, {"verb", Verb}, {"v", Verb},
    {"adjetivo", Adjective}, {"adjective", Adjective}, {"adj", Adjective},
    {"adverbio", Adverb}, {"adverb", Adverb}, {"adv", Adverb},
    {"articulo", Article}, {"artículo", Article}, {"article", Article},
    {"art", Article},
    {"preposicion", Preposition}, {"preposición", Preposition},
    {"preposition", Preposition}, {"prep", Preposition},
    {"conjuncion", Conjunction}, {"conjunción", Conjunction},
    {"conjunction", Conjunction}, {"conj", Conjunction},
    {"pronombre", Pronoun}, {"pronoun", Pronoun}, {"pron", Pronoun},
    {"determinante", Determiner}, {"determiner", Determiner},
    {"det", Determiner},
    {0, 0}
  };

  static const NameAlias gender_aliases[] = {
    {"m", Masculine}, {"masc", Masculine}, {"masculine", Masculine},
    {"masculino", Masculine},
    {"f", Feminine}, {"fem", Feminine}, {"feminine", Feminine},
    {"femenino", Feminine},
    {0, 0}
  };

  static const NameAlias number_aliases[] = {
    {"s", Singular}, {"sing", Singular}, {"singular", Singular},
    {"p", Plural}, {"pl", Plural}, {"plural", Plural},
    {0, 0}
  };

  static int lookup_alias(const NameAlias * table, ParmString name, int def)
  {
    String n = to_lower(trim_wspace(name));
    for (; table->name; ++table)
      if (n == table->name) return table->value;
    return def;
  }

  WordCategory to_category(ParmString s)
  {
    return static_cast<WordCategory>
      (lookup_alias(category_aliases, s, OtherCategory));
  }

  WordGender to_gender(ParmString s)
  {
    return static_cast<WordGender>(lookup_alias(gender_aliases, s, NoGender));
  }

  WordNumber to_number(ParmString s)
  {
    return static_cast<WordNumber>(lookup_alias(number_aliases, s, NoNumber));
  }

  WordEntry parse_word_entry(const String * fields, unsigned int num_fields)
  {
    WordEntry entry;
    if (num_fields > 0) entry.category = to_category(fields[0]);
    if (num_fields > 1) entry.gender   = to_gender(fields[1]);
    if (num_fields > 2) entry.number   = to_number(fields[2]);
    if (num_fields > 3) entry.extra    = fields[3];
    if (num_fields > 4) {
      char * end;
      unsigned long f = strtoul(fields[4].c_str(), &end, 10);
      if (end != fields[4].c_str() && *end == '\0' && f > 0)
        entry.frequency = f;
    }
    return entry;
  }

}
