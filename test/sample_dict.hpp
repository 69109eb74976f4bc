// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_TEST_SAMPLE_DICT__HPP
#define CORRECTOR_TEST_SAMPLE_DICT__HPP

#include "prefix_tree.hpp"
#include "wordinfo.hpp"

namespace corrector {

  struct SampleWord {
    const char * word;
    WordCategory category;
    WordGender gender;
    WordNumber number;
    unsigned int frequency;
  };

  // a few hundred bytes of Spanish, enough for the verb engine
  static const SampleWord sample_words[] = {
    {"casa",    Noun, Feminine, Singular, 100},
    {"caso",    Noun, Masculine, Singular, 80},
    {"cosa",    Noun, Feminine, Singular, 50},
    {"cara",    Noun, Feminine, Singular, 30},
    {"cama",    Noun, Feminine, Singular, 10},
    {"capa",    Noun, Feminine, Singular, 10},
    {"taza",    Noun, Feminine, Singular, 5},
    {"canción", Noun, Feminine, Singular, 20},
    {"luz",     Noun, Feminine, Singular, 40},
    {"rápido",  Adjective, Masculine, Singular, 15},
    {"perro",   Noun, Masculine, Singular, 25},
    {"hola",    OtherCategory, NoGender, NoNumber, 60},
    {"mundo",   Noun, Masculine, Singular, 70},
    {"el",      Article, Masculine, Singular, 500},
    {"la",      Article, Feminine, Singular, 500},
    {"de",      Preposition, NoGender, NoNumber, 900},

    {"hablar",  Verb, NoGender, NoNumber, 30},
    {"comer",   Verb, NoGender, NoNumber, 30},
    {"vivir",   Verb, NoGender, NoNumber, 30},
    {"comprar", Verb, NoGender, NoNumber, 20},
    {"pensar",  Verb, NoGender, NoNumber, 20},
    {"contar",  Verb, NoGender, NoNumber, 20},
    {"pedir",   Verb, NoGender, NoNumber, 20},
    {"sentir",  Verb, NoGender, NoNumber, 20},
    {"jugar",   Verb, NoGender, NoNumber, 20},
    {"conocer", Verb, NoGender, NoNumber, 20},
    {"empezar", Verb, NoGender, NoNumber, 20},
    {"llegar",  Verb, NoGender, NoNumber, 20},
    {"buscar",  Verb, NoGender, NoNumber, 20},
    {"hacer",   Verb, NoGender, NoNumber, 40},
    {"decir",   Verb, NoGender, NoNumber, 40},
    {"dar",     Verb, NoGender, NoNumber, 40},
    {"poder",   Verb, NoGender, NoNumber, 40},
    {"salir",   Verb, NoGender, NoNumber, 40},
    {"arrepentirse", Verb, NoGender, NoNumber, 5},
    {"coger",   Verb, NoGender, NoNumber, 10},
    {0, OtherCategory, NoGender, NoNumber, 0}
  };

  inline void fill_sample_dict(PrefixTree & dict)
  {
    for (const SampleWord * w = sample_words; w->word; ++w)
      dict.insert(w->word, WordEntry(w->category, w->gender, w->number,
                                     w->frequency));
  }

}

#endif
