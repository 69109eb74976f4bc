// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "enclitics.hpp"
#include "unicode.hpp"

namespace corrector {

  struct Imperative {
    const char * form;
    const char * infinitive;
  };

  static const Imperative monosyllabic_imperatives[] = {
    {"di", "decir"}, {"haz", "hacer"}, {"pon", "poner"}, {"sal", "salir"},
    {"ten", "tener"}, {"ven", "venir"}, {"ve", "ir"}, {"da", "dar"},
    {"sé", "ser"},
    {0, 0}
  };

  const char * monosyllabic_imperative(ParmString base)
  {
    String b = remove_accents(base);
    if (base == "sé") b = "sé";
    for (const Imperative * i = monosyllabic_imperatives; i->form; ++i)
      if (b == i->form) return i->infinitive;
    return 0;
  }

  bool has_exhortative_shape(ParmString base)
  {
    String b = remove_accents(base);
    return b.suffix("amos") || b.suffix("emos") || b.suffix("imos");
  }

  bool has_infinitive_shape(ParmString base)
  {
    String b(base);
    return b.suffix("ar") || b.suffix("er") || b.suffix("ir");
  }

  bool has_gerund_shape(ParmString base)
  {
    String b(base);
    return b.suffix("ando") || b.suffix("iendo") || b.suffix("yendo")
      || b.suffix("ándo") || b.suffix("iéndo") || b.suffix("yéndo");
  }

  bool could_be_imperative(ParmString base)
  {
    if (monosyllabic_imperative(base)) return true;
    if (has_exhortative_shape(base)) return true;
    String b(base);
    if (b.suffix("ad") || b.suffix("ed") || b.suffix("id")) return true;
    Uni32 last = last_char(base);
    return last == 'a' || last == 'e';
  }

  static unsigned int count_vowels(ParmString word)
  {
    Vector<Uni32> chars;
    decode(word, chars);
    unsigned int n = 0;
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i)
      if (is_vowel(*i)) ++n;
    return n;
  }

  static bool is_valid_verb_base(const String & base)
  {
    unsigned int size = char_count(base);
    if (has_exhortative_shape(base))
      return size >= 4;

    Vector<Uni32> chars;
    decode(base, chars);
    if (chars.empty()) return false;
    Uni32 last = chars.back();
    Uni32 before = chars.size() >= 2 ? chars[chars.size() - 2] : 0;

    switch (last) {
    case 'r': // infinitive, maybe with an accent
      return before == 'a' || before == 'e' || before == 'i'
        || before == 0xE1 || before == 0xE9 || before == 0xED;
    case 'o': // gerund
      return has_gerund_shape(base);
    case 'a': case 'e': case 0xE1: case 0xE9: // imperative
      return size >= 2;
    case 'i': case 0xED: case 'n': case 'z': case 'l':
      return monosyllabic_imperative(base) != 0;
    case 'd': // vosotros imperative
      return before == 'a' || before == 'e' || before == 'i';
    default:
      return false;
    }
  }

  // Removes the accent that attaching the pronouns put on the base.
  static String restore_accent(const String & base)
  {
    if (base.suffix("ámos")) return base.without("ámos") + "amos";
    if (base.suffix("émos")) return base.without("émos") + "emos";
    if (base.suffix("ímos")) return base.without("ímos") + "imos";

    if (base.suffix("ár") || base.suffix("ér") || base.suffix("ír"))
      return remove_accents(base);

    if (count_vowels(base) == 1) {
      String plain = remove_accents(base);
      if (monosyllabic_imperative(plain))
        return plain;
    }

    if (base.suffix("ándo")) return base.without("ándo") + "ando";
    if (base.suffix("iéndo")) return base.without("iéndo") + "iendo";
    if (base.suffix("yéndo")) return base.without("yéndo") + "yendo";

    return base;
  }

  static void strip(const String & current, unsigned int remaining,
                    const char * const * clitics, Vector<String> & bases)
  {
    if (remaining == 0) {
      if (is_valid_verb_base(current))
        bases.append_unique(restore_accent(current));
      return;
    }
    for (const char * const * c = clitics; *c; ++c) {
      if (!current.suffix(*c)) continue;
      String base = current.without(*c);
      if (char_count(base) < 2) continue;
      strip(base, remaining - 1, clitics, bases);
    }
  }

  void enclitic_bases(ParmString word, const char * const * clitics,
                      Vector<String> & bases)
  {
    if (!clitics) return;
    String w(word);
    for (unsigned int n = 3; n > 0; --n)
      strip(w, n, clitics, bases);
  }

}
