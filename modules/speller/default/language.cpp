// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

#include <string.h>

#include "errors.hpp"
#include "gettext.h"
#include "language.hpp"
#include "unicode.hpp"

namespace corrector {

  //
  // Spanish
  //

  static const char * const spanish_abbreviations[] = {
    "n.º", "n.ª", 0
  };

  static const char * const spanish_prefixes[] = {
    "contra", "entre", "sobre", "super", "trans", "inter",
    "ante", "anti", "auto", "semi", "pre", "sub", "com", "con", "dis", "pro",
    "des", "re", "co", "ex", "in", "en", "im",
    0
  };

  static const char * const spanish_clitics[] = {
    "me", "te", "se", "nos", "os",
    "lo", "la", "le", "los", "las", "les",
    0
  };

  struct PluralRule {
    const char * plural;
    const char * singular;
  };

  // from the most specific ending to the least specific one
  static const PluralRule spanish_plural_rules[] = {
    {"ces",   "z"},
    {"iones", "ión"},
    {"anes",  "án"},
    {"enes",  "én"},
    {"eses",  "és"},
    {"ines",  "ín"},
    {"ones",  "ón"},
    {"unes",  "ún"},
    {"íes",   "í"},
    {"úes",   "ú"},
    {0, 0}
  };

  void spanish_depluralize(ParmString word, Vector<String> & candidates)
  {
    String w = to_lower(word);

    for (const PluralRule * r = spanish_plural_rules; r->plural; ++r) {
      if (!w.suffix(r->plural)) continue;
      if (strcmp(r->plural, "ones") == 0 && w.suffix("iones")) continue;
      String stem = w.without(r->plural);
      if (stem.empty()) continue;
      candidates.append_unique(stem + r->singular);
    }

    // -es after a consonant, including y
    if (w.suffix("es")) {
      String stem = w.without("es");
      if (!stem.empty() && !is_vowel(last_char(stem)))
        candidates.append_unique(stem);
    }

    // -s after a vowel, then after a consonant
    if (w.suffix("s")) {
      String stem = w.without("s");
      if (!stem.empty() && is_vowel(last_char(stem)))
        candidates.append_unique(stem);
      if (!stem.empty() && !is_vowel(last_char(stem)))
        candidates.append_unique(stem);
    }
  }

  static const LanguagePolicy spanish = {
    "es", "Español",
    spanish_depluralize,
    spanish_abbreviations,
    "",
    spanish_prefixes,
    spanish_clitics,
    true
  };

  //
  // Catalan
  //

  static const LanguagePolicy catalan = {
    "ca", "Català",
    0,
    0,
    "·",
    0,
    0,
    false
  };

  struct LanguageAlias {
    const char * name;
    const LanguagePolicy * policy;
  };

  static const LanguageAlias language_aliases[] = {
    {"es", &spanish}, {"spanish", &spanish}, {"espanol", &spanish},
    {"español", &spanish},
    {"ca", &catalan}, {"catalan", &catalan}, {"catala", &catalan},
    {"català", &catalan},
    {0, 0}
  };

  PosibErr<const LanguagePolicy *> new_language_policy(ParmString name)
  {
    String n = to_lower(name);
    for (const LanguageAlias * i = language_aliases; i->name; ++i)
      if (n == i->name) return i->policy;
    return make_err(unknown_language, name);
  }

  bool LanguagePolicy::is_abbreviation(ParmString word) const
  {
    if (!abbreviations) return false;
    String w = to_lower(word);
    for (const char * const * i = abbreviations; *i; ++i)
      if (w == *i) return true;
    return false;
  }

  bool LanguagePolicy::is_mid_char(Uni32 c) const
  {
    if (c == '\'' || c == 0x2019 || c == '-') return true;
    Vector<Uni32> chars;
    decode(mid_chars, chars);
    return chars.have(c);
  }

  PosibErr<void> check_if_valid(const LanguagePolicy & l, ParmString word)
  {
    if (word.empty())
      return make_err(invalid_word, word, _("Empty string."));
    Vector<Uni32> chars;
    decode(word, chars);
    if (!is_alpha(chars.front()))
      return make_err(invalid_word, word,
                      _("A word must begin with a letter."));
    if (!is_alpha(chars.back()))
      return make_err(invalid_word, word,
                      _("A word must end with a letter."));
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i) {
      if (is_alpha(*i) || l.is_mid_char(*i)) continue;
      if (*i == '.' && l.is_abbreviation(word)) continue;
      return make_err(invalid_word, word,
                      _("The word contains a character that is not allowed."));
    }
    return no_err;
  }

}
