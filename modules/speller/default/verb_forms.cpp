// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <string.h>

#include "enclitics.hpp"
#include "language.hpp"
#include "prefix_tree.hpp"
#include "unicode.hpp"
#include "verb_forms.hpp"

namespace corrector {

  static const VerbClass verb_classes[] = {ArClass, ErClass, IrClass};

  VerbRecognizer::VerbRecognizer(const PrefixTree & dict,
                                 const LanguagePolicy & lang,
                                 const VerbTables & tables)
    : tables_(tables), prefixes_(lang.verb_prefixes), clitics_(lang.clitics)
  {
    Vector<WordRef> words;
    dict.all_words(words);
    for (Vector<WordRef>::const_iterator i = words.begin(); i != words.end(); ++i) {
      if (i->entry->category != Verb) continue;
      const String & w = i->word;
      if (w.suffix("arse") || w.suffix("erse") || w.suffix("irse")) {
        String base = w.without("se");
        infinitives_.insert(w);
        infinitives_.insert(base);
        pronominal_[base] = w;
      } else if (w.suffix("ar") || w.suffix("er") || w.suffix("ir")) {
        infinitives_.insert(w);
      }
    }
  }

  StemChange VerbRecognizer::stem_change(const String & inf) const
  {
    StemChange c = tables_.stem_change(inf);
    if (c == NoStemChange)
      c = tables_.stem_change(inf + "se");
    return c;
  }

  bool VerbRecognizer::is_valid_verb_form(ParmString word) const
  {
    String inf;
    return analyze(to_lower(word), inf);
  }

  bool VerbRecognizer::infinitive(ParmString word, String & inf) const
  {
    String res;
    if (!analyze(to_lower(word), res)) return false;
    Pronominal::const_iterator p = pronominal_.find(res);
    inf = p != pronominal_.end() ? p->second : res;
    return true;
  }

  bool VerbRecognizer::analyze(const String & word, String & inf) const
  {
    if (word.empty()) return false;
    return core(word, inf)
      || orthographic(word, inf)
      || prefixed(word, inf)
      || with_enclitics(word, inf);
  }

  bool VerbRecognizer::core(const String & word, String & inf) const
  {
    return irregular(word, inf)
      || regular(word, inf)
      || stem_changing(word, inf);
  }

  bool VerbRecognizer::irregular(const String & word, String & inf) const
  {
    const char * i = tables_.irregular(word);
    if (!i) return false;
    inf = i;
    return true;
  }

  //
  // regular forms
  //

  bool VerbRecognizer::regular(const String & word, String & inf) const
  {
    for (unsigned int c = 0; c != 3; ++c) {
      const char * suffix = infinitive_suffix(verb_classes[c]);
      for (const char * const * e = regular_endings(verb_classes[c]); *e; ++e) {
        if (!word.suffix(*e) || word.size() == strlen(*e)) continue;
        String candidate = word.without(*e) + suffix;
        if (known(candidate)) {
          inf = candidate;
          return true;
        }
      }
    }

    const char * const * lists[] = {future_endings, conditional_endings};
    for (unsigned int l = 0; l != 2; ++l) {
      for (const char * const * e = lists[l]; *e; ++e) {
        if (!word.suffix(*e)) continue;
        String base = word.without(*e);
        if (known(base)) {
          inf = base;
          return true;
        }
        if (future_stem(base, inf))
          return true;
      }
    }
    return false;
  }

  // valdr -> valer, saldr -> salir, cabr -> caber, querr -> querer,
  // podr -> poder
  bool VerbRecognizer::future_stem(const String & stem, String & inf) const
  {
    String candidate;
    if (stem.suffix("dr")) {
      String base = stem.without("dr");
      candidate = base + "er";
      if (known(candidate)) {inf = candidate; return true;}
      candidate = base + "ir";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (stem.suffix("br")) {
      candidate = stem.without("br") + "ber";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (stem.suffix("rr")) {
      candidate = stem.without("rr") + "rer";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (stem.suffix("odr")) {
      candidate = stem.without("odr") + "oder";
      if (known(candidate)) {inf = candidate; return true;}
    }
    return false;
  }

  //
  // stem changes
  //

  static const StemChange vowel_changes[] = {EToIe, OToUe, EToI, UToUe};

  static bool ir_e_to_i_ending(const char * e)
  {
    return strcmp(e, "ió") == 0 || strcmp(e, "ieron") == 0
      || strcmp(e, "iendo") == 0;
  }

  bool VerbRecognizer::stem_changing(const String & word, String & inf) const
  {
    for (unsigned int c = 0; c != 3; ++c) {
      VerbClass cls = verb_classes[c];
      const char * suffix = infinitive_suffix(cls);
      for (const char * const * e = stem_change_endings(cls); *e; ++e) {
        if (!word.suffix(*e) || word.size() == strlen(*e)) continue;
        String changed = word.without(*e);
        for (unsigned int k = 0; k != 4; ++k) {
          StemChange change = vowel_changes[k];
          String stem = changed;
          if (!replace_last(stem, stem_change_to(change), stem_change_from(change)))
            continue;
          String candidate = stem + suffix;
          if (!known(candidate)) continue;
          StemChange registered = stem_change(candidate);
          if (registered == change) {
            inf = candidate;
            return true;
          }
          // -ir verbs with e>ie use e>i in some preterite forms and
          // the gerund: sentir, sintió
          if (cls == IrClass && registered == EToIe && change == EToI
              && ir_e_to_i_ending(*e)) {
            inf = candidate;
            return true;
          }
        }
      }
    }

    for (unsigned int c = 1; c != 3; ++c) {
      const char * suffix = infinitive_suffix(verb_classes[c]);
      for (const char * const * e = zc_endings; *e; ++e) {
        if (!word.suffix(*e)) continue;
        String changed = word.without(*e);
        if (!changed.suffix("zc")) continue;
        String candidate = changed.without("zc") + "c" + suffix;
        if (known(candidate) && stem_change(candidate) == CToZc) {
          inf = candidate;
          return true;
        }
      }
    }
    return false;
  }

  //
  // spelling changes before e
  //

  static const char * const zar_endings[] = {"e", "es", "emos", "éis", "en", "é", 0};
  static const char * const gar_endings[] = {"ue", "ues", "uemos", "uéis", "uen", "ué", 0};
  static const char * const car_endings[] = {"que", "ques", "quemos", "quéis", "quen", "qué", 0};

  bool VerbRecognizer::orthographic(const String & word, String & inf) const
  {
    // z -> c: garantice, garanticé, fuerce
    for (const char * const * e = zar_endings; *e; ++e) {
      if (!word.suffix(*e)) continue;
      String stem = word.without(*e);
      if (!stem.suffix("c") || stem.size() < 2) continue;
      String original = stem.without("c") + "z";
      String candidate = original + "ar";
      if (known(candidate)) {inf = candidate; return true;}
      if (replace_first(original, "ue", "o")) {
        candidate = original + "ar";
        if (known(candidate)) {inf = candidate; return true;}
      }
    }

    // g -> gu: largue, llegué
    for (const char * const * e = gar_endings; *e; ++e) {
      if (!word.suffix(*e)) continue;
      String stem = word.without(*e);
      if (!stem.suffix("g")) continue;
      String candidate = stem + "ar";
      if (known(candidate)) {inf = candidate; return true;}
    }

    // c -> qu: indique, indiqué
    for (const char * const * e = car_endings; *e; ++e) {
      if (!word.suffix(*e) || word.size() == strlen(*e)) continue;
      String candidate = word.without(*e) + "car";
      if (known(candidate)) {inf = candidate; return true;}
    }
    return false;
  }

  //
  // prefixes
  //

  bool VerbRecognizer::prefixed(const String & word, String & inf) const
  {
    if (!prefixes_) return false;
    for (const char * const * p = prefixes_; *p; ++p) {
      if (!word.prefix(*p)) continue;
      String base(word.c_str() + strlen(*p));
      if (base.size() < 2) continue;
      String base_inf;
      if (core(base, base_inf)) {
        inf = String(*p) + base_inf;
        return true;
      }
      if (known(base)) {
        inf = word;
        return true;
      }
    }
    return false;
  }

  //
  // attached pronouns
  //

  bool VerbRecognizer::with_enclitics(const String & word, String & inf) const
  {
    Vector<String> bases;
    enclitic_bases(word, clitics_, bases);
    for (Vector<String>::const_iterator i = bases.begin(); i != bases.end(); ++i) {
      const String & base = *i;
      if (has_infinitive_shape(base) && known(base)) {
        inf = base;
        return true;
      }
      if (has_gerund_shape(base) && gerund(base, inf))
        return true;
      if (could_be_imperative(base) && imperative(base, inf))
        return true;
    }
    return false;
  }

  bool VerbRecognizer::gerund(const String & base0, String & inf) const
  {
    String base = remove_accents(base0);
    if (irregular(base, inf)) return true;

    String candidate;
    if (base.suffix("ando")) {
      candidate = base.without("ando") + "ar";
      if (known(candidate)) {inf = candidate; return true;}
    }
    const char * gerund_suffixes[] = {"iendo", "yendo"};
    for (unsigned int s = 0; s != 2; ++s) {
      if (!base.suffix(gerund_suffixes[s])) continue;
      String stem = base.without(gerund_suffixes[s]);
      candidate = stem + "er";
      if (known(candidate)) {inf = candidate; return true;}
      candidate = stem + "ir";
      if (known(candidate)) {inf = candidate; return true;}
    }
    return false;
  }

  bool VerbRecognizer::imperative(const String & base0, String & inf) const
  {
    const char * mono = monosyllabic_imperative(base0);
    if (mono) {
      inf = mono;
      return true;
    }
    if (irregular(base0, inf)) return true;

    String base = remove_accents(base0);
    if (has_exhortative_shape(base))
      return core(base, inf) || orthographic(base, inf);

    String candidate;
    if (base.suffix("ad")) {
      candidate = base.without("ad") + "ar";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (base.suffix("ed")) {
      candidate = base.without("ed") + "er";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (base.suffix("id")) {
      candidate = base.without("id") + "ir";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (base.suffix("a") && base.size() > 1) {
      candidate = base.without("a") + "ar";
      if (known(candidate)) {inf = candidate; return true;}
    }
    if (base.suffix("e") && base.size() > 1) {
      String stem = base.without("e");
      candidate = stem + "er";
      if (known(candidate)) {inf = candidate; return true;}
      candidate = stem + "ir";
      if (known(candidate)) {inf = candidate; return true;}
    }
    return false;
  }

}
