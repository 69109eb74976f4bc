// Copyright 2000 by Kevin Atkinson under the terms of the LGPL

// suggest.cpp Suggestion code for the corrector

// Suggestions come from a single bounded walk of the dictionary tree.
// The process goes something like this.
//
// 1.     If the word has an elision ("l'home") and the part up to and
//        including the apostrophe is a word, only the part after it
//        is looked up and the prefix is put back afterwards.
//
// 2.     Find every word within max_distance edits of the (lower
//        cased) word.
//
// 3.     Sort by distance, then by frequency, then alphabetically.
//
// 4.     A "j" before "e" or "i" is very often a misspelled "g"
//        ("cojer", "elejir").  If writing "g" gives a word it goes in
//        front of everything else.
//
// 5.     Keep the first max_suggestions of the combined list.

#include <algorithm>
#include <limits.h>
#include <string.h>

#include "config.hpp"
#include "language.hpp"
#include "prefix_tree.hpp"
#include "suggest.hpp"
#include "unicode.hpp"
#include "verb_forms.hpp"

namespace corrector {

  PosibErr<void> SuggestParms::set(const Config & c)
  {
    RET_ON_ERR_SET(c.retrieve_int("max-distance"), int, d);
    RET_ON_ERR_SET(c.retrieve_int("max-suggestions"), int, s);
    max_distance = d;
    max_suggestions = s;
    return no_err;
  }

  bool operator< (const Suggestion & x, const Suggestion & y)
  {
    if (x.distance != y.distance) return x.distance < y.distance;
    if (x.frequency != y.frequency) return x.frequency > y.frequency;
    return x.word < y.word;
  }

  SpellingCorrector::SpellingCorrector(const PrefixTree & dict,
                                       const LanguagePolicy & lang,
                                       const VerbRecognizer * verbs,
                                       const SuggestParms & parms)
    : dict_(dict), lang_(lang), verbs_(verbs), parms_(parms) {}

  //
  // checking
  //

  static const char * const apostrophes[] = {"'", "\xE2\x80\x99", 0};

  // Splits at the first apostrophe, the prefix keeps the apostrophe.
  bool SpellingCorrector::split_elision(const String & word,
                                        String & prefix,
                                        String & suffix) const
  {
    for (const char * const * a = apostrophes; *a; ++a) {
      String::size_type pos = word.find(*a);
      if (pos == String::npos) continue;
      String::size_type end = pos + strlen(*a);
      if (end == word.size()) continue;
      prefix.assign(word, 0, end);
      if (!dict_.contains(prefix)) continue;
      suffix.assign(word, end, String::npos);
      return true;
    }
    return false;
  }

  bool SpellingCorrector::is_correct_elision(const String & word) const
  {
    String prefix, suffix;
    if (!split_elision(word, prefix, suffix)) return false;
    WordEntry plural;
    return dict_.contains(suffix) || dict_.derive_plural_info(suffix, plural);
  }

  bool SpellingCorrector::is_correct(ParmString word0) const
  {
    String word = to_lower(word0);
    if (word.empty()) return false;

    if (dict_.contains(word)) return true;
    if (is_correct_elision(word)) return true;
    if (lang_.is_abbreviation(word0)) return true;

    WordEntry plural;
    if (dict_.derive_plural_info(word, plural)) return true;

    if (verbs_ && verbs_->is_valid_verb_form(word)) {
      // a misspelled "g" can still look like a conjugation
      Vector<String> variants;
      j_to_g_variants(word, variants);
      return variants.empty();
    }
    return false;
  }

  //
  // suggesting
  //

  static bool is_front_vowel(Uni32 c)
  {
    return c == 'e' || c == 'i' || c == 0xE9 || c == 0xED;
  }

  void SpellingCorrector::j_to_g_variants(const String & word,
                                          Vector<String> & out) const
  {
    const char * begin = word.c_str();
    const char * stop = begin + word.size();
    for (String::size_type pos = 0; pos < word.size(); ++pos) {
      if (word[pos] != 'j') continue;
      const char * next = begin + pos + 1;
      if (next == stop || !is_front_vowel(from_utf8(next, stop))) continue;
      String variant = word;
      variant[pos] = 'g';
      if (dict_.contains(variant))
        out.append_unique(variant);
    }
  }

  bool SpellingCorrector::is_word_chars(const String & word) const
  {
    Vector<Uni32> chars;
    decode(word, chars);
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i)
      if (!is_alpha(*i) && !lang_.is_mid_char(*i)) return false;
    return true;
  }

  void SpellingCorrector::truncate(Suggestions & sugs) const
  {
    if (parms_.max_suggestions >= 0
        && sugs.size() > (unsigned)parms_.max_suggestions)
      sugs.resize(parms_.max_suggestions);
  }

  void SpellingCorrector::suggest(ParmString word0, Suggestions & out) const
  {
    out.clear();
    String word = to_lower(word0);
    if (word.empty() || dict_.contains(word)) return;

    Suggestions sugs;
    SearchResults found;
    String prefix, suffix;
    if (split_elision(word, prefix, suffix)) {
      dict_.bounded_search(suffix, parms_.max_distance, found);
      for (SearchResults::const_iterator i = found.begin(); i != found.end(); ++i) {
        if (!is_word_chars(i->word)) continue;
        sugs.push_back(Suggestion(prefix + i->word, i->distance,
                                  i->entry->frequency));
      }
    } else {
      dict_.bounded_search(word, parms_.max_distance, found);
      for (SearchResults::const_iterator i = found.begin(); i != found.end(); ++i)
        sugs.push_back(Suggestion(i->word, i->distance, i->entry->frequency));
    }
    std::sort(sugs.begin(), sugs.end());

    Vector<String> variants;
    j_to_g_variants(word, variants);
    for (Vector<String>::const_iterator i = variants.begin(); i != variants.end(); ++i)
      out.push_back(Suggestion(*i, 1, UINT_MAX));
    for (Suggestions::const_iterator i = sugs.begin(); i != sugs.end(); ++i) {
      if (variants.have(i->word)) continue;
      out.push_back(*i);
    }
    truncate(out);
  }

}
