// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "unicode.hpp"

namespace ccommon {

#define get_check_next \
  if (in == stop) goto error;            \
  c = *in;                               \
  if ((c & 0xC0) != 0x80) goto error;    \
  ++in;                                  \
  u <<= 6;                               \
  u |= c & 0x3F

  Uni32 from_utf8(const char * & in, const char * stop, Uni32 err_char)
  {
    Uni32 u = (Uni32)(-1);

    // the first char is guaranteed not to be off the end
    unsigned char c = *in;
    ++in;

    while (in != stop && (c & 0xC0) == 0x80) {c = *in; ++in;}
    if ((c & 0x80) == 0x00) { // 1-byte wide
      u = c;
    } else if ((c & 0xE0) == 0xC0) { // 2-byte wide
      u  = c & 0x1F;
      get_check_next;
    } else if ((c & 0xF0) == 0xE0) { // 3-byte wide
      u  = c & 0x0F;
      get_check_next;
      get_check_next;
    } else if ((c & 0xF8) == 0xF0) { // 4-byte wide
      u  = c & 0x07;
      get_check_next;
      get_check_next;
      get_check_next;
    } else {
      goto error;
    }

    return u;
  error:
    return err_char;
  }

#undef get_check_next

  void to_utf8(Uni32 c, String & out)
  {
    if (c < 0x80) {
      out.append((char)c);
    }
    else if (c < 0x800) {
      out.append((char)(0xC0 | c>>6));
      out.append((char)(0x80 | (c & 0x3F)));
    }
    else if (c < 0x10000) {
      out.append((char)(0xE0 | c>>12));
      out.append((char)(0x80 | (c>>6 & 0x3F)));
      out.append((char)(0x80 | (c & 0x3F)));
    }
    else if (c < 0x200000) {
      out.append((char)(0xF0 | c>>18));
      out.append((char)(0x80 | (c>>12 & 0x3F)));
      out.append((char)(0x80 | (c>>6 & 0x3F)));
      out.append((char)(0x80 | (c & 0x3F)));
    }
  }

  void decode(ParmString str, Vector<Uni32> & out)
  {
    out.clear();
    if (str.str() == 0) return;
    const char * in = str.str();
    const char * stop = in + str.size();
    while (in != stop)
      out.push_back(from_utf8(in, stop));
  }

  String encode(const Uni32 * begin, const Uni32 * end)
  {
    String res;
    for (; begin != end; ++begin)
      to_utf8(*begin, res);
    return res;
  }

  Uni32 to_lower(Uni32 c)
  {
    if (c >= 'A' && c <= 'Z')
      return c + 0x20;
    if (c < 0xC0)
      return c;
    // Latin-1
    if (c <= 0xDE)
      return c == 0xD7 ? c : c + 0x20;
    // Latin Extended-A, pairs of upper and lower case
    if (c >= 0x100 && c <= 0x137)
      return c | 1;
    if (c >= 0x139 && c <= 0x148)
      return (c & 1) ? c + 1 : c;
    if (c >= 0x14A && c <= 0x177)
      return c | 1;
    if (c == 0x178) return 0xFF;
    if (c == 0x179 || c == 0x17B || c == 0x17D)
      return c + 1;
    return c;
  }

  String to_lower(ParmString str)
  {
    String res;
    if (str.str() == 0) return res;
    const char * in = str.str();
    const char * stop = in + str.size();
    while (in != stop)
      to_utf8(to_lower(from_utf8(in, stop)), res);
    return res;
  }

  Uni32 remove_accent(Uni32 c)
  {
    switch (c) {
    case 0xE1: return 'a';
    case 0xE9: return 'e';
    case 0xED: return 'i';
    case 0xF3: return 'o';
    case 0xFA: return 'u';
    default:   return c;
    }
  }

  String remove_accents(ParmString str)
  {
    String res;
    if (str.str() == 0) return res;
    const char * in = str.str();
    const char * stop = in + str.size();
    while (in != stop)
      to_utf8(remove_accent(from_utf8(in, stop)), res);
    return res;
  }

  bool is_alpha(Uni32 c)
  {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
      return true;
    if (c == 0xAA || c == 0xBA) // ordinal indicators
      return true;
    if (c >= 0xC0 && c <= 0x24F)
      return c != 0xD7 && c != 0xF7;
    if (c >= 0x1E00 && c <= 0x1EFF) return true;
    return false;
  }

  bool is_digit(Uni32 c)
  {
    return c >= '0' && c <= '9';
  }

  bool is_space(Uni32 c)
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r'
      || c == '\f' || c == '\v' || c == 0xA0;
  }

  bool is_vowel(Uni32 c)
  {
    switch (remove_accent(to_lower(c))) {
    case 'a': case 'e': case 'i': case 'o': case 'u':
    case 0xFC: // u with diaeresis
      return true;
    default:
      return false;
    }
  }

  unsigned int char_count(ParmString str)
  {
    unsigned int n = 0;
    for (const char * p = str.str(); p && *p; ++p)
      if ((*p & 0xC0) != 0x80) ++n;
    return n;
  }

  Uni32 last_char(ParmString str)
  {
    unsigned int size = str.size();
    if (size == 0) return 0;
    const char * stop = str.str() + size;
    const char * p = stop - 1;
    while (p != str.str() && (*p & 0xC0) == 0x80) --p;
    return from_utf8(p, stop);
  }

}
