// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_UNICODE__HPP
#define CORRECTOR_UNICODE__HPP

#include "parm_string.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace ccommon {

  typedef unsigned int Uni32;

  // Decodes one UTF-8 sequence starting at "in" and advances "in"
  // past it.  A malformed sequence yields err_char.
  Uni32 from_utf8(const char * & in, const char * stop,
                  Uni32 err_char = '?');

  void to_utf8(Uni32 c, String & out);

  void decode(ParmString str, Vector<Uni32> & out);
  String encode(const Uni32 * begin, const Uni32 * end);

  Uni32  to_lower(Uni32 c);
  String to_lower(ParmString str);

  // the base vowel of an acute accented vowel, other characters
  // are returned unchanged
  Uni32  remove_accent(Uni32 c);
  String remove_accents(ParmString str);

  bool is_alpha(Uni32 c);
  bool is_digit(Uni32 c);
  bool is_space(Uni32 c);

  // true for a, e, i, o, u with or without an accent or diaeresis
  bool is_vowel(Uni32 c);

  // number of code points
  unsigned int char_count(ParmString str);

  // last code point of str, 0 if str is empty
  Uni32 last_char(ParmString str);

}

#endif
