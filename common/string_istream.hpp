// This file is part of Corrector
// Copyright (C) 2002 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_STRING_ISTREAM__HPP
#define CORRECTOR_STRING_ISTREAM__HPP

#include "istream.hpp"
#include "string.hpp"

namespace ccommon {

  class StringIStream : public IStream {
    const char * in_str;
  public:
    StringIStream(ParmString s, char d = ';')
      : IStream(d), in_str(s) {}

    bool getline(String & str, char c) {
      str.clear();
      return append_line(str, c);
    }
    bool append_line(String & str, char c) {
      if (in_str == 0 || *in_str == '\0') return false;
      const char * end = in_str;
      while (*end != c && *end != '\0') ++end;
      str.append(in_str, end - in_str);
      in_str = end;
      if (*in_str == c) ++in_str;
      return true;
    }
  };

}

#endif
