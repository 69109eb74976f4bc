// This file is part of Corrector
// Copyright (C) 2001-2004 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "string.hpp"

namespace ccommon {

  bool replace_last(String & str, ParmString from, ParmString to)
  {
    String::size_type pos = str.rfind(from.str(), String::npos, from.size());
    if (pos == String::npos) return false;
    str.replace(pos, from.size(), to.str(), to.size());
    return true;
  }

  bool replace_first(String & str, ParmString from, ParmString to)
  {
    String::size_type pos = str.find(from.str(), 0, from.size());
    if (pos == String::npos) return false;
    str.replace(pos, from.size(), to.str(), to.size());
    return true;
  }

  String trim_wspace(ParmString str)
  {
    if (str.str() == 0) return String();
    const char * b = str.str();
    const char * e = b + str.size();
    while (b != e && (*b == ' ' || *b == '\t' || *b == '\n' || *b == '\r'))
      ++b;
    while (e != b && (e[-1] == ' ' || e[-1] == '\t'
                      || e[-1] == '\n' || e[-1] == '\r'))
      --e;
    return String(b, e);
  }

}
