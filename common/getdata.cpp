// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <string.h>

#include "getdata.hpp"
#include "istream.hpp"
#include "string.hpp"

namespace ccommon {

  static inline bool is_space(char c)
  {
    return c == ' ' || c == '\t' || c == '\r';
  }

  bool getdata_pair(IStream & in, DataPair & d, String & buf)
  {
    char * p;

    // get first non blank line
    do {
      buf.clear();
      buf.append('\0'); // to avoid some special cases
      if (!in.append_line(buf)) return false;
      d.line_num++;
      p = buf.mstr() + 1;
      while (is_space(*p)) ++p;
    } while (*p == '#' || *p == '\0');

    // get key
    d.key.str = p;
    while (*p != '\0' &&
           ((!is_space(*p) && *p != '#') || *(p-1) == '\\')) ++p;
    d.key.size = p - d.key.str;

    // figure out if there is a value and add terminate key
    d.value.str = p; // in case there is no value
    d.value.size = 0;
    if (*p == '#' || *p == '\0') {*p = '\0'; return true;}
    *p = '\0';

    // skip any white space
    ++p;
    while (is_space(*p)) ++p;
    if (*p == '\0' || *p == '#') {return true;}

    // get value
    d.value.str = p;
    while (*p != '\0' && (*p != '#' || *(p-1) == '\\')) ++p;

    // remove trailing white space and terminate value
    --p;
    while (is_space(*p)) --p;
    if (*p == '\\' && *(p + 1) != '\0') ++p;
    ++p;
    d.value.size = p - d.value.str;
    *p = '\0';

    return true;
  }

  bool getdata_line(IStream & in, DataPair & d, String & buf)
  {
    char * p;
    char * end;
    do {
      buf.clear();
      buf.append('\0');
      if (!in.append_line(buf)) return false;
      d.line_num++;
      p = buf.mstr() + 1;
      while (is_space(*p)) ++p;
    } while (*p == '#' || *p == '\0');

    end = buf.mstr() + buf.size();
    while (end != p && is_space(end[-1])) --end;
    *end = '\0';
    d.key = MutableString();
    d.value.str = p;
    d.value.size = end - p;
    return true;
  }

  char * unescape(char * dest, const char * src)
  {
    while (*src) {
      if (*src == '\\' && src[1]) {
	++src;
	switch (*src) {
	case 'n': *dest = '\n'; break;
	case 'r': *dest = '\r'; break;
	case 't': *dest = '\t'; break;
	default: *dest = *src;
	}
      } else {
	*dest = *src;
      }
      ++src;
      ++dest;
    }
    *dest = '\0';
    return dest;
  }

  void split_fields(ParmString str, char sep, Vector<String> & out)
  {
    out.clear();
    if (str.str() == 0) return;
    const char * b = str.str();
    const char * end = b + str.size();
    for (;;) {
      const char * e = static_cast<const char *>(memchr(b, sep, end - b));
      if (e == 0) e = end;
      out.push_back(trim_wspace(String(b, e)));
      if (e == end) break;
      b = e + 1;
    }
  }

}
