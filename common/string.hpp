// This file is part of Corrector
// Copyright (C) 2001-2004 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_STRING__HPP
#define CORRECTOR_STRING__HPP

#include <string>
#include <string.h>

#include "parm_string.hpp"

namespace ccommon {

  // String is a std::string with the handful of extras the rest of
  // the code base expects.  All strings are UTF-8.

  class String : public std::string
  {
  public:
    String() {}
    String(const char * s) : std::string(s ? s : "") {}
    String(const char * s, unsigned int size) : std::string(s, size) {}
    String(const char * begin, const char * end)
      : std::string(begin, end) {}
    String(ParmString s) {if (s.str()) assign(s.str(), s.size());}
    String(const std::string & s) : std::string(s) {}
    String(unsigned int n, char c) : std::string(n, c) {}

    using std::string::append;
    String & append(char c) {push_back(c); return *this;}

    const char * str() const {return c_str();}
    char * mstr() {return &(*this)[0];}

    // true if the string starts (ends) with the given bytes
    bool prefix(ParmString p) const {
      unsigned int n = p.size();
      return n <= size() && compare(0, n, p.str(), n) == 0;
    }
    bool suffix(ParmString s) const {
      unsigned int n = s.size();
      return n <= size() && compare(size() - n, n, s.str(), n) == 0;
    }

    // the string without its last n bytes
    String chop(unsigned int n) const {
      return n >= size() ? String() : String(data(), size() - n);
    }

    // the string without the given suffix, which must be present
    String without(ParmString s) const {return chop(s.size());}
  };

  inline ParmString::ParmString(const String & s)
    : str_(s.c_str()), size_(s.size()) {}

  inline String operator+ (const String & lhs, const String & rhs)
  {
    String res = lhs;
    res.append(rhs);
    return res;
  }

  inline String operator+ (const String & lhs, const char * rhs)
  {
    String res = lhs;
    res.append(rhs);
    return res;
  }

  inline String operator+ (const char * lhs, const String & rhs)
  {
    String res = lhs;
    res.append(rhs);
    return res;
  }

  inline String operator+ (const String & lhs, char rhs)
  {
    String res = lhs;
    res.push_back(rhs);
    return res;
  }

  // replaces the last occurrence of "from" in "str" with "to", returns
  // false if "from" does not occur
  bool replace_last(String & str, ParmString from, ParmString to);

  // replaces the first occurrence of "from" in "str" with "to"
  bool replace_first(String & str, ParmString from, ParmString to);

  // removes leading and trailing white space
  String trim_wspace(ParmString);

}

#endif
