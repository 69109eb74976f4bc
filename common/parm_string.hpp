// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_PARM_STRING__HPP
#define CORRECTOR_PARM_STRING__HPP

#include <string.h>
#include <limits.h>

namespace ccommon {

  class String;

  // ParmString is a light weight read only view of a null terminated
  // string used for passing parameters.  It never owns the memory.
  class ParmString {
  public:
    ParmString() : str_(0), size_(0) {}
    ParmString(const char * str, unsigned int sz = UINT_MAX)
      : str_(str), size_(sz) {}
    inline ParmString(const String &);

    bool empty() const {
      return str_ == 0 || str_[0] == '\0';
    }
    unsigned int size() const {
      if (str_ == 0) return 0;
      if (size_ != UINT_MAX) return size_;
      else return size_ = strlen(str_);
    }
    operator const char * () const {
      return str_;
    }
    const char * str () const {
      return str_;
    }
  private:
    const char * str_;
    mutable unsigned int size_;
  };

  inline bool operator== (ParmString s1, ParmString s2)
  {
    if (s1.str() == 0 || s2.str() == 0)
      return s1.str() == s2.str();
    return strcmp(s1,s2) == 0;
  }
  inline bool operator== (const char * s1, ParmString s2)
  {
    if (s1 == 0 || s2.str() == 0)
      return s1 == s2.str();
    return strcmp(s1,s2) == 0;
  }
  inline bool operator== (ParmString s1, const char * s2)
  {
    if (s1.str() == 0 || s2 == 0)
      return s1.str() == s2;
    return strcmp(s1,s2) == 0;
  }
  inline bool operator!= (ParmString s1, ParmString s2)
  {
    return !(s1 == s2);
  }
  inline bool operator!= (const char * s1, ParmString s2)
  {
    return !(s1 == s2);
  }
  inline bool operator!= (ParmString s1, const char * s2)
  {
    return !(s1 == s2);
  }

}

#endif
