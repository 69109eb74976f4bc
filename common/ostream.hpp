// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_OSTREAM__HPP
#define CORRECTOR_OSTREAM__HPP

#include <stdarg.h>

#include "parm_string.hpp"

namespace ccommon {

  class OStream {
  public:
    virtual void write (char c) = 0;
    virtual void write (ParmString) = 0;
    virtual void write (const void *, unsigned int) = 0;

    virtual int vprintf(const char *format, va_list ap) = 0;

#ifdef __GNUC__
    __attribute__ ((format (printf,2,3)))
#endif
      int printf(const char * format, ...)
    {
      va_list ap;
      va_start(ap, format);
      int res = vprintf(format, ap);
      va_end(ap);
      return res;
    }

    void put(char c) {write(c);}
    void put(ParmString str) {write(str);}

    // writes the string followed by a new line
    void printl(ParmString l)
    {
      write(l);
      write('\n');
    }

    OStream & operator << (char c) {
      write(c);
      return *this;
    }

    OStream & operator << (ParmString in) {
      write(in);
      return *this;
    }

    OStream & operator << (unsigned int i) {
      printf("%u", i);
      return *this;
    }

    OStream & operator << (int i) {
      printf("%d", i);
      return *this;
    }

    virtual ~OStream() {}
  };

}

#endif
