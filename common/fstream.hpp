// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_FSTREAM__HPP
#define CORRECTOR_FSTREAM__HPP

#include <stdio.h>
#include <stdarg.h>

#include "string.hpp"
#include "istream.hpp"
#include "ostream.hpp"
#include "posib_err.hpp"

// NOTE: See iostream.hpp for the standard stream (ie standard input,
//       output, error)

namespace ccommon {

  class FStream : public IStream, public OStream
  {
  private:
    FILE * file_;
    bool   own_;

  public:
    FStream(char d = '\n')
      : IStream(d), file_(0), own_(true) {}
    FStream(FILE * f, bool own = true)
      : IStream('\n'), file_(f), own_(own) {}
    ~FStream() {close();}

    PosibErr<void> open(ParmString, const char *);
    void close();

    operator bool() {return file_ != 0 && !feof(file_) && !ferror(file_);}

    int get() {return getc(file_);}
    int peek() {int c = getc(file_); ungetc(c, file_); return c;}

    FILE * c_stream() {return file_;}

    int vprintf(const char *format, va_list ap)
    {
      return vfprintf(file_, format, ap);
    }

    void flush() {fflush(file_);}

    bool getline(String & str) {return IStream::getline(str);}
    bool getline(String &, char d);
    bool append_line(String & str) {return IStream::append_line(str);}
    bool append_line(String &, char d);

    // reads everything that is left into str
    bool read_all(String & str);

    void write(ParmString);
    void write(char c);
    void write(const void *, unsigned int i);

    using OStream::operator<<;
  };
}

#endif
