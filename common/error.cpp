// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <string.h>

#include "error.hpp"

namespace ccommon {

  static const char * dup_mesg(const char * m)
  {
    if (m == 0) return 0;
    size_t n = strlen(m);
    char * d = new char[n + 1];
    memcpy(d, m, n + 1);
    return d;
  }

  Error::Error(const Error & other)
    : mesg(dup_mesg(other.mesg)), err(other.err) {}

  Error & Error::operator=(const Error & other)
  {
    if (this == &other) return *this;
    delete[] mesg;
    mesg = dup_mesg(other.mesg);
    err = other.err;
    return *this;
  }

  Error::~Error()
  {
    delete[] mesg;
  }

  bool Error::is_a(ErrorInfo const * to_find) const
  {
    const ErrorInfo * e = err;
    while (e) {
      if (e == to_find) return true;
      e = e->isa;
    }
    return false;
  }
}
