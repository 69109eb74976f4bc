// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <assert.h>

#include "posib_err.hpp"

namespace ccommon {

  static const char * new_mesg(const String & m)
  {
    char * str = new char[m.size() + 1];
    memcpy(str, m.c_str(), m.size() + 1);
    return str;
  }

  // Expands the "%name:N" place holders of the message template with
  // the given parameters.  A parameter past the last declared one is
  // appended to the message after a space.
  PosibErrBase & PosibErrBase::set(const ErrorInfo * inf,
				   ParmString p1, ParmString p2,
				   ParmString p3, ParmString p4)
  {
    const char * s0 = inf->mesg ? inf->mesg : "";
    ParmString p[4] = {p1,p2,p3,p4};
    unsigned int i = 0;
    while (i != 4 && p[i] != 0)
      ++i;
    assert(i == inf->num_parms || i == inf->num_parms + 1);

    String m;
    while (true) {
      const char * s = s0 + strcspn(s0, "%");
      m.append(s0, s - s0);
      if (*s == '\0') break;
      s = strchr(s, ':') + 1;
      unsigned int ip = *s - '0' - 1;
      assert(ip < inf->num_parms);
      if (p[ip].str()) m.append(p[ip].str(), p[ip].size());
      s0 = s + 1;
    }
    if (inf->num_parms < 4 && !p[inf->num_parms].empty()) {
      if (!m.empty()) m += ' ';
      m.append(p[inf->num_parms].str(), p[inf->num_parms].size());
    }

    Error * e = new Error;
    e->err = inf;
    e->mesg = new_mesg(m);
    destroy();
    err_ = new ErrPtr(e);
    return *this;
  }

  PosibErrBase & PosibErrBase::with_file(ParmString fn, int line_num)
  {
    assert (err_ != 0);
    assert (err_->refcount == 1);
    String m = fn;
    if (line_num > 0) {
      char buf[16];
      snprintf(buf, sizeof(buf), ":%d", line_num);
      m += buf;
    }
    m += ": ";
    m += err_->err->mesg;
    Error * e = const_cast<Error *>(err_->err);
    delete[] e->mesg;
    e->mesg = new_mesg(m);
    return *this;
  }

  void PosibErrBase::handle_err() const {
    assert (err_);
    assert (!err_->handled);
    fputs("Unhandled Error: ", stderr);
    fputs(err_->err->mesg, stderr);
    fputs("\n", stderr);
    abort();
  }

  void PosibErrBase::handle_incompat_assign() const {
    fputs("Incompatible Assignment of PosibErr.\n", stderr);
    abort();
  }

  Error * PosibErrBase::release() {
    assert (err_);
    assert (err_->refcount <= 1);
    err_->handled = true;
    Error * tmp = const_cast<Error *>(err_->err);
    delete err_;
    err_ = 0;
    return tmp;
  }

  void PosibErrBase::del() {
    const Error * e = release();
    delete e;
  }

}
