// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdio.h>

#include "errors.hpp"
#include "fstream.hpp"
#include "string.hpp"

namespace ccommon {

  PosibErr<void> FStream::open(ParmString name, const char * mode)
  {
    if (file_ != 0) close();
    file_ = fopen(name, mode);
    if (file_ == 0) {
      if (strpbrk(mode, "wa+") != 0)
	return make_err(cant_write_file, name);
      else
	return make_err(cant_read_file, name);
    } else {
      return no_err;
    }
  }

  void FStream::close()
  {
    if (file_ != 0 && own_)
      fclose(file_);
    file_ = 0;
  }

  bool FStream::append_line(String & str, char d)
  {
    int c = getc(file_);
    if (c == EOF) return false;
    while (c != EOF && c != d) {
      str.push_back(static_cast<char>(c));
      c = getc(file_);
    }
    if (d == '\n' && !str.empty() && str[str.size() - 1] == '\r')
      str.erase(str.size() - 1);
    return true;
  }

  bool FStream::getline(String & str, char d)
  {
    str.clear();
    return append_line(str, d);
  }

  bool FStream::read_all(String & str)
  {
    char buf[1024];
    size_t n;
    bool any = false;
    while ((n = fread(buf, 1, sizeof(buf), file_)) > 0) {
      str.append(buf, n);
      any = true;
    }
    return any;
  }

  void FStream::write(char c)
  {
    putc(c, file_);
  }

  void FStream::write(ParmString str)
  {
    fputs(str, file_);
  }

  void FStream::write(const void * str, unsigned int n)
  {
    fwrite(str,1,n,file_);
  }

}
