// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_ISTREAM__HPP
#define CORRECTOR_ISTREAM__HPP

namespace ccommon {

  class String;

  class IStream {
  private:
    char delem;
  public:
    IStream(char d = '\n') : delem(d) {}

    // Will return false if there is no more data
    bool getline(String & str) {return getline(str,delem);}
    virtual bool getline(String &, char c) = 0;

    // Appends the next line to str instead of replacing it
    bool append_line(String & str) {return append_line(str,delem);}
    virtual bool append_line(String &, char c) = 0;

    virtual ~IStream() {}
  };

}

#endif
