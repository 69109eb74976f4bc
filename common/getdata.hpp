// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_GET_DATA__HPP
#define CORRECTOR_GET_DATA__HPP

#include <stddef.h>

#include "parm_string.hpp"
#include "vector.hpp"

namespace ccommon {

  class IStream;
  class String;

  // a view into a buffer owned by someone else, the buffer is
  // modified in place to null terminate the pieces
  struct MutableString {
    char * str;
    unsigned int size;
    MutableString() : str(0), size(0) {}
    MutableString(char * s, unsigned int l) : str(s), size(l) {}
    bool empty() const {return size == 0;}
    operator ParmString () const {return ParmString(str, size);}
  };

  struct DataPair {
    MutableString key;
    MutableString value;
    size_t line_num;
    DataPair() : line_num(0) {}
  };

  // NOTE: getdata_pair WILL NOT unescape a string

  // gets the next "key value" pair skipping blank lines and
  // comments starting with '#'
  bool getdata_pair(IStream & in, DataPair & d, String & buf);

  // gets the next non blank line that is not a comment, with
  // surrounding white space removed, into d.value
  bool getdata_line(IStream & in, DataPair & d, String & buf);

  char * unescape(char * dest, const char * src);
  static inline char * unescape(char * dest) {return unescape(dest, dest);}

  // splits str at every occurrence of sep, every field has its
  // surrounding white space removed
  void split_fields(ParmString str, char sep, Vector<String> & out);

}
#endif
