// This file is part of Corrector
// Copyright (C) 2000 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_FILE_UTIL__HPP
#define CORRECTOR_FILE_UTIL__HPP

#include "string.hpp"
#include "posib_err.hpp"

namespace ccommon {

  class FStream;

  // false if file is empty, an absolute path, or starts with "./" or
  // "../"
  bool need_dir(ParmString file);
  // prefixes file with dir unless need_dir(file) is false
  String add_possible_dir(ParmString dir, ParmString file);
  // returns the directory part of file, without the final '/'
  String figure_out_dir(ParmString file);

  bool file_exists(ParmString name);

  // creates dir and every missing parent
  PosibErr<void> make_dirs(ParmString dir);

  // opens file for appending, creating its directory if needed
  PosibErr<void> open_file_append(FStream & out, ParmString file);
}
#endif
