// This file is part of Corrector
// Copyright (C) 2000 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "errors.hpp"
#include "file_util.hpp"
#include "fstream.hpp"

namespace ccommon {

  bool need_dir(ParmString file)
  {
    if (file.empty()) return false;
    const char * f = file;
    if (f[0] == '/') return false;
    if (f[0] == '.' && (f[1] == '/' || (f[1] == '.' && f[2] == '/')))
      return false;
    return true;
  }

  String add_possible_dir(ParmString dir, ParmString file)
  {
    if (!need_dir(file) || dir.empty()) return file;
    String path = dir;
    if (path[path.size() - 1] != '/') path += '/';
    path += file;
    return path;
  }

  String figure_out_dir(ParmString file)
  {
    String f = file;
    String::size_type pos = f.rfind('/');
    if (pos == String::npos) return String();
    if (pos == 0) return String("/");
    return String(f.c_str(), pos);
  }

  bool file_exists(ParmString name)
  {
    struct stat st;
    return stat(name, &st) == 0;
  }

  PosibErr<void> make_dirs(ParmString dir)
  {
    String d = dir;
    while (d.size() > 1 && d[d.size() - 1] == '/')
      d.resize(d.size() - 1);
    if (d.empty() || file_exists(d)) return no_err;
    String parent = figure_out_dir(d);
    if (!parent.empty())
      RET_ON_ERR(make_dirs(parent));
    if (mkdir(d.c_str(), 0755) != 0 && errno != EEXIST)
      return make_err(cant_create_dir, d);
    return no_err;
  }

  PosibErr<void> open_file_append(FStream & out, ParmString file)
  {
    String dir = figure_out_dir(file);
    if (!dir.empty())
      RET_ON_ERR(make_dirs(dir));
    return out.open(file, "a");
  }

}
