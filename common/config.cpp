// This file is part of Corrector
// Copyright (C) 2001-2004 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "settings.h"

#include "config.hpp"
#include "errors.hpp"
#include "getdata.hpp"
#include "gettext.h"
#include "ostream.hpp"
#include "string_istream.hpp"

namespace ccommon {

  Config::Config(ParmString name,
		 const KeyInfo * begin,
		 const KeyInfo * end)
    : name_(name), begin_(begin), end_(end)
  {}

  static const KeyInfo * find(ParmString key,
			      const KeyInfo * i,
			      const KeyInfo * end)
  {
    while (i != end) {
      if (strcmp(key, i->name) == 0)
	return i;
      ++i;
    }
    return i;
  }

  PosibErr<const KeyInfo *> Config::keyinfo(ParmString key) const
  {
    typedef PosibErr<const KeyInfo *> Ret;
    const KeyInfo * i = ccommon::find(key, begin_, end_);
    if (i != end_) return Ret(i);
    return Ret().prim_err(unknown_key, key);
  }

  bool Config::have(ParmString key) const
  {
    return data_.find(String(key)) != data_.end();
  }

  //
  // retrieve methods
  //

  PosibErr<String> Config::get_default(ParmString key) const
  {
    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);
    return String(ki->def);
  }

  PosibErr<String> Config::retrieve(ParmString key) const
  {
    Data::const_iterator i = data_.find(String(key));
    if (i != data_.end())
      return i->second;
    else
      return get_default(key);
  }

  PosibErr<bool> Config::retrieve_bool(ParmString key) const
  {
    RET_ON_ERR_SET(retrieve(key), String, str);
    return str == "true";
  }

  PosibErr<int> Config::retrieve_int(ParmString key) const
  {
    RET_ON_ERR_SET(retrieve(key), String, str);
    int i = 0;
    sscanf(str.c_str(), "%i", &i);
    return i;
  }

  PosibErr<void> Config::replace(ParmString k, ParmString value)
  {
    if (strcmp(value,"<default>") == 0)
      return remove(k);

    const char * key = k;
    bool dont = false;
    if (strncmp(k, "dont-", 5) == 0) {
      key = k.str() + 5;
      dont = true;
    }

    RET_ON_ERR_SET(keyinfo(key), const KeyInfo *, ki);

    int num;
    switch (ki->type) {

    case KeyInfoBool:

      if (dont || strcmp(value,"false") == 0) {
	data_[key] = "false";
	return no_err;
      } else if (value[0] == '\0' || strcmp(value,"true") == 0) {
	data_[key] = "true";
	return no_err;
      } else {
	return make_err(bad_value, key, value,
			"either \"true\" or \"false\"");
      }

    case KeyInfoString:

      if (dont) return make_err(unknown_key, k);
      data_[key] = value;
      return no_err;

    case KeyInfoInt:

      if (dont) {
	return make_err(unknown_key, k);
      } else if (sscanf(value, "%i", &num) == 1 && num >= 0) {
	data_[key] = value;
	return no_err;
      } else {
	return make_err(bad_value, key, value, "a positive integer");
      }
    }

    return no_err;
  }

  PosibErr<void> Config::remove(ParmString key)
  {
    RET_ON_ERR(keyinfo(key));
    data_.erase(String(key));
    return no_err;
  }

  PosibErr<void> Config::read_in(IStream & in)
  {
    String buf;
    DataPair d;
    while (getdata_pair(in, d, buf)) {
      unescape(d.value.str);
      PosibErrBase pe = replace(d.key.str, d.value.str);
      if (pe.has_err()) return pe.with_file("", d.line_num);
    }
    return no_err;
  }

  PosibErr<void> Config::read_in_string(ParmString str)
  {
    StringIStream in(str);
    return read_in(in);
  }

  void Config::write_to_stream(OStream & out)
  {
    for (const KeyInfo * i = begin_; i != end_; ++i) {
      if (i->desc == 0) continue;
      out << "# " << i->name << " descrip: " << _(i->desc) << '\n';
      out << "# " << i->name << " default: " << i->def << '\n';
      Data::const_iterator v = data_.find(String(i->name));
      if (v != data_.end())
	out << i->name << " " << v->second << "\n";
      out << '\n';
    }
  }

  //
  // the corrector keys
  //

  static const KeyInfo config_keys[] = {
    {"lang",            KeyInfoString, "es",
     N_("language code")}
    , {"data-dir",      KeyInfoString, DATA_DIR,
       N_("location of language data files")}
    , {"custom-dict",   KeyInfoString, "",
       N_("extra dictionary file to load")}
    , {"personal",      KeyInfoString, "custom.txt",
       N_("personal word list file name")}
    , {"separator",     KeyInfoString, "|",
       N_("marker placed around spelling suggestions")}
    , {"max-distance",  KeyInfoInt,    "2",
       N_("maximum edit distance of a suggestion")}
    , {"max-suggestions", KeyInfoInt,  "5",
       N_("maximum number of suggestions")}
    , {"input",         KeyInfoString, "",
       N_("file to correct")}
    , {"output",        KeyInfoString, "",
       N_("file to write the corrected text to")}
    , {"verbose",       KeyInfoBool,   "false",
       N_("report dictionary statistics on load")}
  };

  static const KeyInfo * config_keys_end
    = config_keys + sizeof(config_keys)/sizeof(KeyInfo);

  Config * new_config()
  {
    return new Config("corrector", config_keys, config_keys_end);
  }

}
