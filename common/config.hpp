// This file is part of Corrector
// Copyright (C) 2001-2004 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_CONFIG__HPP
#define CORRECTOR_CONFIG__HPP

#include <map>

#include "parm_string.hpp"
#include "posib_err.hpp"
#include "string.hpp"

namespace ccommon {

  class IStream;
  class OStream;

  enum KeyInfoType {KeyInfoString, KeyInfoInt, KeyInfoBool};

  struct KeyInfo {
    const char * name;
    KeyInfoType  type;
    const char * def;
    const char * desc; // null if internal value
  };

  class Config {
  public:
    typedef std::map<String, String> Data;

  private:
    String         name_;
    const KeyInfo * begin_;
    const KeyInfo * end_;
    Data           data_;

  public:
    Config(ParmString name,
	   const KeyInfo * begin,
	   const KeyInfo * end);

    const char * name() const {return name_.c_str();}

    const KeyInfo * possible_begin() const {return begin_;}
    const KeyInfo * possible_end()   const {return end_;}

    PosibErr<const KeyInfo *> keyinfo(ParmString key) const;

    // returns true if the key has been explicitly set
    bool have(ParmString key) const;

    PosibErr<String> retrieve     (ParmString key) const;
    PosibErr<int>    retrieve_int (ParmString key) const;
    PosibErr<bool>   retrieve_bool(ParmString key) const;

    PosibErr<String> get_default(ParmString key) const;

    // "dont-<key>" may be used to set a boolean key to false
    PosibErr<void> replace(ParmString key, ParmString value);
    PosibErr<void> remove(ParmString key);

    // reads in "key value" pairs, one per line
    PosibErr<void> read_in(IStream & in);
    // pairs are separated by ';'
    PosibErr<void> read_in_string(ParmString str);

    void write_to_stream(OStream & out);
  };

  // a new Config with the keys known to the corrector
  Config * new_config();

}

#endif
