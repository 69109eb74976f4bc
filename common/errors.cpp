// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "error.hpp"
#include "errors.hpp"

namespace ccommon {


static const ErrorInfo cerror_other_obj = {
  0, // isa
  "%what:1", // mesg
  1, // num_parms
  {"what"} // parms
};
const ErrorInfo * const cerror_other = &cerror_other_obj;

static const ErrorInfo cerror_file_obj = {
  0, // isa
  "%file:1:", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_file = &cerror_file_obj;

static const ErrorInfo cerror_cant_open_file_obj = {
  cerror_file, // isa
  "The file \"%file:1\" can not be opened", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_cant_open_file = &cerror_cant_open_file_obj;

static const ErrorInfo cerror_cant_read_file_obj = {
  cerror_cant_open_file, // isa
  "The file \"%file:1\" can not be opened for reading.", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_cant_read_file = &cerror_cant_read_file_obj;

static const ErrorInfo cerror_cant_write_file_obj = {
  cerror_cant_open_file, // isa
  "The file \"%file:1\" can not be opened for writing.", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_cant_write_file = &cerror_cant_write_file_obj;

static const ErrorInfo cerror_cant_create_dir_obj = {
  cerror_file, // isa
  "The directory \"%file:1\" can not be created.", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_cant_create_dir = &cerror_cant_create_dir_obj;

static const ErrorInfo cerror_bad_file_format_obj = {
  cerror_file, // isa
  "The file \"%file:1\" is not in the proper format.", // mesg
  1, // num_parms
  {"file"} // parms
};
const ErrorInfo * const cerror_bad_file_format = &cerror_bad_file_format_obj;

static const ErrorInfo cerror_config_obj = {
  0, // isa
  0, // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const cerror_config = &cerror_config_obj;

static const ErrorInfo cerror_unknown_key_obj = {
  cerror_config, // isa
  "The key \"%key:1\" is unknown.", // mesg
  1, // num_parms
  {"key"} // parms
};
const ErrorInfo * const cerror_unknown_key = &cerror_unknown_key_obj;

static const ErrorInfo cerror_bad_value_obj = {
  cerror_config, // isa
  "The value \"%value:2\" is not %accepted:3 and is thus invalid for the key \"%key:1\".", // mesg
  3, // num_parms
  {"key", "value", "accepted"} // parms
};
const ErrorInfo * const cerror_bad_value = &cerror_bad_value_obj;

static const ErrorInfo cerror_language_related_obj = {
  0, // isa
  0, // mesg
  1, // num_parms
  {"lang"} // parms
};
const ErrorInfo * const cerror_language_related = &cerror_language_related_obj;

static const ErrorInfo cerror_unknown_language_obj = {
  cerror_language_related, // isa
  "The language \"%lang:1\" is not known.", // mesg
  1, // num_parms
  {"lang"} // parms
};
const ErrorInfo * const cerror_unknown_language = &cerror_unknown_language_obj;

static const ErrorInfo cerror_bad_input_obj = {
  0, // isa
  0, // mesg
  0, // num_parms
  {} // parms
};
const ErrorInfo * const cerror_bad_input = &cerror_bad_input_obj;

static const ErrorInfo cerror_invalid_word_obj = {
  cerror_bad_input, // isa
  "The word \"%word:1\" is invalid.", // mesg
  1, // num_parms
  {"word"} // parms
};
const ErrorInfo * const cerror_invalid_word = &cerror_invalid_word_obj;

static const ErrorInfo cerror_missing_parameter_obj = {
  cerror_bad_input, // isa
  "You must specify a parameter for \"%what:1\".", // mesg
  1, // num_parms
  {"what"} // parms
};
const ErrorInfo * const cerror_missing_parameter = &cerror_missing_parameter_obj;

}
