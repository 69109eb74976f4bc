// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_ERRORS__HPP
#define CORRECTOR_ERRORS__HPP

#include "error.hpp"

namespace ccommon {

  extern const ErrorInfo * const cerror_other;
  extern const ErrorInfo * const cerror_file;
  extern const ErrorInfo * const cerror_cant_open_file;
  extern const ErrorInfo * const cerror_cant_read_file;
  extern const ErrorInfo * const cerror_cant_write_file;
  extern const ErrorInfo * const cerror_cant_create_dir;
  extern const ErrorInfo * const cerror_bad_file_format;
  extern const ErrorInfo * const cerror_config;
  extern const ErrorInfo * const cerror_unknown_key;
  extern const ErrorInfo * const cerror_bad_value;
  extern const ErrorInfo * const cerror_language_related;
  extern const ErrorInfo * const cerror_unknown_language;
  extern const ErrorInfo * const cerror_bad_input;
  extern const ErrorInfo * const cerror_invalid_word;
  extern const ErrorInfo * const cerror_missing_parameter;

  static const ErrorInfo * const other_error = cerror_other;
  static const ErrorInfo * const file_error = cerror_file;
  static const ErrorInfo * const cant_open_file = cerror_cant_open_file;
  static const ErrorInfo * const cant_read_file = cerror_cant_read_file;
  static const ErrorInfo * const cant_write_file = cerror_cant_write_file;
  static const ErrorInfo * const cant_create_dir = cerror_cant_create_dir;
  static const ErrorInfo * const bad_file_format = cerror_bad_file_format;
  static const ErrorInfo * const config_error = cerror_config;
  static const ErrorInfo * const unknown_key = cerror_unknown_key;
  static const ErrorInfo * const bad_value = cerror_bad_value;
  static const ErrorInfo * const language_related_error = cerror_language_related;
  static const ErrorInfo * const unknown_language = cerror_unknown_language;
  static const ErrorInfo * const bad_input_error = cerror_bad_input;
  static const ErrorInfo * const invalid_word = cerror_invalid_word;
  static const ErrorInfo * const missing_parameter = cerror_missing_parameter;

}

#endif
