// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_dict_loader__
#define __corrector_dict_loader__

#include "parm_string.hpp"
#include "posib_err.hpp"
#include "string.hpp"
#include "wordinfo.hpp"

namespace ccommon {
  class IStream;
}

namespace corrector {

  using namespace ccommon;

  class PrefixTree;

  // Splits a dictionary line of the form
  //   word|category|gender|number|extra|frequency
  // Everything after the word is optional.  Returns false if there is
  // no word.
  bool parse_dictionary_line(ParmString line, String & word, WordEntry & entry);

  // Inserts every word of the stream into dict and returns the number
  // of words read.  Blank lines and lines starting with '#' are
  // skipped.
  unsigned int load_words(IStream & in, PrefixTree & dict);

  PosibErr<unsigned int> load_words(ParmString file, PrefixTree & dict);

}

#endif
