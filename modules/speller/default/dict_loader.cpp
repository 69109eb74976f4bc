// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "dict_loader.hpp"
#include "fstream.hpp"
#include "getdata.hpp"
#include "prefix_tree.hpp"
#include "vector.hpp"

namespace corrector {

  bool parse_dictionary_line(ParmString line, String & word, WordEntry & entry)
  {
    Vector<String> fields;
    split_fields(line, '|', fields);
    if (fields.empty() || fields[0].empty()) return false;
    word = fields[0];
    entry = parse_word_entry(fields.pbegin() + 1, fields.size() - 1);
    return true;
  }

  unsigned int load_words(IStream & in, PrefixTree & dict)
  {
    unsigned int count = 0;
    DataPair d;
    String buf;
    String word;
    WordEntry entry;
    while (getdata_line(in, d, buf)) {
      if (!parse_dictionary_line(d.value, word, entry)) continue;
      dict.insert(word, entry);
      ++count;
    }
    return count;
  }

  PosibErr<unsigned int> load_words(ParmString file, PrefixTree & dict)
  {
    FStream in;
    RET_ON_ERR(in.open(file, "r"));
    return load_words(in, dict);
  }

}
