// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_TOKENIZER__HPP
#define CORRECTOR_TOKENIZER__HPP

#include "parm_string.hpp"
#include "string.hpp"
#include "unicode.hpp"
#include "vector.hpp"

namespace ccommon {

  enum TokenType {WordToken, NumberToken, SpaceToken, PunctToken};

  class Tokenizer {

  public:
    Tokenizer() : begin(0), end(0), type(PunctToken), stop_(0) {}
    virtual ~Tokenizer() {}

    String word; // a copy of the current token
    const char * begin; // pointers back to the orignal text
    const char * end;
    TokenType type;

    void reset (const char * i, const char * stop) {
      begin = end = i; stop_ = stop;
    }
    void reset (ParmString text) {reset(text.str(), text.str() + text.size());}
    bool at_end() const {return end == stop_;}

    virtual bool advance() = 0; // returns false if there is nothing left

    // characters kept inside a word when surrounded by letters
    bool is_middle(Uni32 c) const {return middle_.have(c);}
    void add_middle(Uni32 c) {middle_.append_unique(c);}

  protected:
    const char * stop_;
    Vector<Uni32> middle_;
  };

  // returns a new tokenizer, every character of middle_chars is
  // treated as word internal in addition to the apostrophes and the
  // hyphen
  Tokenizer * new_tokenizer(ParmString middle_chars);

}

#endif
