// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "tokenizer.hpp"
#include "unicode.hpp"

namespace ccommon {

  class TokenizerBasic : public Tokenizer
  {
  public:
    bool advance();
  private:
    bool is_word(Uni32 c) const {return is_alpha(c) || is_digit(c);}
    Uni32 peek(const char * p, const char * & next) const {
      next = p;
      if (p == stop_) return 0;
      return from_utf8(next, stop_);
    }
  };

  bool TokenizerBasic::advance() {
    begin = end;
    word.clear();
    if (begin == stop_) return false;

    const char * cur = begin;
    const char * next;
    Uni32 c = peek(cur, next);

    if (is_space(c)) {

      type = SpaceToken;
      while (cur != stop_ && is_space(c)) {
        cur = next;
        c = peek(cur, next);
      }

    } else if (is_word(c)) {

      bool digits = false;
      Uni32 prev = 0;
      while (cur != stop_) {
        if (is_word(c)) {
          if (is_digit(c)) digits = true;
        } else if (is_middle(c) && is_alpha(prev)) {
          // only keep it when a letter follows
          const char * after;
          Uni32 n = peek(next, after);
          if (!is_alpha(n)) break;
        } else {
          break;
        }
        prev = c;
        cur = next;
        c = peek(cur, next);
      }
      type = digits ? NumberToken : WordToken;

    } else {

      type = PunctToken;
      cur = next;

    }

    end = cur;
    word.assign(begin, end - begin);
    return true;
  }

  Tokenizer * new_tokenizer(ParmString middle_chars)
  {
    Tokenizer * tok = new TokenizerBasic();
    tok->add_middle('\'');
    tok->add_middle(0x2019);
    tok->add_middle('-');
    Vector<Uni32> chars;
    decode(middle_chars, chars);
    for (Vector<Uni32>::const_iterator i = chars.begin(); i != chars.end(); ++i)
      tok->add_middle(*i);
    return tok;
  }

}
