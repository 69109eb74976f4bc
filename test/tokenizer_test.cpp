// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <gtest/gtest.h>

#include "stack_ptr.hpp"
#include "tokenizer.hpp"

using namespace ccommon;

namespace {

  struct Token {
    String word;
    TokenType type;
  };

  Vector<Token> tokenize(const char * text, const char * middle = "")
  {
    StackPtr<Tokenizer> tok(new_tokenizer(middle));
    tok->reset(text);
    Vector<Token> res;
    while (tok->advance()) {
      Token t;
      t.word = tok->word;
      t.type = tok->type;
      res.push_back(t);
    }
    return res;
  }

  String words(const Vector<Token> & toks)
  {
    String res;
    for (Vector<Token>::const_iterator i = toks.begin(); i != toks.end(); ++i) {
      res += '[';
      res += i->word;
      res += ']';
    }
    return res;
  }

}

TEST(TokenizerTest, WordsSpacesAndPunctuation)
{
  Vector<Token> t = tokenize("Hola, mundo");
  ASSERT_EQ(4u, t.size());
  EXPECT_EQ("Hola", t[0].word);
  EXPECT_EQ(WordToken, t[0].type);
  EXPECT_EQ(",", t[1].word);
  EXPECT_EQ(PunctToken, t[1].type);
  EXPECT_EQ(" ", t[2].word);
  EXPECT_EQ(SpaceToken, t[2].type);
  EXPECT_EQ("mundo", t[3].word);
  EXPECT_EQ(WordToken, t[3].type);
}

TEST(TokenizerTest, TokensCoverTheText)
{
  const char * text = "  ¿Qué tal?\n\tBien.  ";
  Vector<Token> t = tokenize(text);
  String all;
  for (Vector<Token>::const_iterator i = t.begin(); i != t.end(); ++i)
    all += i->word;
  EXPECT_EQ(text, all);
  EXPECT_EQ("[  ][¿][Qué][ ][tal][?][\n\t][Bien][.][  ]", words(t));
}

TEST(TokenizerTest, MiddleCharacters)
{
  EXPECT_EQ("[l'home]", words(tokenize("l'home")));
  EXPECT_EQ("[l\xE2\x80\x99home]", words(tokenize("l\xE2\x80\x99home")));
  EXPECT_EQ("[hispano-americano]", words(tokenize("hispano-americano")));
  EXPECT_EQ("[abc][-]", words(tokenize("abc-")));
  EXPECT_EQ("[abc][-][ ][de]", words(tokenize("abc- de")));
  EXPECT_EQ("[-][abc]", words(tokenize("-abc")));
  EXPECT_EQ("[abc][-][-][de]", words(tokenize("abc--de")));
}

TEST(TokenizerTest, ExtraMiddleCharacters)
{
  EXPECT_EQ("[col][·][lecció]", words(tokenize("col·lecció")));
  Vector<Token> t = tokenize("col·lecció", "·");
  ASSERT_EQ(1u, t.size());
  EXPECT_EQ("col·lecció", t[0].word);
  EXPECT_EQ(WordToken, t[0].type);
}

TEST(TokenizerTest, Numbers)
{
  Vector<Token> t = tokenize("123 n2o casa");
  ASSERT_EQ(5u, t.size());
  EXPECT_EQ(NumberToken, t[0].type);
  EXPECT_EQ("n2o", t[2].word);
  EXPECT_EQ(NumberToken, t[2].type);
  EXPECT_EQ(WordToken, t[4].type);
}

TEST(TokenizerTest, Empty)
{
  EXPECT_TRUE(tokenize("").empty());
}
