// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <stdlib.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "file_util.hpp"
#include "fstream.hpp"
#include "speller.hpp"
#include "stack_ptr.hpp"

using namespace ccommon;

namespace {

  const char * sample_words =
    "# word|category|gender|number|extra|frequency\n"
    "casa|sustantivo|f|s||100\n"
    "caso|sustantivo|m|s||80\n"
    "cosa|sustantivo|f|s||50\n"
    "cara|sustantivo|f|s||30\n"
    "cama|sustantivo|f|s||10\n"
    "capa|sustantivo|f|s||10\n"
    "hola|||||60\n"
    "mundo|sustantivo|m|s||70\n"
    "hispano|adjetivo|m|s||5\n"
    "americano|adjetivo|m|s||5\n"
    "el|articulo|m|s||500\n"
    "hablar|verbo||||30\n"
    "coger|verbo||||10\n";

  class SpellerTest : public ::testing::Test {
  protected:
    void SetUp() {
      char tmpl[] = "/tmp/corrector-test-XXXXXX";
      ASSERT_TRUE(mkdtemp(tmpl) != 0);
      data_dir = tmpl;
      lang_dir = data_dir + "/es";
      ASSERT_FALSE(make_dirs(lang_dir).has_err());
    }

    void TearDown() {
      const char * files[] = {"words.txt", "custom.txt", "extra.txt", 0};
      for (const char * const * f = files; *f; ++f)
        unlink((lang_dir + "/" + *f).c_str());
      rmdir(lang_dir.c_str());
      rmdir(data_dir.c_str());
    }

    void write_file(const char * name, const char * text) {
      FStream out;
      ASSERT_FALSE(out.open(lang_dir + "/" + name, "w").has_err());
      out << text;
    }

    String read_file(const char * name) {
      FStream in;
      String text;
      if (in.open(lang_dir + "/" + name, "r").has_err(cant_read_file))
        return "<missing>";
      in.read_all(text);
      return text;
    }

    Config * make_config() {
      Config * c = new_config();
      EXPECT_FALSE(c->replace("data-dir", data_dir).has_err());
      return c;
    }

    Speller * make_speller(Config * c) {
      PosibErr<Speller *> pe = new_speller(c);
      if (pe.has_err()) {
        ADD_FAILURE() << pe.get_err()->mesg;
        return 0;
      }
      return pe.data;
    }

    Speller * make_speller() {return make_speller(make_config());}

    String correct(Speller * sp, const char * text) {
      String out;
      sp->correct(text, out);
      return out;
    }

    String data_dir;
    String lang_dir;
  };

}

TEST_F(SpellerTest, Correct)
{
  write_file("words.txt", sample_words);
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);

  EXPECT_EQ("Hola mundo cassa |casa,caso,cosa,cara,cama|",
            correct(sp, "Hola mundo cassa"));
  EXPECT_EQ("Hola, mundo.", correct(sp, "Hola, mundo."));
  EXPECT_EQ("zzzzzzzz |?| casa", correct(sp, "zzzzzzzz casa"));
  EXPECT_EQ("", correct(sp, ""));
}

TEST_F(SpellerTest, CorrectLeavesOtherTokensAlone)
{
  write_file("words.txt", sample_words);
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);

  // numbers, plurals and conjugations
  EXPECT_EQ("el 2024, casas hablamos!\n",
            correct(sp, "el 2024, casas hablamos!\n"));
  EXPECT_EQ("hispano-americano", correct(sp, "hispano-americano"));
  EXPECT_EQ("casa-cosa", correct(sp, "casa-cosa"));
}

TEST_F(SpellerTest, Separator)
{
  write_file("words.txt", sample_words);
  Config * c = make_config();
  ASSERT_FALSE(c->replace("separator", "#").has_err());
  StackPtr<Speller> sp(make_speller(c));
  ASSERT_TRUE(sp != 0);
  EXPECT_EQ("cassa #casa,caso,cosa,cara,cama#", correct(sp, "cassa"));
}

TEST_F(SpellerTest, JToG)
{
  write_file("words.txt", sample_words);
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);

  Vector<String> sugs;
  sp->suggest("cojer", sugs);
  ASSERT_FALSE(sugs.empty());
  EXPECT_EQ("coger", sugs[0]);
  EXPECT_FALSE(sp->check("cojer"));
}

TEST_F(SpellerTest, Misspelled)
{
  write_file("words.txt", sample_words);
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);

  Vector<String> words;
  sp->misspelled("Hola cassa, mundo zzzzzzzz casa", words);
  ASSERT_EQ(2u, words.size());
  EXPECT_EQ("cassa", words[0]);
  EXPECT_EQ("zzzzzzzz", words[1]);
}

TEST_F(SpellerTest, Infinitive)
{
  write_file("words.txt", sample_words);
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);

  String inf;
  ASSERT_TRUE(sp->infinitive("hablamos", inf));
  EXPECT_EQ("hablar", inf);
  EXPECT_FALSE(sp->infinitive("casa", inf));
}

TEST_F(SpellerTest, AddToPersonal)
{
  write_file("words.txt", sample_words);
  {
    StackPtr<Speller> sp(make_speller());
    ASSERT_TRUE(sp != 0);
    EXPECT_FALSE(sp->check("ordenador"));
    ASSERT_FALSE(sp->add_to_personal("ordenador").has_err());
    EXPECT_TRUE(sp->check("ordenador"));
    EXPECT_TRUE(sp->add_to_personal("orde nador").has_err(invalid_word));
    EXPECT_TRUE(sp->add_to_personal("casa1").has_err(invalid_word));
  }
  EXPECT_EQ("ordenador\n", read_file("custom.txt"));

  // read back by the next speller
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);
  EXPECT_TRUE(sp->check("ordenador"));
}

TEST_F(SpellerTest, CustomDictionary)
{
  write_file("words.txt", sample_words);
  write_file("extra.txt", "ordenador|sustantivo|m|s||40\n");
  Config * c = make_config();
  ASSERT_FALSE(c->replace("custom-dict", lang_dir + "/extra.txt").has_err());
  StackPtr<Speller> sp(make_speller(c));
  ASSERT_TRUE(sp != 0);
  EXPECT_TRUE(sp->check("ordenador"));
  EXPECT_TRUE(sp->check("ordenadores"));
}

TEST_F(SpellerTest, MissingCustomDictionary)
{
  write_file("words.txt", sample_words);
  Config * c = make_config();
  ASSERT_FALSE(c->replace("custom-dict", lang_dir + "/nothing.txt").has_err());
  PosibErr<Speller *> pe = new_speller(c);
  EXPECT_TRUE(pe.has_err(cant_read_file));
}

TEST_F(SpellerTest, MissingWordList)
{
  StackPtr<Speller> sp(make_speller());
  ASSERT_TRUE(sp != 0);
  EXPECT_FALSE(sp->check("casa"));
  EXPECT_EQ("casa |?|", correct(sp, "casa"));
}

TEST_F(SpellerTest, UnknownLanguage)
{
  Config * c = make_config();
  ASSERT_FALSE(c->replace("lang", "fr").has_err());
  PosibErr<Speller *> pe = new_speller(c);
  EXPECT_TRUE(pe.has_err(unknown_language));
}
