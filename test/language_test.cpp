// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <gtest/gtest.h>

#include "errors.hpp"
#include "language.hpp"

using namespace corrector;

namespace {

  Vector<String> singulars(const char * word)
  {
    Vector<String> res;
    spanish_depluralize(word, res);
    return res;
  }

  const LanguagePolicy & policy(const char * name)
  {
    PosibErr<const LanguagePolicy *> pe = new_language_policy(name);
    EXPECT_FALSE(pe.has_err());
    return *pe.data;
  }

}

TEST(SpanishPluralTest, RulesInOrder)
{
  Vector<String> c = singulars("canciones");
  ASSERT_EQ(3u, c.size());
  EXPECT_EQ("canción", c[0]);
  EXPECT_EQ("cancion", c[1]);
  EXPECT_EQ("cancione", c[2]);

  c = singulars("luces");
  ASSERT_EQ(3u, c.size());
  EXPECT_EQ("luz", c[0]);
  EXPECT_EQ("luc", c[1]);
  EXPECT_EQ("luce", c[2]);

  c = singulars("alemanes");
  ASSERT_FALSE(c.empty());
  EXPECT_EQ("alemán", c[0]);

  c = singulars("jabalíes");
  ASSERT_EQ(2u, c.size());
  EXPECT_EQ("jabalí", c[0]);
  EXPECT_EQ("jabalíe", c[1]);
}

TEST(SpanishPluralTest, PlainEndings)
{
  Vector<String> c = singulars("casas");
  ASSERT_EQ(1u, c.size());
  EXPECT_EQ("casa", c[0]);

  c = singulars("reyes");
  ASSERT_EQ(2u, c.size());
  EXPECT_EQ("rey", c[0]);
  EXPECT_EQ("reye", c[1]);

  c = singulars("Árboles");
  ASSERT_FALSE(c.empty());
  EXPECT_EQ("árbol", c[0]);
}

TEST(SpanishPluralTest, IonesIsNotOnes)
{
  Vector<String> c = singulars("naciones");
  ASSERT_FALSE(c.empty());
  EXPECT_EQ("nación", c[0]);
  EXPECT_FALSE(c.have("naciión"));

  c = singulars("leones");
  ASSERT_FALSE(c.empty());
  EXPECT_EQ("león", c[0]);
}

TEST(SpanishPluralTest, NoPluralMarker)
{
  EXPECT_TRUE(singulars("casa").empty());
  EXPECT_TRUE(singulars("").empty());
}

TEST(LanguageRegistryTest, Aliases)
{
  const char * spanish[] = {"es", "spanish", "espanol", "español", "ES", "Español"};
  for (unsigned int i = 0; i != 6; ++i) {
    PosibErr<const LanguagePolicy *> pe = new_language_policy(spanish[i]);
    ASSERT_FALSE(pe.has_err()) << spanish[i];
    EXPECT_STREQ("es", pe.data->code);
  }
  const char * catalan[] = {"ca", "catalan", "catala", "català"};
  for (unsigned int i = 0; i != 4; ++i) {
    PosibErr<const LanguagePolicy *> pe = new_language_policy(catalan[i]);
    ASSERT_FALSE(pe.has_err()) << catalan[i];
    EXPECT_STREQ("ca", pe.data->code);
  }
}

TEST(LanguageRegistryTest, UnknownLanguage)
{
  PosibErr<const LanguagePolicy *> pe = new_language_policy("fr");
  ASSERT_TRUE(pe.has_err(unknown_language));
  EXPECT_STREQ("The language \"fr\" is not known.", pe.get_err()->mesg);
}

TEST(LanguagePolicyTest, Spanish)
{
  const LanguagePolicy & es = policy("es");
  EXPECT_TRUE(es.depluralizer != 0);
  EXPECT_TRUE(es.verb_forms);
  EXPECT_TRUE(es.is_abbreviation("n.º"));
  EXPECT_TRUE(es.is_abbreviation("N.ª"));
  EXPECT_FALSE(es.is_abbreviation("n."));
  EXPECT_TRUE(es.is_mid_char('\''));
  EXPECT_TRUE(es.is_mid_char(0x2019));
  EXPECT_TRUE(es.is_mid_char('-'));
  EXPECT_FALSE(es.is_mid_char('.'));
  EXPECT_FALSE(es.is_mid_char(0xB7));

  unsigned int n = 0;
  for (const char * const * p = es.verb_prefixes; *p; ++p) ++n;
  EXPECT_EQ(23u, n);
  EXPECT_STREQ("contra", es.verb_prefixes[0]);
  n = 0;
  for (const char * const * p = es.clitics; *p; ++p) ++n;
  EXPECT_EQ(11u, n);
}

TEST(LanguagePolicyTest, Catalan)
{
  const LanguagePolicy & ca = policy("ca");
  EXPECT_TRUE(ca.depluralizer == 0);
  EXPECT_FALSE(ca.verb_forms);
  EXPECT_FALSE(ca.is_abbreviation("n.º"));
  EXPECT_TRUE(ca.is_mid_char(0xB7));
}

TEST(CheckIfValidTest, Accepts)
{
  const LanguagePolicy & es = policy("es");
  EXPECT_FALSE(check_if_valid(es, "casa").has_err());
  EXPECT_FALSE(check_if_valid(es, "Ñandú").has_err());
  EXPECT_FALSE(check_if_valid(es, "hispano-americano").has_err());
  EXPECT_FALSE(check_if_valid(es, "n.º").has_err());

  const LanguagePolicy & ca = policy("ca");
  EXPECT_FALSE(check_if_valid(ca, "col·lecció").has_err());
  EXPECT_FALSE(check_if_valid(ca, "l'home").has_err());
}

TEST(CheckIfValidTest, Rejects)
{
  const LanguagePolicy & es = policy("es");
  EXPECT_TRUE(check_if_valid(es, "").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "ca sa").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "casa1").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "-casa").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "casa'").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "a.b").has_err(invalid_word));
  EXPECT_TRUE(check_if_valid(es, "col·lecció").has_err(invalid_word));
}
