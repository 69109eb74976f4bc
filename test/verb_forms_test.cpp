// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <gtest/gtest.h>

#include "language.hpp"
#include "prefix_tree.hpp"
#include "sample_dict.hpp"
#include "stack_ptr.hpp"
#include "verb_forms.hpp"
#include "verb_tables.hpp"

using namespace corrector;

namespace {

  class VerbRecognizerTest : public ::testing::Test {
  protected:
    void SetUp() {
      fill_sample_dict(dict);
      PosibErr<const LanguagePolicy *> pe = new_language_policy("es");
      ASSERT_FALSE(pe.has_err());
      verbs.reset(new VerbRecognizer(dict, *pe.data));
    }

    String infinitive(const char * word) {
      String inf;
      if (!verbs->infinitive(word, inf)) return "<none>";
      return inf;
    }

    PrefixTree dict;
    StackPtr<VerbRecognizer> verbs;
  };

}

TEST(VerbTablesTest, Irregular)
{
  VerbTables t;
  EXPECT_STREQ("ser", t.irregular("fui"));
  EXPECT_STREQ("ser", t.irregular("soy"));
  EXPECT_TRUE(t.irregular("casa") == 0);
  EXPECT_LT(0u, t.irregular_count());
}

TEST(VerbTablesTest, StemChanges)
{
  VerbTables t;
  EXPECT_EQ(EToIe, t.stem_change("pensar"));
  EXPECT_EQ(OToUe, t.stem_change("contar"));
  EXPECT_EQ(EToI, t.stem_change("pedir"));
  EXPECT_EQ(UToUe, t.stem_change("jugar"));
  EXPECT_EQ(NoStemChange, t.stem_change("hablar"));
  EXPECT_STREQ("e", stem_change_from(EToIe));
  EXPECT_STREQ("ie", stem_change_to(EToIe));
}

TEST_F(VerbRecognizerTest, CountsInfinitives)
{
  // arrepentirse also counts as arrepentir
  EXPECT_EQ(21u, verbs->infinitive_count());
  EXPECT_EQ(1u, verbs->pronominal_count());
}

TEST_F(VerbRecognizerTest, Regular)
{
  const char * forms[] = {"hablo", "hablamos", "hablaban", "hablaré",
                          "hablaría", "hablando", "hablado", 0};
  for (const char * const * f = forms; *f; ++f)
    EXPECT_EQ("hablar", infinitive(*f)) << *f;
  EXPECT_EQ("comer", infinitive("comí"));
  EXPECT_EQ("vivir", infinitive("vivimos"));
  EXPECT_TRUE(verbs->is_valid_verb_form("Hablamos"));
}

TEST_F(VerbRecognizerTest, StemChanging)
{
  EXPECT_EQ("pensar", infinitive("pienso"));
  EXPECT_EQ("contar", infinitive("cuentan"));
  EXPECT_EQ("pedir", infinitive("pido"));
  EXPECT_EQ("sentir", infinitive("sintió"));
  EXPECT_EQ("jugar", infinitive("juegan"));
  EXPECT_EQ("conocer", infinitive("conozco"));
}

TEST_F(VerbRecognizerTest, Orthographic)
{
  EXPECT_EQ("empezar", infinitive("empecé"));
  EXPECT_EQ("llegar", infinitive("llegué"));
  EXPECT_EQ("buscar", infinitive("busqué"));
}

TEST_F(VerbRecognizerTest, Irregular)
{
  EXPECT_EQ("hacer", infinitive("hice"));
  EXPECT_EQ("decir", infinitive("dijo"));
  EXPECT_EQ("poder", infinitive("podré"));
  EXPECT_EQ("salir", infinitive("saldré"));
  // known from the tables alone
  EXPECT_EQ("ser", infinitive("soy"));
}

TEST_F(VerbRecognizerTest, Prefixed)
{
  EXPECT_EQ("deshacer", infinitive("deshago"));
}

TEST_F(VerbRecognizerTest, Enclitics)
{
  EXPECT_EQ("comer", infinitive("comiéndolo"));
  EXPECT_EQ("hacer", infinitive("hacerlo"));
  EXPECT_EQ("decir", infinitive("dímelo"));
  EXPECT_EQ("comprar", infinitive("cómpralo"));
  EXPECT_EQ("dar", infinitive("dámelo"));
}

TEST_F(VerbRecognizerTest, Pronominal)
{
  EXPECT_EQ("arrepentirse", infinitive("arrepiento"));
}

TEST_F(VerbRecognizerTest, NotVerbs)
{
  const char * words[] = {"hablx", "casa", "perro", "xyz", "", 0};
  for (const char * const * w = words; *w; ++w) {
    EXPECT_FALSE(verbs->is_valid_verb_form(*w)) << *w;
    EXPECT_EQ("<none>", infinitive(*w)) << *w;
  }
}

namespace {

  struct Conjugation {
    const char * form;
    const char * infinitive;
  };

  // present, preterite, imperfect, future, conditional, subjunctive,
  // imperative, gerund and participle of a few model verbs
  const Conjugation model_conjugations[] = {
    {"canto", "cantar"}, {"cantamos", "cantar"}, {"cantaste", "cantar"},
    {"cantó", "cantar"}, {"cantaba", "cantar"}, {"cantábamos", "cantar"},
    {"cantaré", "cantar"}, {"cantaría", "cantar"}, {"cante", "cantar"},
    {"cantemos", "cantar"}, {"cantara", "cantar"}, {"cantase", "cantar"},
    {"canta", "cantar"}, {"cantad", "cantar"}, {"cantando", "cantar"},
    {"cantado", "cantar"},

    {"pienso", "pensar"}, {"piensas", "pensar"}, {"piensan", "pensar"},
    {"pensamos", "pensar"}, {"pensé", "pensar"}, {"pensaba", "pensar"},
    {"pensaré", "pensar"}, {"pensaría", "pensar"}, {"piense", "pensar"},
    {"piensen", "pensar"}, {"piensa", "pensar"}, {"pensad", "pensar"},
    {"pensando", "pensar"}, {"pensado", "pensar"},

    {"conozco", "conocer"}, {"conoces", "conocer"}, {"conocemos", "conocer"},
    {"conocí", "conocer"}, {"conoció", "conocer"}, {"conocía", "conocer"},
    {"conoceré", "conocer"}, {"conocería", "conocer"}, {"conozca", "conocer"},
    {"conozcamos", "conocer"}, {"conoced", "conocer"},
    {"conociendo", "conocer"}, {"conocido", "conocer"},

    {"juego", "jugar"}, {"juegas", "jugar"}, {"juegan", "jugar"},
    {"jugamos", "jugar"}, {"jugué", "jugar"}, {"jugó", "jugar"},
    {"jugaba", "jugar"}, {"jugaré", "jugar"}, {"jugaría", "jugar"},
    {"juegue", "jugar"}, {"juguemos", "jugar"}, {"juega", "jugar"},
    {"jugad", "jugar"}, {"jugando", "jugar"}, {"jugado", "jugar"},

    {"siento", "sentirse"}, {"sientes", "sentirse"}, {"siente", "sentirse"},
    {"sentimos", "sentirse"}, {"sentí", "sentirse"}, {"sintió", "sentirse"},
    {"sintieron", "sentirse"}, {"sentía", "sentirse"},
    {"sentiré", "sentirse"}, {"sentiría", "sentirse"},
    {"sienta", "sentirse"}, {"sientan", "sentirse"}, {"sentid", "sentirse"},
    {"sintiendo", "sentirse"}, {"sentido", "sentirse"},
    {0, 0}
  };

  class ModelVerbsTest : public ::testing::Test {
  protected:
    void SetUp() {
      const char * verbs[] = {"cantar", "pensar", "conocer", "jugar",
                              "sentirse", "fuir", 0};
      for (const char * const * v = verbs; *v; ++v)
        dict.insert(*v, WordEntry(Verb));
      PosibErr<const LanguagePolicy *> pe = new_language_policy("es");
      ASSERT_FALSE(pe.has_err());
      recognizer.reset(new VerbRecognizer(dict, *pe.data));
    }

    PrefixTree dict;
    StackPtr<VerbRecognizer> recognizer;
  };

}

TEST_F(ModelVerbsTest, EveryFormGivesItsInfinitive)
{
  for (const Conjugation * c = model_conjugations; c->form; ++c) {
    String inf;
    EXPECT_TRUE(recognizer->is_valid_verb_form(c->form)) << c->form;
    ASSERT_TRUE(recognizer->infinitive(c->form, inf)) << c->form;
    EXPECT_EQ(c->infinitive, inf) << c->form;
  }
}

TEST_F(ModelVerbsTest, IrregularTableComesFirst)
{
  // "fu" + "ir" is in the dictionary, but fue and fui are forms of ser
  String inf;
  ASSERT_TRUE(recognizer->infinitive("fue", inf));
  EXPECT_EQ("ser", inf);
  ASSERT_TRUE(recognizer->infinitive("fui", inf));
  EXPECT_EQ("ser", inf);
  ASSERT_TRUE(recognizer->infinitive("fuimos", inf));
  EXPECT_EQ("ser", inf);
  // a regular form of fuir that is not in the table
  ASSERT_TRUE(recognizer->infinitive("fuía", inf));
  EXPECT_EQ("fuir", inf);
}
