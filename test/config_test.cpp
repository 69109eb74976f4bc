// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "stack_ptr.hpp"

using namespace ccommon;

namespace {

  class ConfigTest : public ::testing::Test {
  protected:
    ConfigTest() : config(new_config()) {}

    String value(const char * key) {
      PosibErr<String> pe = config->retrieve(key);
      EXPECT_FALSE(pe.has_err()) << key;
      return pe.data;
    }

    StackPtr<Config> config;
  };

}

TEST_F(ConfigTest, Defaults)
{
  EXPECT_EQ("es", value("lang"));
  EXPECT_EQ("custom.txt", value("personal"));
  EXPECT_EQ("|", value("separator"));
  EXPECT_EQ("", value("custom-dict"));
  EXPECT_EQ(2, config->retrieve_int("max-distance").data);
  EXPECT_EQ(5, config->retrieve_int("max-suggestions").data);
  EXPECT_FALSE(config->retrieve_bool("verbose").data);
  EXPECT_FALSE(config->have("lang"));
}

TEST_F(ConfigTest, Replace)
{
  ASSERT_FALSE(config->replace("lang", "ca").has_err());
  EXPECT_TRUE(config->have("lang"));
  EXPECT_EQ("ca", value("lang"));
  ASSERT_FALSE(config->replace("max-suggestions", "10").has_err());
  EXPECT_EQ(10, config->retrieve_int("max-suggestions").data);
}

TEST_F(ConfigTest, Booleans)
{
  ASSERT_FALSE(config->replace("verbose", "").has_err());
  EXPECT_TRUE(config->retrieve_bool("verbose").data);
  ASSERT_FALSE(config->replace("dont-verbose", "").has_err());
  EXPECT_FALSE(config->retrieve_bool("verbose").data);
  ASSERT_FALSE(config->replace("verbose", "true").has_err());
  EXPECT_TRUE(config->retrieve_bool("verbose").data);

  PosibErr<void> pe = config->replace("verbose", "maybe");
  EXPECT_TRUE(pe.has_err(bad_value));
}

TEST_F(ConfigTest, BadValues)
{
  PosibErr<void> pe = config->replace("max-distance", "-1");
  ASSERT_TRUE(pe.has_err(bad_value));
  EXPECT_STREQ("The value \"-1\" is not a positive integer and is thus "
               "invalid for the key \"max-distance\".",
               pe.get_err()->mesg);
  EXPECT_TRUE(config->replace("max-distance", "two").has_err(bad_value));
  EXPECT_EQ(2, config->retrieve_int("max-distance").data);

  // only booleans can be negated
  EXPECT_TRUE(config->replace("dont-lang", "").has_err(unknown_key));
}

TEST_F(ConfigTest, UnknownKey)
{
  PosibErr<void> pe = config->replace("colour", "red");
  ASSERT_TRUE(pe.has_err(unknown_key));
  EXPECT_STREQ("The key \"colour\" is unknown.", pe.get_err()->mesg);
  EXPECT_TRUE(config->retrieve("colour").has_err(unknown_key));
}

TEST_F(ConfigTest, ResetToDefault)
{
  ASSERT_FALSE(config->replace("separator", "#").has_err());
  EXPECT_EQ("#", value("separator"));
  ASSERT_FALSE(config->replace("separator", "<default>").has_err());
  EXPECT_FALSE(config->have("separator"));
  EXPECT_EQ("|", value("separator"));
}

TEST_F(ConfigTest, ReadInString)
{
  ASSERT_FALSE(config->read_in_string("lang ca; max-distance 1;verbose true")
               .has_err());
  EXPECT_EQ("ca", value("lang"));
  EXPECT_EQ(1, config->retrieve_int("max-distance").data);
  EXPECT_TRUE(config->retrieve_bool("verbose").data);

  EXPECT_TRUE(config->read_in_string("lang es; nothing 1").has_err(unknown_key));
}
