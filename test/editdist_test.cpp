// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include <gtest/gtest.h>

#include "editdist.hpp"

using namespace corrector;

TEST(EditDistanceTest, Classic)
{
  EXPECT_EQ(0, edit_distance("casa", "casa"));
  EXPECT_EQ(3, edit_distance("kitten", "sitting"));
  EXPECT_EQ(1, edit_distance("casa", "cas"));
  EXPECT_EQ(1, edit_distance("casa", "cosa"));
  EXPECT_EQ(2, edit_distance("ab", "ba"));
}

TEST(EditDistanceTest, EmptyStrings)
{
  EXPECT_EQ(0, edit_distance("", ""));
  EXPECT_EQ(3, edit_distance("", "abc"));
  EXPECT_EQ(3, edit_distance("abc", ""));
  EXPECT_EQ(4, transposition_distance("", "casa"));
}

TEST(EditDistanceTest, CountsCodePointsNotBytes)
{
  EXPECT_EQ(1, edit_distance("canción", "cancion"));
  EXPECT_EQ(1, edit_distance("año", "ano"));
  EXPECT_EQ(1, transposition_distance("pingüino", "pinguino"));
}

TEST(EditDistanceTest, Transposition)
{
  EXPECT_EQ(1, transposition_distance("ab", "ba"));
  EXPECT_EQ(1, transposition_distance("caas", "casa"));
  EXPECT_EQ(3, transposition_distance("kitten", "sitting"));
  // a swapped pair can not be edited again
  EXPECT_EQ(3, transposition_distance("ca", "abc"));
}

TEST(EditDistanceTest, NeverMoreThanClassic)
{
  const char * words[] = {"casa", "caas", "saca", "acsa", "cosa", "", "a"};
  for (unsigned i = 0; i != 7; ++i)
    for (unsigned j = 0; j != 7; ++j)
      EXPECT_LE(transposition_distance(words[i], words[j]),
                edit_distance(words[i], words[j]));
}

TEST(EditDistanceTest, NextRow)
{
  Vector<Uni32> word;
  decode("casa", word);
  Vector<int> row0(word.size() + 1);
  for (unsigned j = 0; j <= word.size(); ++j) row0[j] = j;

  Vector<int> row1;
  EXPECT_EQ(0, edit_distance_next_row(row0, 'c', word, row1));
  ASSERT_EQ(5u, row1.size());
  EXPECT_EQ(1, row1[0]);
  EXPECT_EQ(0, row1[1]);
  EXPECT_EQ(3, row1[4]);

  Vector<int> row2;
  EXPECT_EQ(1, edit_distance_next_row(row1, 'x', word, row2));
  EXPECT_EQ(2, row2[0]);
  EXPECT_EQ(1, row2[1]);
}
