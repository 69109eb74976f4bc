// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "editdist.hpp"

// Both distances are implemented using the straight forward dynamic
// programming algorithm.  The classic distance only keeps two rows,
// the transposition aware one needs the row before those as well.

namespace corrector {

  static inline int min3(int x, int y, int z)
  {
    int m = x < y ? x : y;
    return m < z ? m : z;
  }

  int edit_distance(const Uni32 * a, int a_size,
                    const Uni32 * b, int b_size)
  {
    if (a_size == 0) return b_size;
    if (b_size == 0) return a_size;

    Vector<int> prev(b_size + 1), cur(b_size + 1);
    for (int j = 0; j <= b_size; ++j)
      prev[j] = j;

    for (int i = 1; i <= a_size; ++i) {
      cur[0] = i;
      for (int j = 1; j <= b_size; ++j) {
        int cost = a[i-1] == b[j-1] ? 0 : 1;
        cur[j] = min3(prev[j] + 1,         // deletion
                      cur[j-1] + 1,        // insertion
                      prev[j-1] + cost);   // substitution
      }
      prev.swap(cur);
    }
    return prev[b_size];
  }

  int edit_distance(ParmString a0, ParmString b0)
  {
    Vector<Uni32> a, b;
    decode(a0, a);
    decode(b0, b);
    return edit_distance(a.empty() ? 0 : &a[0], a.size(),
                         b.empty() ? 0 : &b[0], b.size());
  }

  int transposition_distance(const Uni32 * a, int a_size,
                             const Uni32 * b, int b_size)
  {
    if (a_size == 0) return b_size;
    if (b_size == 0) return a_size;

    int width = b_size + 1;
    Vector<int> e((a_size + 1) * width);
#define E(i,j) e[(i)*width + (j)]

    for (int i = 0; i <= a_size; ++i) E(i,0) = i;
    for (int j = 0; j <= b_size; ++j) E(0,j) = j;

    for (int i = 1; i <= a_size; ++i) {
      for (int j = 1; j <= b_size; ++j) {
        int cost = a[i-1] == b[j-1] ? 0 : 1;
        E(i,j) = min3(E(i-1,j) + 1, E(i,j-1) + 1, E(i-1,j-1) + cost);
        // swap
        if (i > 1 && j > 1 && a[i-1] == b[j-2] && a[i-2] == b[j-1]) {
          int te = E(i-2,j-2) + 1;
          if (te < E(i,j)) E(i,j) = te;
        }
      }
    }
    int res = E(a_size, b_size);
#undef E
    return res;
  }

  int transposition_distance(ParmString a0, ParmString b0)
  {
    Vector<Uni32> a, b;
    decode(a0, a);
    decode(b0, b);
    return transposition_distance(a.empty() ? 0 : &a[0], a.size(),
                                  b.empty() ? 0 : &b[0], b.size());
  }

  int edit_distance_next_row(const Vector<int> & prev, Uni32 c,
                             const Vector<Uni32> & word,
                             Vector<int> & row)
  {
    unsigned int size = word.size();
    row.resize(size + 1);
    row[0] = prev[0] + 1;
    int least = row[0];
    for (unsigned int j = 1; j <= size; ++j) {
      int cost = word[j-1] == c ? 0 : 1;
      row[j] = min3(row[j-1] + 1, prev[j] + 1, prev[j-1] + cost);
      if (row[j] < least) least = row[j];
    }
    return least;
  }

}
