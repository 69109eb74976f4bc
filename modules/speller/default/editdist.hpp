// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_edit_distance_hh__
#define __corrector_edit_distance_hh__

#include "parm_string.hpp"
#include "unicode.hpp"
#include "vector.hpp"

namespace corrector {

  using namespace ccommon;

  // The number of insertions, deletions and substitutions needed to
  // turn a into b.  Both strings are compared code point by code
  // point.
  int edit_distance(const Uni32 * a, int a_size,
                    const Uni32 * b, int b_size);
  int edit_distance(ParmString a, ParmString b);

  // Like edit_distance but a swap of two adjacent characters also
  // counts as a single edit (optimal string alignment, every
  // substring is edited at most once).
  int transposition_distance(const Uni32 * a, int a_size,
                             const Uni32 * b, int b_size);
  int transposition_distance(ParmString a, ParmString b);

  // Computes the next row of the edit distance table when the
  // character c is appended to the target.  prev is the row for the
  // target so far, word the fixed string the rows are computed
  // against.  Returns the smallest value of the new row.
  int edit_distance_next_row(const Vector<int> & prev, Uni32 c,
                             const Vector<Uni32> & word,
                             Vector<int> & row);

}

#endif
