// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_enclitics__
#define __corrector_enclitics__

#include "parm_string.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace corrector {

  using namespace ccommon;

  // The verb bases left after removing one to three of the given
  // pronouns from the end of word.  Bases from removing more
  // pronouns come first.  Every intermediate base has at least two
  // characters, every returned base has the shape of a verb form and
  // the accent the pronouns forced on it removed.
  void enclitic_bases(ParmString word, const char * const * clitics,
                      Vector<String> & bases);

  bool has_infinitive_shape(ParmString base);
  bool has_gerund_shape(ParmString base);
  bool could_be_imperative(ParmString base);

  // the infinitive of di, haz, pon, sal, ten, ven, ve, da and sé,
  // null for anything else
  const char * monosyllabic_imperative(ParmString base);

  // "amos", "emos" or "imos" with or without an accent
  bool has_exhortative_shape(ParmString base);

}

#endif
