// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef __corrector_verb_tables__
#define __corrector_verb_tables__

#include <map>

#include "parm_string.hpp"
#include "string.hpp"

namespace corrector {

  using namespace ccommon;

  enum VerbClass {ArClass, ErClass, IrClass};

  // "ar", "er" or "ir"
  const char * infinitive_suffix(VerbClass);

  enum StemChange {NoStemChange, EToIe, OToUe, EToI, UToUe, CToZc};

  // The original and the changed part of the stem, for example "e"
  // and "ie".
  const char * stem_change_from(StemChange);
  const char * stem_change_to(StemChange);

  //
  // ending lists, all null terminated
  //

  // present, preterite, imperfect, present subjunctive, both
  // imperfect subjunctives, future subjunctive, gerund, participle
  // and the vosotros imperative
  const char * const * regular_endings(VerbClass);

  // added to the whole infinitive or to an irregular future stem
  extern const char * const future_endings[];
  extern const char * const conditional_endings[];

  // the endings that carry a vowel change in the stem
  const char * const * stem_change_endings(VerbClass);

  // the endings that carry the c to zc change
  extern const char * const zc_endings[];

  // Tables that do not depend on the dictionary: the irregular forms
  // and the verbs with a changing stem.
  class VerbTables {
  public:
    VerbTables();

    // the infinitive of an irregular form, null if the form is not
    // in the table
    const char * irregular(ParmString form) const;

    StemChange stem_change(ParmString infinitive) const;

    unsigned int irregular_count() const {return irregular_.size();}
    unsigned int stem_change_count() const {return stem_changes_.size();}

  private:
    typedef std::map<String, String> Irregular;
    typedef std::map<String, StemChange> StemChanges;
    Irregular irregular_;
    StemChanges stem_changes_;

    void add_forms(const char * infinitive, const char * forms);
  };

  // the shared instance, built on first use
  const VerbTables & verb_tables();

}

#endif
