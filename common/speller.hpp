// This file is part of Corrector
// Copyright (C) 2001 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_SPELLER__HPP
#define CORRECTOR_SPELLER__HPP

#include "config.hpp"
#include "parm_string.hpp"
#include "posib_err.hpp"
#include "stack_ptr.hpp"
#include "string.hpp"
#include "vector.hpp"

namespace ccommon {

  class Speller
  {
  private:
    Speller(const Speller &);
    Speller & operator= (const Speller &);
  protected:
    StackPtr<Config> config_;
    Speller() {}
  public:
    Config * config() {return config_;}
    const Config * config() const {return config_;}

    // the setup class will take over for config
    virtual PosibErr<void> setup(Config *) = 0;

    virtual bool check(ParmString word) const = 0;

    // the best replacements for word, best first
    virtual void suggest(ParmString word, Vector<String> & out) const = 0;

    // returns false if word is not a known verb form
    virtual bool infinitive(ParmString word, String & inf) const = 0;

    // adds word to the personal word list, on disk and in memory
    virtual PosibErr<void> add_to_personal(ParmString word) = 0;

    // Copies text into out, every misspelled word is followed by
    // " <sep>suggestions<sep>".
    virtual void correct(ParmString text, String & out) const = 0;

    // the misspelled words of text, in order of appearance
    virtual void misspelled(ParmString text, Vector<String> & out) const = 0;

    virtual ~Speller() {}
  };

  PosibErr<Speller *> new_speller(Config * c);

}

#endif
