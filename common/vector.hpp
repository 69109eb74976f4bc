// This file is part of Corrector
// Copyright (C) 2001-2003 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_VECTOR__HPP
#define CORRECTOR_VECTOR__HPP

#include <vector>
#include <algorithm>

namespace ccommon
{
  template <typename T>
  class Vector : public std::vector<T>
  {
  public:

    Vector() {}
    Vector(unsigned int s) : std::vector<T>(s) {}
    Vector(unsigned int s, const T & val) : std::vector<T>(s, val) {}

    void append(const T & t) {
      this->push_back(t);
    }
    void append(const T * begin, unsigned int size) {
      this->insert(this->end(), begin, begin+size);
    }
    bool have(const T & t) const {
      return std::find(this->begin(), this->end(), t) != this->end();
    }
    // appends t unless an equal element is already present
    bool append_unique(const T & t) {
      if (have(t)) return false;
      this->push_back(t);
      return true;
    }

    T * pbegin() {return &*this->begin();}
    T * pend()   {return &*this->end();}

    const T * pbegin() const {return &*this->begin();}
    const T * pend()   const {return &*this->end();}
  };
}

#endif
