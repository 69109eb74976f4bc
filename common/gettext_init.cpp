// This file is part of Corrector
// Copyright (C) 2002 by Kevin Atkinson under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#include "settings.h"

#include "gettext.h"

#if ENABLE_NLS

static bool did_init = false;

extern "C" void corrector_gettext_init()
{
  if (did_init) return;
  did_init = true;
  bindtextdomain("corrector", LOCALEDIR);
}

#else

extern "C" void corrector_gettext_init() {}

#endif
