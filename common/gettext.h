// This file is part of Corrector
// Copyright (C) 2026 by the Corrector authors under the GNU LGPL license
// version 2.0 or 2.1.  You should have received a copy of the LGPL
// license along with this library if you did not you can find
// it at http://www.gnu.org/.

#ifndef CORRECTOR_GETTEXT__H
#define CORRECTOR_GETTEXT__H

#include "settings.h"

#if ENABLE_NLS

# include <libintl.h>

# define _(String) dgettext ("corrector", String)

#else

# define _(String) ((const char *) (String))

# define gettext(Msgid) ((const char *) (Msgid))
# define dgettext(Domainname, Msgid) ((const char *) (Msgid))
# define bindtextdomain(Domainname, Dirname) ((const char *) (Dirname))

#endif

#define N_(String) (String)

extern "C" void corrector_gettext_init();

#endif
