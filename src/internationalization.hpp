/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Message text translation with gettext
/// \file internationalization.hpp
#ifndef _TOKMATCH_INTERNATIONALIZATION_HPP_INCLUDED
#define _TOKMATCH_INTERNATIONALIZATION_HPP_INCLUDED
#include <libintl.h>

#ifndef TOKMATCH_GETTEXT_PACKAGE
#define TOKMATCH_GETTEXT_PACKAGE "tokmatch-dom"
#endif
#ifndef TOKMATCH_GETTEXT_LOCALEDIR
#define TOKMATCH_GETTEXT_LOCALEDIR "/usr/share/locale"
#endif

#define _TXT(STRING) dgettext( TOKMATCH_GETTEXT_PACKAGE, STRING)

namespace tokmatch
{

/// \brief Declare the message domain used by this package for the exception messages
void initMessageTextDomain();

}//namespace
#endif

