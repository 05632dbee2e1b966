/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "internationalization.hpp"
#include <boost/thread/once.hpp>

static boost::once_flag g_messageTextDomainFlag = BOOST_ONCE_INIT;

static void bindMessageTextDomain()
{
	bindtextdomain( TOKMATCH_GETTEXT_PACKAGE, TOKMATCH_GETTEXT_LOCALEDIR);
}

void tokmatch::initMessageTextDomain()
{
	boost::call_once( g_messageTextDomainFlag, &bindMessageTextDomain);
}

