/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Version of the tokmatch library
/// \file versionTokmatch.hpp
#ifndef _TOKMATCH_VERSION_HPP_INCLUDED
#define _TOKMATCH_VERSION_HPP_INCLUDED

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Version number of tokmatch
#define TOKMATCH_VERSION (\
	0 * 1000000\
	+ 4 * 10000\
	+ 1\
)

/// \brief Major version number of tokmatch
#define TOKMATCH_VERSION_MAJOR 0
/// \brief Minor version number of tokmatch
#define TOKMATCH_VERSION_MINOR 4

/// \brief The version of the tokmatch library
#define TOKMATCH_VERSION_STRING "0.4.1"

}//namespace
#endif

