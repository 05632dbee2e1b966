/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "utils.hpp"
#include <boost/algorithm/string.hpp>
#include <cstdio>

using namespace tokmatch;

std::string utils::tolower( const std::string& val)
{
	return boost::algorithm::to_lower_copy( val);
}

std::string utils::toupper( const std::string& val)
{
	return boost::algorithm::to_upper_copy( val);
}

bool utils::caseInsensitiveEquals( const std::string& val1, const std::string& val2)
{
	return boost::algorithm::iequals( val1, val2);
}

std::string utils::tostring( long long val)
{
	char buf[ 64];
	std::snprintf( buf, sizeof(buf), "%lld", val);
	return std::string( buf);
}

