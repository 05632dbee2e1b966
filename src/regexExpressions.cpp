/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
///\file "regexExpressions.cpp"
///\brief Some functions to handle regex expressions
#include "regexExpressions.hpp"
#include "tokmatch/errors.hpp"
#include "internationalization.hpp"
#include <boost/regex/icu.hpp>
#include <stdexcept>
#include <cstring>

using namespace tokmatch;

static bool isLiteral( char ch)
{
	static const char* regexchr = ".|*?+(){}[]^$\\";
	return 0==std::strchr( regexchr, ch);
}

std::string tokmatch::escapeRegexLiteral( const std::string& value)
{
	std::string rt;
	rt.reserve( value.size() * 2);
	char const* si = value.c_str();
	const char* se = si + value.size();
	for (; si < se; ++si)
	{
		if (!isLiteral( *si))
		{
			rt.push_back( '\\');
		}
		rt.push_back( *si);
	}
	return rt;
}

std::string tokmatch::stripRegexAnchors( const std::string& expr, bool& hadAnchors)
{
	std::string rt;
	hadAnchors = false;
	char const* si = expr.c_str();
	const char* se = si + expr.size();
	char prev = 0;
	for (; si < se; prev = *si++)
	{
		if (*si == '^' && prev != '[' && prev != '\\')
		{
			hadAnchors = true;
		}
		else if (*si == '$' && prev != '\\')
		{
			hadAnchors = true;
		}
		else
		{
			rt.push_back( *si);
		}
	}
	return rt;
}

static void skipCharacterClass( char const*& si, const char* se)
{
	// ... si points to the first character after '['
	if (si < se && *si == '^') ++si;
	if (si < se && *si == ']') ++si;
	for (; si < se && *si != ']'; ++si)
	{
		if (*si == '\\')
		{
			++si;
		}
		else if (*si == '[' && si+1 < se && si[1] == ':')
		{
			const char* ce = std::strstr( si+2, ":]");
			if (ce && ce < se) si = ce + 1;
		}
	}
}

unsigned int tokmatch::countCaptureGroups( const std::string& expr)
{
	unsigned int rt = 0;
	char const* si = expr.c_str();
	const char* se = si + expr.size();
	for (; si < se; ++si)
	{
		if (*si == '\\')
		{
			++si;
		}
		else if (*si == '[')
		{
			++si;
			skipCharacterClass( si, se);
		}
		else if (*si == '(')
		{
			if (si+1 < se && si[1] == '?')
			{
				// named groups capture, (?<= and (?<! are look behind assertions
				if (si+2 < se && si[2] == 'P' && si+3 < se && si[3] == '<')
				{
					++rt;
				}
				else if (si+2 < se && si[2] == '<' && si+3 < se && si[3] != '=' && si[3] != '!')
				{
					++rt;
				}
				else if (si+2 < se && si[2] == '\'')
				{
					++rt;
				}
			}
			else
			{
				++rt;
			}
		}
	}
	return rt;
}

void tokmatch::checkRegularExpression( const std::string& expr)
{
	try
	{
		boost::u32regex re = boost::make_u32regex( expr, boost::regex_constants::perl);
	}
	catch (const boost::regex_error& err)
	{
		throw InvalidPatternError( _TXT("invalid regular expression '%s': %s"), expr.c_str(), err.what());
	}
	catch (const std::out_of_range& err)
	{
		throw InvalidPatternError( _TXT("regular expression '%s' is not valid UTF-8: %s"), expr.c_str(), err.what());
	}
}

