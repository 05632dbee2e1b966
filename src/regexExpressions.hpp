/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
///\file "regexExpressions.hpp"
///\brief Some functions to handle regex expressions
#ifndef _TOKMATCH_REGEX_EXPRESSIONS_HPP_INCLUDED
#define _TOKMATCH_REGEX_EXPRESSIONS_HPP_INCLUDED
#include <string>

namespace tokmatch
{

/// \brief Escape all characters of a literal that have a meaning in a regular expression
std::string escapeRegexLiteral( const std::string& value);

/// \brief Remove the unescaped start (^) and end ($) anchors from an expression
/// \param[out] hadAnchors true if any anchor has been removed
std::string stripRegexAnchors( const std::string& expr, bool& hadAnchors);

/// \brief Count the capturing groups in an expression
unsigned int countCaptureGroups( const std::string& expr);

/// \brief Check a user defined regular expression, throws InvalidPatternError if it is not valid
void checkRegularExpression( const std::string& expr);

}
#endif

