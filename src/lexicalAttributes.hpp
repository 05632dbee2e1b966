/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Lexical attributes computed from the text of a token
/// \file "lexicalAttributes.hpp"
#ifndef _TOKMATCH_LEXICAL_ATTRIBUTES_HPP_INCLUDED
#define _TOKMATCH_LEXICAL_ATTRIBUTES_HPP_INCLUDED
#include <string>

namespace tokmatch {
namespace lex {

/// \brief Orthographic shape: letters mapped to 'X' or 'x', digits to 'd', runs of the same class truncated after 4 characters
std::string shape( const std::string& text);
/// \brief First character
std::string prefix( const std::string& text);
/// \brief Last three characters
std::string suffix( const std::string& text);

bool isAlpha( const std::string& text);
bool isAscii( const std::string& text);
bool isDigit( const std::string& text);
bool isLower( const std::string& text);
bool isUpper( const std::string& text);
bool isTitle( const std::string& text);
bool isPunct( const std::string& text);
bool isSpace( const std::string& text);
bool isBracket( const std::string& text);
bool isQuote( const std::string& text);
bool isLeftPunct( const std::string& text);
bool isRightPunct( const std::string& text);
bool isCurrency( const std::string& text);
/// \brief Evaluate if the text is an english stop word (case insensitive)
bool isStop( const std::string& text);
bool likeNum( const std::string& text);
bool likeUrl( const std::string& text);
bool likeEmail( const std::string& text);

}}//namespace
#endif

