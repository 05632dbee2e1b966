/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief UTF-8 decoding and encoding and some character classification needed for lexical token attributes
/// \file "unicodeUtils.hpp"
#ifndef _TOKMATCH_UNICODE_UTILS_HPP_INCLUDED
#define _TOKMATCH_UNICODE_UTILS_HPP_INCLUDED
#include <string>
#include <vector>

namespace tokmatch {

typedef unsigned int CodePoint;

/// \brief Decode an UTF-8 string into a sequence of unicode code points
std::vector<CodePoint> utf8Decode( const std::string& src);
/// \brief Encode a sequence of unicode code points as UTF-8
std::string utf8Encode( const std::vector<CodePoint>& chars);
/// \brief Encode a range of a sequence of unicode code points as UTF-8
std::string utf8Encode( const std::vector<CodePoint>& chars, std::size_t start, std::size_t end);
/// \brief Get the number of characters in an UTF-8 string
std::size_t utf8Length( const std::string& src);
/// \brief Lowercase conversion of an UTF-8 string (Latin, Greek and Cyrillic alphabets)
std::string utf8ToLower( const std::string& src);

CodePoint unicodeToLower( CodePoint ch);
CodePoint unicodeToUpper( CodePoint ch);

bool unicodeIsAlpha( CodePoint ch);
bool unicodeIsDigit( CodePoint ch);
bool unicodeIsSpace( CodePoint ch);
bool unicodeIsUpper( CodePoint ch);
bool unicodeIsLower( CodePoint ch);
bool unicodeIsPunct( CodePoint ch);
bool unicodeIsCurrency( CodePoint ch);

}//namespace
#endif

