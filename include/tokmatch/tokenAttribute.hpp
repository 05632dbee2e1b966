/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Closed set of token attributes addressable in patterns
/// \file tokenAttribute.hpp
#ifndef _TOKMATCH_TOKEN_ATTRIBUTE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_ATTRIBUTE_HPP_INCLUDED
#include <string>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Built-in token attributes
/// \note Attribute values are always delivered as strings, flags as "True" or "False"
enum TokenAttribute
{
	AttrText,		///< verbatim token text (ORTH, TEXT)
	AttrLower,		///< lower case token text
	AttrLemma,		///< base form (requires annotation)
	AttrNorm,		///< normalized form
	AttrPos,		///< coarse grained part of speech (requires annotation)
	AttrTag,		///< fine grained part of speech (requires annotation)
	AttrDep,		///< syntactic dependency label (requires annotation)
	AttrMorph,		///< morphological features (requires annotation)
	AttrShape,		///< orthographic shape, e.g. "Xxxx" or "dd"
	AttrPrefix,		///< first character of the text
	AttrSuffix,		///< last three characters of the text
	AttrLength,		///< length of the text in characters
	AttrEntType,		///< named entity type
	AttrEntIob,		///< IOB code of the named entity tag
	AttrEntId,		///< named entity identifier
	AttrEntKbId,		///< knowledge base identifier of the named entity
	AttrLang,		///< language of the token
	AttrIsAlpha,
	AttrIsAscii,
	AttrIsDigit,
	AttrIsLower,
	AttrIsUpper,
	AttrIsTitle,
	AttrIsPunct,
	AttrIsSpace,
	AttrIsBracket,
	AttrIsQuote,
	AttrIsLeftPunct,
	AttrIsRightPunct,
	AttrIsCurrency,
	AttrIsStop,
	AttrIsSentStart,
	AttrLikeNum,
	AttrLikeUrl,
	AttrLikeEmail,
	AttrRegex,		///< pseudo attribute: token text with its original trailing whitespace
	AttrExtension		///< value of an extension attribute addressed by name
};
enum {NofTokenAttributes=AttrExtension+1};

/// \brief Get the canonical (upper case) name of an attribute
const char* tokenAttributeName( TokenAttribute attr);

/// \brief Get the attribute from its name, case insensitive, ORTH aliased to TEXT and SENT_START to IS_SENT_START
/// \param[in] name name of the attribute
/// \param[out] attr the attribute found
/// \return true if the name is a known built-in attribute, false else
/// \note The extension namespace "_" is not resolved here
bool tokenAttributeFromName( const std::string& name, TokenAttribute& attr);

/// \brief Evaluate if the attribute has to be computed by an upstream tagger or parser
bool tokenAttributeRequiresAnnotation( TokenAttribute attr);

}//namespace
#endif

