/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of a token-spec into regular expression fragments per attribute
/// \file "predicateCompiler.hpp"
#ifndef _TOKMATCH_PREDICATE_COMPILER_HPP_INCLUDED
#define _TOKMATCH_PREDICATE_COMPILER_HPP_INCLUDED
#include "patternAttribute.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/// \brief Start of a token in a projection
#define TOKMATCH_TOKEN_START	"(?:\\s|^)"
/// \brief Delimiter after a token in a projection
#define TOKMATCH_TOKEN_DELIM	"(?:\\s|$)"
/// \brief Assertion that a token-spec element starts on a non empty token
#define TOKMATCH_TOKEN_GUARD	"(?=[^\\s])"
/// \brief One token of any value
#define TOKMATCH_ANY_TOKEN	"[^\\s]+"
/// \brief Expression that never matches
#define TOKMATCH_NEVER_MATCH	"(?!)"

namespace tokmatch {

/// \brief Quantifier of a token-spec
enum Quantifier
{
	QuantOne='1',		///< exactly one token
	QuantOneOrMore='+',	///< one or more tokens
	QuantNot='!',		///< exactly one token not matching
	QuantOptional='?',	///< zero or one token
	QuantZeroOrMore='*',	///< zero or more tokens
	QuantRegex='x'		///< free regular expression on the original text (REGEX pseudo attribute)
};

/// \brief Evaluate if a quantifier guarantees at least one token consumed with a span shared by all attributes
inline bool isAnchorQuantifier( Quantifier quant)
{
	return quant == QuantOne || quant == QuantOneOrMore;
}

/// \brief Expression of a token-spec for one attribute
struct AttributeFragment
{
	PatternAttribute attribute;
	std::string expression;

	AttributeFragment()
		:attribute(),expression(){}
	AttributeFragment( const PatternAttribute& attribute_, const std::string& expression_)
		:attribute(attribute_),expression(expression_){}
	AttributeFragment( const AttributeFragment& o)
		:attribute(o.attribute),expression(o.expression){}
};

/// \brief Token-spec compiled to one expression fragment per attribute constrained
struct CompiledTokenSpec
{
	Quantifier quantifier;
	std::vector<AttributeFragment> fragments;

	CompiledTokenSpec()
		:quantifier(QuantOne),fragments(){}
	CompiledTokenSpec( const CompiledTokenSpec& o)
		:quantifier(o.quantifier),fragments(o.fragments){}

	/// \brief Get the fragment of an attribute or NULL if the attribute is not constrained
	const AttributeFragment* fragment( const PatternAttribute& attr) const;
};

/// \brief Compile a token-spec, throws InvalidPatternError if it is not valid
/// \param[in] spec the token-spec as JSON object
/// \param[in] position index of the token-spec in the pattern (for messages)
CompiledTokenSpec compileTokenSpec( const nlohmann::json& spec, unsigned int position);

}//namespace
#endif

