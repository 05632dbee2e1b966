/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Compilation of a pattern into one regular expression per attribute
/// \file "patternCompiler.hpp"
#ifndef _TOKMATCH_PATTERN_COMPILER_HPP_INCLUDED
#define _TOKMATCH_PATTERN_COMPILER_HPP_INCLUDED
#include "patternAttribute.hpp"
#include "prefilter.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <boost/regex/icu.hpp>
#include <string>
#include <vector>
#include <map>

namespace strus {
/// \brief Forward declaration
class DebugTraceContextInterface;
}

namespace tokmatch {

/// \brief Compiled regular expression of a pattern for one attribute
struct AttributeExpression
{
	typedef std::map<unsigned int,unsigned int> AnchorGroupMap;

	PatternAttribute attribute;		///< attribute projected
	std::string source;			///< source of the regular expression
	boost::u32regex regex;			///< compiled regular expression, matching UTF-8 as unicode characters
	AnchorGroupMap anchorGroups;		///< map anchor position -> capture group index in regex
	utils::SharedPtr<Prefilter> prefilter;	///< prefilter or NULL, if none available

	AttributeExpression()
		:attribute(),source(),regex(),anchorGroups(),prefilter(){}
	AttributeExpression( const AttributeExpression& o)
		:attribute(o.attribute),source(o.source),regex(o.regex),anchorGroups(o.anchorGroups),prefilter(o.prefilter){}
};

/// \brief Pattern compiled into attribute expressions ordered for evaluation
struct CompiledPattern
{
	std::vector<AttributeExpression> expressions;	///< expressions in order of evaluation
	std::vector<unsigned int> anchorPositions;	///< positions with quantifier '1' or '+'
	bool fixedArity;				///< true if every position consumes exactly one token
	unsigned int nofPositions;			///< number of token-specs in the pattern

	CompiledPattern()
		:expressions(),anchorPositions(),fixedArity(false),nofPositions(0){}
	CompiledPattern( const CompiledPattern& o)
		:expressions(o.expressions),anchorPositions(o.anchorPositions),fixedArity(o.fixedArity),nofPositions(o.nofPositions){}
};

/// \brief Compile a pattern, throws InvalidPatternError if the pattern is not valid
/// \param[in] pattern JSON array of token-spec objects
/// \param[in] debugtrace debug trace context or NULL
CompiledPattern compilePattern( const nlohmann::json& pattern, strus::DebugTraceContextInterface* debugtrace);

}//namespace
#endif

