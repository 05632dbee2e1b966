/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Compilation of a pattern into one regular expression per attribute
#include "patternCompiler.hpp"
#include "predicateCompiler.hpp"
#include "regexExpressions.hpp"
#include "tokmatch/errors.hpp"
#include "internationalization.hpp"
#include "strus/debugTraceInterface.hpp"
#include <algorithm>
#include <stdexcept>

#define DEBUG_EVENT2( NAME, FMT, X1, X2)		if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)		if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3);

using namespace tokmatch;

typedef nlohmann::json Json;

static int attributePriority( const PatternAttribute& attr)
{
	switch (attr.id)
	{
		case AttrText: return 0;
		case AttrLower: return 1;
		case AttrLemma: return 2;
		default: return 3;
	}
}

struct AttributePriorityLess
{
	bool operator()( const PatternAttribute& a1, const PatternAttribute& a2) const
	{
		return attributePriority( a1) < attributePriority( a2);
	}
};

/// \brief Quantifier of a position for an attribute not constrained there
static Quantifier alignedQuantifier( Quantifier quant)
{
	return (quant == QuantNot || quant == QuantRegex) ? QuantOne : quant;
}

static bool isRepeatQuantifier( Quantifier quant)
{
	return quant == QuantOneOrMore || quant == QuantZeroOrMore;
}

/// \brief Wrap a fragment into its quantifier, every wrap has exactly one capture group of its own
/// \note Every token consumed is non empty, also if the fragment matches the empty string
static std::string wrapQuantifier( Quantifier quant, const std::string& expr, bool lazy)
{
	switch (quant)
	{
		case QuantOne:
			return std::string("(" TOKMATCH_TOKEN_GUARD) + expr + ")" TOKMATCH_TOKEN_DELIM;
		case QuantOneOrMore:
			return std::string("((?:" TOKMATCH_TOKEN_GUARD) + expr + TOKMATCH_TOKEN_DELIM ")+" + (lazy ? "?":"") + ")";
		case QuantNot:
			return std::string("(?!(?:") + expr + ")" TOKMATCH_TOKEN_DELIM ")(" TOKMATCH_ANY_TOKEN ")" TOKMATCH_TOKEN_DELIM;
		case QuantOptional:
			return std::string("(" TOKMATCH_TOKEN_GUARD) + expr + TOKMATCH_TOKEN_DELIM ")?";
		case QuantZeroOrMore:
			return std::string("((?:" TOKMATCH_TOKEN_GUARD) + expr + TOKMATCH_TOKEN_DELIM ")*" + (lazy ? "?":"") + ")";
		case QuantRegex:
			return std::string("(") + expr + ")";
	}
	throw std::logic_error( "unknown quantifier");
}

namespace {

/// \brief Element of one attribute expression at one position of the pattern
struct PositionElement
{
	Quantifier quantifier;
	std::string expression;

	PositionElement( Quantifier quantifier_, const std::string& expression_)
		:quantifier(quantifier_),expression(expression_){}
	PositionElement( const PositionElement& o)
		:quantifier(o.quantifier),expression(o.expression){}
};

class PatternCompiler
{
public:
	explicit PatternCompiler( strus::DebugTraceContextInterface* debugtrace_)
		:m_debugtrace(debugtrace_){}

	CompiledPattern compile( const Json& pattern)
	{
		if (!pattern.is_array())
		{
			throw InvalidPatternError( _TXT("pattern must be a list of token-specs, got %s"), pattern.type_name());
		}
		if (pattern.empty())
		{
			throw InvalidPatternError( _TXT("empty pattern"));
		}
		std::vector<CompiledTokenSpec> specs;
		std::vector<PatternAttribute> attributes;
		Json::const_iterator pi = pattern.begin(), pe = pattern.end();
		for (unsigned int pidx=0; pi != pe; ++pi,++pidx)
		{
			specs.push_back( compileTokenSpec( *pi, pidx));
			std::vector<AttributeFragment>::const_iterator
				fi = specs.back().fragments.begin(), fe = specs.back().fragments.end();
			for (; fi != fe; ++fi)
			{
				if (std::find( attributes.begin(), attributes.end(), fi->attribute) == attributes.end())
				{
					attributes.push_back( fi->attribute);
				}
			}
		}
		if (attributes.empty())
		{
			// ... only unconstrained token-specs: match on the text
			attributes.push_back( PatternAttribute( AttrText));
		}
		std::stable_sort( attributes.begin(), attributes.end(), AttributePriorityLess());

		CompiledPattern rt;
		rt.nofPositions = specs.size();
		rt.fixedArity = true;
		std::vector<CompiledTokenSpec>::const_iterator si = specs.begin(), se = specs.end();
		for (unsigned int sidx=0; si != se; ++si,++sidx)
		{
			if (isAnchorQuantifier( si->quantifier))
			{
				rt.anchorPositions.push_back( sidx);
			}
			if (si->quantifier != QuantOne && si->quantifier != QuantNot)
			{
				rt.fixedArity = false;
			}
		}
		std::vector<PatternAttribute>::const_iterator ai = attributes.begin(), ae = attributes.end();
		for (; ai != ae; ++ai)
		{
			rt.expressions.push_back( compileAttributeExpression( *ai, specs));
		}
		return rt;
	}

private:
	std::vector<PositionElement> positionElements( const PatternAttribute& attr, const std::vector<CompiledTokenSpec>& specs) const
	{
		std::vector<PositionElement> rt;
		std::vector<CompiledTokenSpec>::const_iterator si = specs.begin(), se = specs.end();
		for (; si != se; ++si)
		{
			const AttributeFragment* fragment = si->fragment( attr);
			if (fragment)
			{
				if (attr.id == AttrRegex)
				{
					rt.push_back( PositionElement( QuantRegex, fragment->expression));
				}
				else
				{
					Quantifier quant = si->quantifier == QuantRegex ? QuantOne : si->quantifier;
					rt.push_back( PositionElement( quant, fragment->expression));
				}
			}
			else
			{
				rt.push_back( PositionElement( alignedQuantifier( si->quantifier), TOKMATCH_ANY_TOKEN));
			}
		}
		return rt;
	}

	static bool canMatchSameToken( const PositionElement& e1, const PositionElement& e2)
	{
		return e1.expression == e2.expression
			|| e1.expression == TOKMATCH_ANY_TOKEN
			|| e2.expression == TOKMATCH_ANY_TOKEN;
	}

	AttributeExpression compileAttributeExpression( const PatternAttribute& attr, const std::vector<CompiledTokenSpec>& specs)
	{
		AttributeExpression rt;
		rt.attribute = attr;
		if (attr.id != AttrRegex)
		{
			rt.source.append( TOKMATCH_TOKEN_START);
		}
		std::vector<PositionElement> elements = positionElements( attr, specs);
		unsigned int groupidx = 0;
		std::vector<PositionElement>::const_iterator ei = elements.begin(), ee = elements.end();
		for (unsigned int eidx=0; ei != ee; ++ei,++eidx)
		{
			bool lazy = false;
			if (isRepeatQuantifier( ei->quantifier) && ei+1 != ee)
			{
				const PositionElement& next = *(ei+1);
				lazy = isRepeatQuantifier( next.quantifier) && canMatchSameToken( *ei, next);
			}
			unsigned int innerGroups = countCaptureGroups( ei->expression);
			if (isAnchorQuantifier( specs[ eidx].quantifier))
			{
				rt.anchorGroups[ eidx] = ei->quantifier == QuantNot
							? groupidx + innerGroups + 1
							: groupidx + 1;
			}
			rt.source.append( wrapQuantifier( ei->quantifier, ei->expression, lazy));
			groupidx += innerGroups + 1;
		}
		boost::regex_constants::syntax_option_type flags = boost::regex_constants::perl;
		if (attr.id == AttrLower || attr.id == AttrLength)
		{
			flags |= boost::regex_constants::icase;
		}
		try
		{
			rt.regex = boost::make_u32regex( rt.source, flags);
		}
		catch (const boost::regex_error& err)
		{
			throw InvalidPatternError( _TXT("failed to compile regular expression for attribute %s: %s"), attr.name().c_str(), err.what());
		}
		catch (const std::out_of_range& err)
		{
			throw InvalidPatternError( _TXT("regular expression for attribute %s is not valid UTF-8: %s"), attr.name().c_str(), err.what());
		}
		DEBUG_EVENT3( "expression", "attribute=%s anchors=%u regex=%s", attr.name().c_str(), (unsigned int)rt.anchorGroups.size(), rt.source.c_str());

		if (attr.id != AttrRegex)
		{
			std::string errmsg;
			rt.prefilter.reset( Prefilter::create( rt.source, (flags & boost::regex_constants::icase) != 0, errmsg));
			if (!rt.prefilter.get())
			{
				DEBUG_EVENT2( "prefilter", "attribute=%s skipped: %s", attr.name().c_str(), errmsg.c_str());
			}
		}
		return rt;
	}

private:
	strus::DebugTraceContextInterface* m_debugtrace;
};
}//anonymous namespace

CompiledPattern tokmatch::compilePattern( const Json& pattern, strus::DebugTraceContextInterface* debugtrace)
{
	PatternCompiler compiler( debugtrace);
	return compiler.compile( pattern);
}

