/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of a token-spec into regular expression fragments per attribute
#include "predicateCompiler.hpp"
#include "attributeProjector.hpp"
#include "regexExpressions.hpp"
#include "unicodeUtils.hpp"
#include "tokmatch/errors.hpp"
#include "internationalization.hpp"
#include "utils.hpp"
#include <map>
#include <cstdio>

using namespace tokmatch;

typedef nlohmann::json Json;

const AttributeFragment* CompiledTokenSpec::fragment( const PatternAttribute& attr) const
{
	std::vector<AttributeFragment>::const_iterator fi = fragments.begin(), fe = fragments.end();
	for (; fi != fe; ++fi)
	{
		if (fi->attribute == attr) return &*fi;
	}
	return 0;
}

static const char* jsonTypeName( const Json& value)
{
	return value.type_name();
}

static std::string lengthExpression( const std::string& op, long long len)
{
	char buf[ 128];
	if (op == "==")
	{
		if (len <= 0) return TOKMATCH_NEVER_MATCH;
		std::snprintf( buf, sizeof(buf), "[^\\s]{%lld}", len);
	}
	else if (op == ">=")
	{
		if (len <= 1) return "[^\\s]+";
		std::snprintf( buf, sizeof(buf), "[^\\s]{%lld,}", len);
	}
	else if (op == ">")
	{
		if (len <= 0) return "[^\\s]+";
		std::snprintf( buf, sizeof(buf), "[^\\s]{%lld,}", len+1);
	}
	else if (op == "<=")
	{
		if (len <= 0) return TOKMATCH_NEVER_MATCH;
		std::snprintf( buf, sizeof(buf), "[^\\s]{1,%lld}", len);
	}
	else if (op == "<")
	{
		if (len <= 1) return TOKMATCH_NEVER_MATCH;
		std::snprintf( buf, sizeof(buf), "[^\\s]{1,%lld}", len-1);
	}
	else if (op == "!=")
	{
		if (len <= 0) return "[^\\s]+";
		if (len == 1) return "[^\\s]{2,}";
		std::snprintf( buf, sizeof(buf), "(?:[^\\s]{1,%lld}|[^\\s]{%lld,})", len-1, len+1);
	}
	else
	{
		throw InvalidPatternError( _TXT("unknown comparison operator '%s'"), op.c_str());
	}
	return std::string( buf);
}

static bool isComparisonOperator( const std::string& op)
{
	return op == "==" || op == "!=" || op == ">=" || op == "<=" || op == ">" || op == "<";
}

static long long lengthValue( const Json& value, const PatternAttribute& attr, unsigned int position)
{
	if (!value.is_number_integer())
	{
		throw InvalidPatternError( _TXT("token-spec %u: value of %s must be an integer, got %s"), position, attr.name().c_str(), jsonTypeName( value));
	}
	long long rt = value.get<long long>();
	if (rt < 0)
	{
		throw InvalidPatternError( _TXT("token-spec %u: negative length %lld for %s"), position, rt, attr.name().c_str());
	}
	return rt;
}

static std::string literalValue( const Json& value, const PatternAttribute& attr, unsigned int position)
{
	if (value.is_string())
	{
		return value.get<std::string>();
	}
	else if (value.is_boolean())
	{
		return value.get<bool>() ? "True" : "False";
	}
	else if (value.is_number_integer())
	{
		return utils::tostring( value.get<long long>());
	}
	throw InvalidPatternError( _TXT("token-spec %u: unsupported value type %s for %s"), position, jsonTypeName( value), attr.name().c_str());
}

static std::string literalExpression( const Json& value, const PatternAttribute& attr, unsigned int position)
{
	if (attr.id == AttrLength)
	{
		return lengthExpression( "==", lengthValue( value, attr, position));
	}
	std::string literal = literalValue( value, attr, position);
	if (attr.id == AttrLemma)
	{
		literal = utf8ToLower( literal);
	}
	return escapeRegexLiteral( normalizeProjectedValue( literal));
}

static std::string alternativesExpression( const Json& values, const PatternAttribute& attr, const std::string& predname, unsigned int position)
{
	if (!values.is_array())
	{
		throw InvalidPatternError( _TXT("token-spec %u: argument of %s for %s must be a list, got %s"), position, predname.c_str(), attr.name().c_str(), jsonTypeName( values));
	}
	if (values.empty()) return std::string();

	std::string rt;
	Json::const_iterator vi = values.begin(), ve = values.end();
	for (; vi != ve; ++vi)
	{
		if (!rt.empty()) rt.push_back( '|');
		rt.append( literalExpression( *vi, attr, position));
	}
	if (values.size() == 1) return rt;
	return std::string("(?:") + rt + ")";
}

static std::string regexPredicateExpression( const Json& arg, const PatternAttribute& attr, unsigned int position)
{
	if (!arg.is_string())
	{
		throw InvalidPatternError( _TXT("token-spec %u: argument of REGEX for %s must be a string, got %s"), position, attr.name().c_str(), jsonTypeName( arg));
	}
	if (attr.id == AttrLength)
	{
		throw InvalidPatternError( _TXT("token-spec %u: REGEX predicate not applicable to LENGTH"), position);
	}
	std::string expr = arg.get<std::string>();
	checkRegularExpression( expr);
	bool hadAnchors = false;
	std::string stripped = stripRegexAnchors( expr, hadAnchors);
	if (hadAnchors)
	{
		return std::string("(?:") + stripped + ")";
	}
	else
	{
		return std::string("[^\\s]*?(?:") + stripped + ")[^\\s]*?";
	}
}

static std::string predicateExpression( const std::string& predname_, const Json& arg, const PatternAttribute& attr, unsigned int position)
{
	std::string predname = utils::toupper( predname_);
	if (predname == "IN")
	{
		std::string alt = alternativesExpression( arg, attr, predname, position);
		return alt.empty() ? std::string( TOKMATCH_NEVER_MATCH) : alt;
	}
	else if (predname == "NOT_IN")
	{
		std::string alt = alternativesExpression( arg, attr, predname, position);
		if (alt.empty()) return TOKMATCH_ANY_TOKEN;
		return std::string("(?!") + alt + TOKMATCH_TOKEN_DELIM ")" TOKMATCH_ANY_TOKEN;
	}
	else if (predname == "REGEX")
	{
		return regexPredicateExpression( arg, attr, position);
	}
	else if (isComparisonOperator( predname))
	{
		if (attr.id != AttrLength)
		{
			throw InvalidPatternError( _TXT("token-spec %u: comparison %s only applicable to LENGTH, not to %s"), position, predname.c_str(), attr.name().c_str());
		}
		return lengthExpression( predname, lengthValue( arg, attr, position));
	}
	throw InvalidPatternError( _TXT("token-spec %u: unknown predicate '%s' for %s"), position, predname_.c_str(), attr.name().c_str());
}

typedef std::map<PatternAttribute,std::vector<std::string> > ConstraintMap;

static void compileValue( ConstraintMap& constraints, const PatternAttribute& attr, const Json& value, unsigned int position)
{
	std::vector<std::string>& exprs = constraints[ attr];
	if (value.is_object())
	{
		if (value.empty())
		{
			throw InvalidPatternError( _TXT("token-spec %u: empty predicate object for %s"), position, attr.name().c_str());
		}
		Json::const_iterator pi = value.begin(), pe = value.end();
		for (; pi != pe; ++pi)
		{
			exprs.push_back( predicateExpression( pi.key(), pi.value(), attr, position));
		}
	}
	else
	{
		exprs.push_back( literalExpression( value, attr, position));
	}
}

static Quantifier parseQuantifier( const Json& value, unsigned int position)
{
	if (value.is_string())
	{
		std::string op = value.get<std::string>();
		if (op.size() == 1)
		{
			switch (op[0])
			{
				case '1': return QuantOne;
				case '+': return QuantOneOrMore;
				case '!': return QuantNot;
				case '?': return QuantOptional;
				case '*': return QuantZeroOrMore;
				default: break;
			}
		}
		throw InvalidPatternError( _TXT("token-spec %u: illegal quantifier '%s', expected one of '1','+','!','?','*'"), position, op.c_str());
	}
	throw InvalidPatternError( _TXT("token-spec %u: quantifier must be a string, got %s"), position, jsonTypeName( value));
}

/// \brief Join the expressions of one attribute, all but the last one as look ahead assertions on the same token
static std::string joinConstraints( const std::vector<std::string>& exprs)
{
	std::string rt;
	std::vector<std::string>::const_iterator ei = exprs.begin(), ee = exprs.end();
	for (; ei != ee; ++ei)
	{
		if (ei+1 == ee)
		{
			rt.append( *ei);
		}
		else
		{
			rt.append( "(?=(?:");
			rt.append( *ei);
			rt.append( ")" TOKMATCH_TOKEN_DELIM ")");
		}
	}
	return rt;
}

CompiledTokenSpec tokmatch::compileTokenSpec( const Json& spec, unsigned int position)
{
	if (!spec.is_object())
	{
		throw InvalidPatternError( _TXT("token-spec %u is not an object but %s"), position, jsonTypeName( spec));
	}
	CompiledTokenSpec rt;
	bool hasOp = false;
	bool hasRegex = false;
	ConstraintMap constraints;

	Json::const_iterator si = spec.begin(), se = spec.end();
	for (; si != se; ++si)
	{
		const std::string& name = si.key();
		if (utils::caseInsensitiveEquals( name, "OP"))
		{
			rt.quantifier = parseQuantifier( si.value(), position);
			hasOp = true;
		}
		else if (name == "_")
		{
			if (!si.value().is_object())
			{
				throw InvalidPatternError( _TXT("token-spec %u: extension attributes '_' must be an object, got %s"), position, jsonTypeName( si.value()));
			}
			Json::const_iterator ei = si.value().begin(), ee = si.value().end();
			for (; ei != ee; ++ei)
			{
				compileValue( constraints, PatternAttribute( ei.key()), ei.value(), position);
			}
		}
		else
		{
			TokenAttribute attrid;
			if (!tokenAttributeFromName( name, attrid))
			{
				throw InvalidPatternError( _TXT("token-spec %u: unknown attribute '%s'"), position, name.c_str());
			}
			if (attrid == AttrRegex)
			{
				if (!si.value().is_string())
				{
					throw InvalidPatternError( _TXT("token-spec %u: REGEX expects a string, got %s"), position, jsonTypeName( si.value()));
				}
				std::string expr = si.value().get<std::string>();
				checkRegularExpression( expr);
				constraints[ PatternAttribute( AttrRegex)].push_back( expr);
				hasRegex = true;
			}
			else
			{
				compileValue( constraints, PatternAttribute( attrid), si.value(), position);
			}
		}
	}
	if (hasRegex)
	{
		if (hasOp && rt.quantifier != QuantOne)
		{
			throw InvalidPatternError( _TXT("token-spec %u: quantifier '%c' not allowed with REGEX"), position, (char)rt.quantifier);
		}
		rt.quantifier = QuantRegex;
	}
	ConstraintMap::const_iterator ci = constraints.begin(), ce = constraints.end();
	for (; ci != ce; ++ci)
	{
		rt.fragments.push_back( AttributeFragment( ci->first, joinConstraints( ci->second)));
	}
	return rt;
}

