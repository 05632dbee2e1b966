/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "tokmatch/errors.hpp"
#include "patternCompiler.hpp"
#include "predicateCompiler.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#undef TOKMATCH_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

struct CompileTest
{
	const char* name;
	const char* pattern;
	const char* attributes[4];
	const char* sources[4];
	bool fixedArity;
};

#define T "(?:\\s|^)"
#define D "(?:\\s|$)"
#define G "(?=[^\\s])"
#define ANY "[^\\s]+"

static const CompileTest compileTests[] =
{
	{"literal",
		"[{\"TEXT\":\"JavaScript\"}]",
		{"TEXT",0}, {T "(" G "JavaScript)" D, 0}, true},
	{"zero or more",
		"[{\"ORTH\":\"a\"},{\"ORTH\":\"b\",\"OP\":\"*\"}]",
		{"TEXT",0}, {T "(" G "a)" D "((?:" G "b" D ")*)", 0}, false},
	{"adjacent repeat",
		"[{\"TEXT\":\"a\",\"OP\":\"+\"},{\"OP\":\"*\"}]",
		{"TEXT",0}, {T "((?:" G "a" D ")+?)((?:" G ANY D ")*)", 0}, false},
	{"escaped literal",
		"[{\"TEXT\":\"a.b\"},{\"TEXT\":\"(c)\",\"OP\":\"?\"}]",
		{"TEXT",0}, {T "(" G "a\\.b)" D "(" G "\\(c\\)" D ")?", 0}, false},
	{"attribute order",
		"[{\"SHAPE\":\"Xx\"},{\"lower\":\"b\"}]",
		{"LOWER","SHAPE",0}, {T "(" G ANY ")" D "(" G "b)" D, T "(" G "Xx)" D "(" G ANY ")" D, 0}, true},
	{"length",
		"[{\"LENGTH\":{\">=\":3}},{\"LENGTH\":2}]",
		{"LENGTH",0}, {T "(" G "[^\\s]{3,})" D "(" G "[^\\s]{2})" D, 0}, true},
	{"set membership",
		"[{\"LOWER\":{\"IN\":[\"a\",\"b\"]}},{\"LOWER\":{\"NOT_IN\":[\"c\"]}}]",
		{"LOWER",0}, {T "(" G "(?:a|b))" D "(" G "(?!c" D ")" ANY ")" D, 0}, true},
	{"negation",
		"[{\"IS_PUNCT\":true,\"OP\":\"!\"}]",
		{"IS_PUNCT",0}, {T "(?!(?:True)" D ")(" ANY ")" D, 0}, true},
	{"lemma",
		"[{\"LEMMA\":\"Be\"}]",
		{"LEMMA",0}, {T "(" G "be)" D, 0}, true},
	{"free regex",
		"[{\"REGEX\":\"\\\\bUS\\\\d+\\\\b\"}]",
		{"REGEX",0}, {"(\\bUS\\d+\\b)", 0}, false},
	{"extension",
		"[{\"_\":{\"is_fruit\":true}},{}]",
		{"_.is_fruit",0}, {T "(" G "True)" D "(" G ANY ")" D, 0}, true},
	{"regex predicate",
		"[{\"TEXT\":{\"REGEX\":\"^[Uu]S$\"}},{\"TEXT\":{\"REGEX\":\"ab\"}}]",
		{"TEXT",0}, {T "(" G "(?:[Uu]S))" D "(" G "[^\\s]*?(?:ab)[^\\s]*?)" D, 0}, true},
	{"empty matching regex predicate",
		"[{\"TEXT\":{\"REGEX\":\"^a*$\"}},{\"TEXT\":\"b\"}]",
		{"TEXT",0}, {T "(" G "(?:a*))" D "(" G "b)" D, 0}, true},
	{"non ascii literal",
		"[{\"LOWER\":\"caf\xC3\xA9\"}]",
		{"LOWER",0}, {T "(" G "caf\xC3\xA9)" D, 0}, true},
	{0,0,{0},{0},false}
};

static void testCompile()
{
	for (std::size_t ti=0; compileTests[ti].name; ++ti)
	{
		const CompileTest& test = compileTests[ti];
		tokmatch::CompiledPattern compiled = tokmatch::compilePattern( tokmatch::test::json( test.pattern), 0);
		std::size_t ai = 0;
		for (; test.attributes[ai]; ++ai)
		{
			if (ai >= compiled.expressions.size())
			{
				throw std::runtime_error( std::string("test ") + test.name + ": missing expression for " + test.attributes[ai]);
			}
			const tokmatch::AttributeExpression& expr = compiled.expressions[ ai];
#ifdef TOKMATCH_LOWLEVEL_DEBUG
			std::cerr << test.name << " " << expr.attribute.name() << ": " << expr.source << std::endl;
#endif
			if (expr.attribute.name() != test.attributes[ai])
			{
				throw std::runtime_error( std::string("test ") + test.name + ": expression " + expr.attribute.name() + " instead of " + test.attributes[ai]);
			}
			if (expr.source != test.sources[ai])
			{
				throw std::runtime_error( std::string("test ") + test.name + ": expression '" + expr.source + "', expected '" + test.sources[ai] + "'");
			}
		}
		if (ai != compiled.expressions.size())
		{
			throw std::runtime_error( std::string("test ") + test.name + ": unexpected number of expressions");
		}
		if (compiled.fixedArity != test.fixedArity)
		{
			throw std::runtime_error( std::string("test ") + test.name + ": fixed arity flag wrong");
		}
	}
}

static void testAnchorGroups()
{
	tokmatch::CompiledPattern compiled = tokmatch::compilePattern( tokmatch::test::json(
		"[{\"TEXT\":{\"REGEX\":\"(ab)+\"}},{\"TEXT\":\"c\",\"OP\":\"!\"},{\"TEXT\":\"d\",\"OP\":\"+\"},{\"TEXT\":\"e\",\"OP\":\"?\"}]"), 0);
	if (compiled.nofPositions != 4 || compiled.anchorPositions.size() != 2
	||  compiled.anchorPositions[0] != 0 || compiled.anchorPositions[1] != 2)
	{
		throw std::runtime_error( "anchor positions wrong");
	}
	const tokmatch::AttributeExpression::AnchorGroupMap& groups = compiled.expressions[0].anchorGroups;
	if (groups.size() != 2)
	{
		throw std::runtime_error( "number of anchor groups wrong");
	}
	tokmatch::AttributeExpression::AnchorGroupMap::const_iterator gi = groups.find( 0);
	if (gi == groups.end() || gi->second != 1)
	{
		throw std::runtime_error( "anchor group of position 0 wrong");
	}
	// position 0 has 2 groups, position 1 has 1 group
	gi = groups.find( 2);
	if (gi == groups.end() || gi->second != 4)
	{
		throw std::runtime_error( "anchor group of position 2 wrong");
	}
}

static const char* invalidPatterns[] =
{
	"[]",
	"{\"TEXT\":\"a\"}",
	"[5]",
	"[{\"COLOR\":\"red\"}]",
	"[{\"TEXT\":\"a\",\"OP\":\"#\"}]",
	"[{\"TEXT\":\"a\",\"OP\":1}]",
	"[{\"TEXT\":{\"FOO\":1}}]",
	"[{\"TEXT\":{}}]",
	"[{\"TEXT\":[\"a\"]}]",
	"[{\"TEXT\":1.5}]",
	"[{\"TEXT\":{\"IN\":\"a\"}}]",
	"[{\"LOWER\":{\">\":2}}]",
	"[{\"LENGTH\":\"abc\"}]",
	"[{\"LENGTH\":{\"REGEX\":\"a\"}}]",
	"[{\"TEXT\":{\"REGEX\":\"(a\"}}]",
	"[{\"REGEX\":\"a\",\"OP\":\"+\"}]",
	"[{\"REGEX\":5}]",
	"[{\"_\":5}]",
	0
};

static void testInvalidPatterns()
{
	for (std::size_t pi=0; invalidPatterns[pi]; ++pi)
	{
		try
		{
			tokmatch::compilePattern( tokmatch::test::json( invalidPatterns[pi]), 0);
		}
		catch (const tokmatch::InvalidPatternError& err)
		{
#ifdef TOKMATCH_LOWLEVEL_DEBUG
			std::cerr << "expected error: " << err.what() << std::endl;
#endif
			if (err.errorcode() != strus::ErrorCodeSyntax)
			{
				throw std::runtime_error( std::string("wrong error code for invalid pattern ") + invalidPatterns[pi]);
			}
			continue;
		}
		throw std::runtime_error( std::string("invalid pattern accepted: ") + invalidPatterns[pi]);
	}
}

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 1);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		testCompile();
		testAnchorGroups();
		testInvalidPatterns();

		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::exception& err)
	{
		std::cerr << "error testing pattern compilation: " << err.what() << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

