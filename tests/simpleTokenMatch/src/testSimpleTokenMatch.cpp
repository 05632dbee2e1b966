/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "tokmatch/matcher.hpp"
#include "tokmatch/document.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#undef TOKMATCH_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

struct TokenMatchTest
{
	const char* name;
	const char* patterns;
	const char* document;
	tokmatch::test::ExpectedMatch expected[8];
};

static const TokenMatchTest tests[] =
{
	{"literal",
		"[[{\"TEXT\":\"JavaScript\"}]]",
		"JavaScript is good",
		{{"literal",0,1},{0,0,0}}},
	{"zero or more",
		"[[{\"ORTH\":\"a\"},{\"ORTH\":\"b\",\"OP\":\"*\"}]]",
		"a b b c",
		{{"zero or more",0,3},{0,0,0}}},
	{"zero or more empty",
		"[[{\"ORTH\":\"a\"},{\"ORTH\":\"b\",\"OP\":\"*\"}]]",
		"a c",
		{{"zero or more empty",0,1},{0,0,0}}},
	{"quoted",
		"[[{\"TEXT\":\"\\\"\"},{\"OP\":\"!\",\"IS_PUNCT\":true},{\"OP\":\"!\",\"IS_PUNCT\":true},{\"TEXT\":\"\\\"\"}]]",
		"\" some words \"",
		{{"quoted",0,4},{0,0,0}}},
	{"quoted too long",
		"[[{\"TEXT\":\"\\\"\"},{\"OP\":\"!\",\"IS_PUNCT\":true},{\"OP\":\"!\",\"IS_PUNCT\":true},{\"TEXT\":\"\\\"\"}]]",
		"\" some three words \"",
		{{0,0,0}}},
	{"length",
		"[[{\"LENGTH\":{\"==\":2}}]]",
		"a aa aaa",
		{{"length",1,2},{0,0,0}}},
	{"free regex",
		"[[{\"REGEX\":\"\\\\bUS\\\\d+\\\\b\"}]]",
		"I bought shares of the fund named US12345 today",
		{{"free regex",7,8},{0,0,0}}},
	{"optional",
		"[[{\"LOWER\":\"hello\"},{\"IS_PUNCT\":true,\"OP\":\"?\"},{\"LOWER\":\"world\"}]]",
		"Hello , world ! hello world",
		{{"optional",0,3},{"optional",4,6},{0,0,0}}},
	{"one or more",
		"[[{\"IS_DIGIT\":true,\"OP\":\"+\"}]]",
		"call 555 1234 now or 911",
		{{"one or more",1,3},{"one or more",5,6},{0,0,0}}},
	{"alternative patterns",
		"[[{\"LOWER\":\"hi\"}],[{\"LOWER\":\"hi\"},{\"LOWER\":\"there\"}]]",
		"Hi there hi",
		{{"alternative patterns",0,1},{"alternative patterns",2,3},{"alternative patterns",0,2},{0,0,0}}},
	{"empty spans",
		"[[{\"TEXT\":\"x\",\"OP\":\"?\"}]]",
		"a b",
		{{0,0,0}}},
	{"optional single",
		"[[{\"TEXT\":\"x\",\"OP\":\"?\"}]]",
		"x a",
		{{"optional single",0,1},{0,0,0}}},
	{"negation",
		"[[{\"LOWER\":\"not\",\"OP\":\"!\"},{\"LOWER\":\"good\"}]]",
		"not good very good",
		{{"negation",2,4},{0,0,0}}},
	{"aligned attributes",
		"[[{\"LOWER\":\"a\",\"OP\":\"+\"},{\"SHAPE\":\"dd\"}]]",
		"a A 12 a 3",
		{{"aligned attributes",0,3},{0,0,0}}},
	{"empty matching token",
		"[[{\"TEXT\":{\"REGEX\":\"^a*$\"}},{\"TEXT\":\"b\"}]]",
		"b",
		{{0,0,0}}},
	{"empty matching token in sequence",
		"[[{\"TEXT\":{\"REGEX\":\"^a*$\"}},{\"TEXT\":\"b\"}]]",
		"aa b",
		{{"empty matching token in sequence",0,2},{0,0,0}}},
	{"empty free regex",
		"[[{\"REGEX\":\"x*\"}]]",
		"ab cd",
		{{0,0,0}}},
	{"free regex inside token",
		"[[{\"REGEX\":\"x+\"}]]",
		"ab xx cd",
		{{"free regex inside token",1,2},{0,0,0}}},
	{"non ascii regex",
		"[[{\"TEXT\":{\"REGEX\":\"^caf.$\"}}]]",
		"caf\xC3\xA9",
		{{"non ascii regex",0,1},{0,0,0}}},
	{"non ascii word characters",
		"[[{\"TEXT\":{\"REGEX\":\"^\\\\w+$\"}}]]",
		"na\xC3\xAFve ,",
		{{"non ascii word characters",0,1},{0,0,0}}},
	{"non ascii case insensitive",
		"[[{\"LOWER\":\"\xC3\x9C" "BER\"}]]",
		"\xC3\xBC" "ber alles",
		{{"non ascii case insensitive",0,1},{0,0,0}}},
	{0,0,0,{{0,0,0}}}
};

static void runTest( const TokenMatchTest& test)
{
	tokmatch::Matcher matcher( g_errorBuffer);
	matcher.add( test.name, tokmatch::test::json( test.patterns));
	tokmatch::Document doc = tokmatch::test::document( test.document);
	std::vector<tokmatch::Match> matches = matcher.match( doc);
#ifdef TOKMATCH_LOWLEVEL_DEBUG
	std::cerr << "test " << test.name << ":" << std::endl;
	tokmatch::test::printMatches( std::cerr, matches, doc);
#endif
	tokmatch::test::checkMatches( test.name, matches, test.expected);
}

static void testEmptyDocument()
{
	tokmatch::Matcher matcher( g_errorBuffer);
	matcher.add( "any", tokmatch::test::json( "[[{}]]"));
	tokmatch::Document doc;
	if (!matcher.match( doc).empty())
	{
		throw std::runtime_error( "matches found in an empty document");
	}
	tokmatch::Document single = tokmatch::test::document( "word");
	static const tokmatch::test::ExpectedMatch expected[] = {{"any",0,1},{0,0,0}};
	tokmatch::test::checkMatches( "any token", matcher.match( single), expected);
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
		unsigned int ti = 0;
		for (; tests[ti].name; ++ti)
		{
			runTest( tests[ti]);
		}
		testEmptyDocument();
		std::cerr << "executed " << ti << " tests" << std::endl;

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "error buffer has error after tests");
		}
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::exception& err)
	{
		if (g_errorBuffer && g_errorBuffer->hasError())
		{
			std::cerr << "error: " << g_errorBuffer->fetchError() << std::endl;
		}
		std::cerr << "error testing simple token match: " << err.what() << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

