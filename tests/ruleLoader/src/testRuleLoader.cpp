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
#include "tokmatch/ruleLoader.hpp"
#include "tokmatch/matcher.hpp"
#include "tokmatch/document.hpp"
#include "tokmatch/errors.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#undef TOKMATCH_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

class CountingCallback
	:public tokmatch::MatchCallbackInterface
{
public:
	explicit CountingCallback( std::vector<std::size_t>* calls_)
		:m_calls(calls_){}

	virtual void onMatch( const tokmatch::Matcher&, tokmatch::DocumentInterface&, std::size_t matchidx, const std::vector<tokmatch::Match>&)
	{
		m_calls->push_back( matchidx);
	}

private:
	std::vector<std::size_t>* m_calls;
};

static const char* g_rules =
	"{\n"
	"  \"rules\": [\n"
	"    {\"key\": \"GREETING\", \"patterns\": [[{\"LOWER\":\"hello\"},{\"IS_PUNCT\":true,\"OP\":\"?\"},{\"LOWER\":\"world\"}]]},\n"
	"    {\"key\": \"PLACE\", \"patterns\": [[{\"_\":{\"is_place\":true}}]], \"on_match\": \"mark\"},\n"
	"    {\"key\": \"VERB\", \"patterns\": [[{\"POS\":\"VERB\"}]], \"on_match\": null}\n"
	"  ]\n"
	"}\n";

static const char* g_document =
	"[{\"text\":\"Hello\",\"ws\":\"\",\"pos\":\"INTJ\"},"
	"{\"text\":\",\",\"pos\":\"PUNCT\"},"
	"{\"text\":\"world\",\"pos\":\"NOUN\"},"
	"{\"text\":\"lives\",\"pos\":\"VERB\",\"lemma\":\"live\"},"
	"{\"text\":\"in\",\"pos\":\"ADP\",\"is_stop\":false},"
	"{\"text\":\"Paris\",\"ws\":\"\",\"pos\":\"PROPN\",\"_\":{\"is_place\":true,\"population\":2148000}},"
	"{\"text\":\"!\",\"ws\":\"\",\"pos\":\"PUNCT\"}]";

static void testLoadRules()
{
	std::vector<std::size_t> calls;
	tokmatch::MatchCallbackMap handlers;
	handlers[ "mark"] = tokmatch::MatchCallbackReference( new CountingCallback( &calls));

	tokmatch::Matcher matcher( g_errorBuffer);
	std::size_t nofRules = tokmatch::loadRules( matcher, g_rules, handlers);
	if (nofRules != 3 || matcher.size() != 3)
	{
		throw std::runtime_error( "wrong number of rules loaded");
	}
	if (matcher.get( "PLACE").callback() != handlers[ "mark"] || matcher.get( "VERB").callback().get())
	{
		throw std::runtime_error( "callbacks of rules loaded not as declared");
	}
	tokmatch::Document doc = tokmatch::loadDocument( g_document);
	if (doc.size() != 7 || doc.spanText( 0, 3) != "Hello, world" || doc.text() != "Hello, world lives in Paris!")
	{
		throw std::runtime_error( "document loaded has not the expected text");
	}
	if (doc.token( 5).extension( "population") != "2148000"
	||  doc.token( 3).attribute( tokmatch::AttrLemma) != "live"
	||  doc.token( 4).attribute( tokmatch::AttrIsStop) != "False")
	{
		throw std::runtime_error( "token properties of document loaded not as declared");
	}
	std::vector<tokmatch::Match> matches = matcher.match( doc);
#ifdef TOKMATCH_LOWLEVEL_DEBUG
	tokmatch::test::printMatches( std::cerr, matches, doc);
#endif
	static const tokmatch::test::ExpectedMatch expected[] = {
		{"GREETING",0,3},{"PLACE",5,6},{"VERB",3,4},{0,0,0}};
	tokmatch::test::checkMatches( "load rules", matches, expected);
	if (calls.size() != 1 || calls[0] != 1)
	{
		throw std::runtime_error( "callback of rule loaded not called as expected");
	}
}

static void testCallbackErrors()
{
	static const char* sources[] = {
		"{\"rules\":[{\"key\":\"A\",\"patterns\":[[{\"LOWER\":\"a\"}]],\"on_match\":5}]}",
		"{\"rules\":[{\"key\":\"A\",\"patterns\":[[{\"LOWER\":\"a\"}]],\"on_match\":\"undefined\"}]}",
		"{\"rules\":[{\"key\":\"A\",\"patterns\":[[{\"LOWER\":\"a\"}]],\"on_match\":{\"name\":\"mark\"}}]}",
		0
	};
	for (std::size_t si=0; sources[si]; ++si)
	{
		tokmatch::Matcher matcher( g_errorBuffer);
		try
		{
			tokmatch::loadRules( matcher, sources[si]);
			throw std::logic_error( "illegal callback accepted");
		}
		catch (const tokmatch::CallbackTypeError& err)
		{
			if (err.errorcode() != strus::ErrorCodeInvalidArgument) throw std::runtime_error( "wrong error code of callback type error");
		}
		if (matcher.contains( "A"))
		{
			throw std::runtime_error( "rule with illegal callback defined");
		}
	}
}

static void testSyntaxErrors()
{
	static const char* source =
		"{\n"
		"  \"rules\": [\n"
		"    {\"key\": \"A\" \"patterns\": []}\n"
		"  ]\n"
		"}\n";
	tokmatch::Matcher matcher( g_errorBuffer);
	try
	{
		tokmatch::loadRules( matcher, source);
		throw std::logic_error( "syntax error not detected");
	}
	catch (const tokmatch::InvalidPatternError& err)
	{
#ifdef TOKMATCH_LOWLEVEL_DEBUG
		std::cerr << "expected error: " << err.what() << std::endl;
#endif
		if (std::string( err.what()).find( "line 3") == std::string::npos)
		{
			throw std::runtime_error( std::string("line of syntax error not reported: ") + err.what());
		}
	}
	static const char* invalidSources[] = {
		"[]",
		"{\"rules\":{}}",
		"{\"rules\":[5]}",
		"{\"rules\":[{\"patterns\":[]}]}",
		"{\"rules\":[{\"key\":\"B\"}]}",
		"{\"rules\":[{\"key\":\"B\",\"patterns\":[[{\"OP\":\"x\"}]]}]}",
		0
	};
	for (std::size_t si=0; invalidSources[si]; ++si)
	{
		try
		{
			tokmatch::loadRules( matcher, invalidSources[si]);
			throw std::logic_error( std::string("invalid rule source accepted: ") + invalidSources[si]);
		}
		catch (const tokmatch::InvalidPatternError&)
		{}
	}
	// ... rules before an invalid one stay defined
	try
	{
		tokmatch::loadRules( matcher, "{\"rules\":[{\"key\":\"C\",\"patterns\":[]},{\"key\":\"D\",\"patterns\":[[{\"COLOR\":1}]]}]}");
		throw std::logic_error( "invalid rule accepted");
	}
	catch (const tokmatch::InvalidPatternError&)
	{}
	if (!matcher.contains( "C") || matcher.contains( "D") || matcher.size() != 1)
	{
		throw std::runtime_error( "unexpected rules defined after error");
	}
}

static void testDocumentErrors()
{
	static const char* invalidDocuments[] = {
		"[{\"text\":\"a\"},",
		"[5]",
		"[{\"ws\":\" \"}]",
		"[{\"text\":\"a\",\"color\":\"red\"}]",
		"[{\"text\":\"a\",\"shape\":\"x\"}]",
		"[{\"text\":\"a\",\"is_stop\":\"yes\"}]",
		"[{\"text\":\"a\",\"_\":{\"weight\":0.5}}]",
		0
	};
	for (std::size_t di=0; invalidDocuments[di]; ++di)
	{
		try
		{
			tokmatch::loadDocument( invalidDocuments[di]);
			throw std::logic_error( std::string("invalid document accepted: ") + invalidDocuments[di]);
		}
		catch (const tokmatch::runtime_error&)
		{}
	}
	tokmatch::Document doc = tokmatch::loadDocument( "  plain text\tdocument ");
	if (doc.size() != 3 || doc.token( 1).whitespace() != "\t")
	{
		throw std::runtime_error( "plain text document not split as expected");
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
		testLoadRules();
		testCallbackErrors();
		testSyntaxErrors();
		testDocumentErrors();

		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::exception& err)
	{
		std::cerr << "error testing rule loader: " << err.what() << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

