/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "tokmatch/document.hpp"
#include "attributeProjector.hpp"
#include "patternAttribute.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#undef TOKMATCH_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

static void checkText( const char* testname, const std::string& text, const std::string& expected)
{
#ifdef TOKMATCH_LOWLEVEL_DEBUG
	std::cerr << testname << ": '" << text << "'" << std::endl;
#endif
	if (text != expected)
	{
		throw std::runtime_error( std::string("test ") + testname + ": projection is '" + text + "', expected '" + expected + "'");
	}
}

static void checkValue( const char* testname, std::size_t value, std::size_t expected)
{
	if (value != expected)
	{
		std::ostringstream msg;
		msg << "test " << testname << ": got " << value << ", expected " << expected;
		throw std::runtime_error( msg.str());
	}
}

static void testSeparatedProjection()
{
	tokmatch::Document doc = tokmatch::test::document( "The  Quick fox");
	tokmatch::AttributeProjection proj( doc, tokmatch::PatternAttribute( tokmatch::AttrLower));
	checkText( "lower", proj.text(), "the quick fox");
	checkValue( "lower tokens", proj.nofTokens(), 3);
	checkValue( "lower offset 0", proj.offset( 0), 0);
	checkValue( "lower offset 1", proj.offset( 1), 4);
	checkValue( "lower offset 2", proj.offset( 2), 10);
	checkValue( "lower offset end", proj.offset( 3), 13);
	checkValue( "lower index of token start", proj.tokenIndex( 4), 1);
	checkValue( "lower index of separator", proj.tokenIndex( 3), 1);
	checkValue( "lower index of end", proj.tokenIndex( 13), 3);
	checkValue( "lower start index inside token", proj.startTokenIndex( 6), 1);
	checkValue( "lower start index of separator", proj.startTokenIndex( 9), 2);

	tokmatch::AttributeProjection shape( doc, tokmatch::PatternAttribute( tokmatch::AttrShape));
	checkText( "shape", shape.text(), "Xxx Xxxxx xxx");

	tokmatch::AttributeProjection length( doc, tokmatch::PatternAttribute( tokmatch::AttrLength));
	checkText( "length", length.text(), "### ##### ###");
}

static void testRegexProjection()
{
	tokmatch::Document doc = tokmatch::test::document( "The  Quick fox");
	tokmatch::AttributeProjection proj( doc, tokmatch::PatternAttribute( tokmatch::AttrRegex));
	checkText( "regex", proj.text(), "The  Quick fox");
	checkValue( "regex offset 1", proj.offset( 1), 5);
	checkValue( "regex offset 2", proj.offset( 2), 11);
	checkValue( "regex offset end", proj.offset( 3), 14);
	checkValue( "regex index in whitespace", proj.tokenIndex( 4), 1);
	checkValue( "regex start index in whitespace", proj.startTokenIndex( 3), 1);
	checkValue( "regex start index inside token", proj.startTokenIndex( 7), 1);
}

static void testEmptyValues()
{
	tokmatch::Document doc = tokmatch::test::document( "She walks home");
	doc.tokenRef( 1).setAnnotation( tokmatch::AttrLemma, "Walk");
	doc.tokenRef( 2).setExtension( "place", std::string("my home"));

	tokmatch::AttributeProjection lemma( doc, tokmatch::PatternAttribute( tokmatch::AttrLemma));
	std::string expected;
	expected.append( TOKMATCH_EMPTY_VALUE);
	expected.append( " walk ");
	expected.append( TOKMATCH_EMPTY_VALUE);
	checkText( "lemma", lemma.text(), expected);
	checkValue( "lemma tokens", lemma.nofTokens(), 3);

	tokmatch::AttributeProjection ext( doc, tokmatch::PatternAttribute( std::string("place")));
	expected.clear();
	expected.append( TOKMATCH_EMPTY_VALUE);
	expected.push_back( ' ');
	expected.append( TOKMATCH_EMPTY_VALUE);
	expected.append( " my");
	expected.append( TOKMATCH_VALUE_SPACE);
	expected.append( "home");
	checkText( "extension", ext.text(), expected);
	checkValue( "extension offset 1", ext.offset( 1), 4);
	checkValue( "extension offset 2", ext.offset( 2), 8);
	checkValue( "extension start index at empty value", ext.startTokenIndex( 4), 1);
	checkValue( "extension start index at replaced space", ext.startTokenIndex( 10), 2);
}

static void testUnicodeSpaceInValue()
{
	// no-break space, en space and record separator inside values
	checkText( "no-break space", tokmatch::normalizeProjectedValue( "10\xC2\xA0km"), std::string("10") + TOKMATCH_VALUE_SPACE + "km");
	checkText( "en space", tokmatch::normalizeProjectedValue( "a\xE2\x80\x82" "b"), std::string("a") + TOKMATCH_VALUE_SPACE + "b");
	checkText( "record separator", tokmatch::normalizeProjectedValue( "a\x1E" "b"), std::string("a") + TOKMATCH_VALUE_SPACE + "b");
	checkText( "non ascii", tokmatch::normalizeProjectedValue( "caf\xC3\xA9"), "caf\xC3\xA9");
	checkText( "empty", tokmatch::normalizeProjectedValue( ""), TOKMATCH_EMPTY_VALUE);
}

static void testProjectionCache()
{
	tokmatch::Document doc = tokmatch::test::document( "a b c");
	tokmatch::ProjectionCache cache( &doc);
	const tokmatch::AttributeProjection& p1 = cache.get( tokmatch::PatternAttribute( tokmatch::AttrText));
	const tokmatch::AttributeProjection& p2 = cache.get( tokmatch::PatternAttribute( tokmatch::AttrText));
	if (&p1 != &p2)
	{
		throw std::runtime_error( "projection is not built only once per attribute");
	}
	const tokmatch::AttributeProjection& p3 = cache.get( tokmatch::PatternAttribute( tokmatch::AttrShape));
	checkText( "cached shape", p3.text(), "x x x");
	checkText( "cached text", p1.text(), "a b c");

	tokmatch::Document empty;
	tokmatch::AttributeProjection ep( empty, tokmatch::PatternAttribute( tokmatch::AttrText));
	checkValue( "empty document tokens", ep.nofTokens(), 0);
	checkText( "empty document", ep.text(), "");
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
		testSeparatedProjection();
		testRegexProjection();
		testEmptyValues();
		testUnicodeSpaceInValue();
		testProjectionCache();

		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::exception& err)
	{
		std::cerr << "error testing attribute projection: " << err.what() << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

