/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Lexical attributes computed from the text of a token
#include "lexicalAttributes.hpp"
#include "unicodeUtils.hpp"
#include <boost/regex.hpp>
#include <vector>
#include <set>
#include <cstring>

using namespace tokmatch;

enum {MaxShapeLength=100, MaxShapeRunLength=4};

std::string lex::shape( const std::string& text)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	if (chars.size() >= MaxShapeLength) return "LONG";

	std::vector<CodePoint> rt;
	CodePoint last = 0;
	unsigned int seq = 0;
	std::vector<CodePoint>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		CodePoint shapechr;
		if (unicodeIsAlpha( *ci))
		{
			shapechr = unicodeIsUpper( *ci) ? 'X' : 'x';
		}
		else if (unicodeIsDigit( *ci))
		{
			shapechr = 'd';
		}
		else
		{
			shapechr = *ci;
		}
		if (shapechr == last)
		{
			++seq;
		}
		else
		{
			seq = 0;
			last = shapechr;
		}
		if (seq < MaxShapeRunLength)
		{
			rt.push_back( shapechr);
		}
	}
	return utf8Encode( rt);
}

std::string lex::prefix( const std::string& text)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	return utf8Encode( chars, 0, 1);
}

std::string lex::suffix( const std::string& text)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	std::size_t start = chars.size() > 3 ? (chars.size() - 3) : 0;
	return utf8Encode( chars, start, chars.size());
}

typedef bool (*CharClassFunction)( CodePoint ch);

static bool allCharsOf( const std::string& text, CharClassFunction func)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	if (chars.empty()) return false;
	std::vector<CodePoint>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce && func( *ci); ++ci){}
	return ci == ce;
}

bool lex::isAlpha( const std::string& text)
{
	return allCharsOf( text, &unicodeIsAlpha);
}

bool lex::isAscii( const std::string& text)
{
	std::string::const_iterator si = text.begin(), se = text.end();
	for (; si != se && ((unsigned char)*si < 128); ++si){}
	return si == se;
}

bool lex::isDigit( const std::string& text)
{
	return allCharsOf( text, &unicodeIsDigit);
}

bool lex::isLower( const std::string& text)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	bool cased = false;
	std::vector<CodePoint>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (unicodeIsUpper( *ci)) return false;
		if (unicodeIsLower( *ci)) cased = true;
	}
	return cased;
}

bool lex::isUpper( const std::string& text)
{
	std::vector<CodePoint> chars = utf8Decode( text);
	bool cased = false;
	std::vector<CodePoint>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (unicodeIsLower( *ci)) return false;
		if (unicodeIsUpper( *ci)) cased = true;
	}
	return cased;
}

bool lex::isTitle( const std::string& text)
{
	// upper case characters only after uncased ones, lower case only after cased ones
	std::vector<CodePoint> chars = utf8Decode( text);
	bool prevcased = false;
	bool cased = false;
	std::vector<CodePoint>::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (unicodeIsUpper( *ci))
		{
			if (prevcased) return false;
			prevcased = true;
			cased = true;
		}
		else if (unicodeIsLower( *ci))
		{
			if (!prevcased) return false;
			prevcased = true;
			cased = true;
		}
		else
		{
			prevcased = false;
		}
	}
	return cased;
}

bool lex::isPunct( const std::string& text)
{
	return allCharsOf( text, &unicodeIsPunct);
}

bool lex::isSpace( const std::string& text)
{
	return allCharsOf( text, &unicodeIsSpace);
}

bool lex::isCurrency( const std::string& text)
{
	return allCharsOf( text, &unicodeIsCurrency);
}

static bool isInList( const std::string& text, const char** list)
{
	for (std::size_t li=0; list[li]; ++li)
	{
		if (text == list[li]) return true;
	}
	return false;
}

bool lex::isBracket( const std::string& text)
{
	static const char* ar[] = {"(",")","[","]","{","}","<",">",0};
	return isInList( text, ar);
}

bool lex::isQuote( const std::string& text)
{
	static const char* ar[] = {
		"\"","'","`","\xC2\xAB","\xC2\xBB","\xE2\x80\x98","\xE2\x80\x99","\xE2\x80\x9A","\xE2\x80\x9B",
		"\xE2\x80\x9C","\xE2\x80\x9D","\xE2\x80\x9E","\xE2\x80\x9F","\xE2\x80\xB9","\xE2\x80\xBA",
		"\xE2\x9D\xAE","\xE2\x9D\xAF","''","``",0};
	return isInList( text, ar);
}

bool lex::isLeftPunct( const std::string& text)
{
	static const char* ar[] = {
		"(","[","{","<","\"","'","\xC2\xAB","\xE2\x80\x98","\xE2\x80\x9A","\xE2\x80\x9B",
		"\xE2\x80\x9C","\xE2\x80\x9E","\xE2\x80\x9F","\xE2\x80\xB9","\xE2\x9D\xAE","``",0};
	return isInList( text, ar);
}

bool lex::isRightPunct( const std::string& text)
{
	static const char* ar[] = {
		")","]","}",">","\"","'","\xC2\xBB","\xE2\x80\x99","\xE2\x80\x9D","\xE2\x80\xBA",
		"\xE2\x9D\xAF","''",0};
	return isInList( text, ar);
}

static const char* g_stopWords[] = {
	"a","about","above","after","again","against","all","also","am","an","and","any","are","as","at",
	"be","because","been","before","being","below","between","both","but","by",
	"can","could","did","do","does","doing","down","during","each","either","else","ever","every",
	"few","for","from","further","had","has","have","having","he","her","here","hers","herself",
	"him","himself","his","how","however","i","if","in","into","is","it","its","itself",
	"just","least","less","made","many","may","me","might","more","most","much","must","my","myself",
	"neither","no","nor","not","now","of","off","often","on","once","only","or","other","our","ours",
	"ourselves","out","over","own","per","rather","same","she","should","since","so","some","such",
	"than","that","the","their","theirs","them","themselves","then","there","these","they","this",
	"those","through","thus","to","too","under","until","up","upon","us","very","was","we","were",
	"what","when","where","whether","which","while","who","whom","whose","why","will","with",
	"within","without","would","yet","you","your","yours","yourself","yourselves",0};

bool lex::isStop( const std::string& text)
{
	return isInList( utf8ToLower( text), g_stopWords);
}

static const char* g_numberWords[] = {
	"zero","one","two","three","four","five","six","seven","eight","nine","ten",
	"eleven","twelve","thirteen","fourteen","fifteen","sixteen","seventeen","eighteen","nineteen",
	"twenty","thirty","forty","fifty","sixty","seventy","eighty","ninety",
	"hundred","thousand","million","billion","trillion","quadrillion","gajillion","bazillion",0};

static bool isAsciiDigits( const std::string& text)
{
	if (text.empty()) return false;
	std::string::const_iterator si = text.begin(), se = text.end();
	for (; si != se && *si >= '0' && *si <= '9'; ++si){}
	return si == se;
}

bool lex::likeNum( const std::string& text_)
{
	std::string text( text_);
	if (!text.empty() && (text[0] == '+' || text[0] == '-' || text[0] == '~'))
	{
		text.erase( 0, 1);
	}
	else if (text.size() >= 2 && text.compare( 0, 2, "\xC2\xB1") == 0)
	{
		text.erase( 0, 2);
	}
	std::string digits;
	std::string::const_iterator si = text.begin(), se = text.end();
	for (; si != se; ++si)
	{
		if (*si != ',' && *si != '.') digits.push_back( *si);
	}
	if (isAsciiDigits( digits)) return true;
	std::size_t slash = text.find( '/');
	if (slash != std::string::npos && text.find( '/', slash+1) == std::string::npos)
	{
		if (isAsciiDigits( text.substr( 0, slash)) && isAsciiDigits( text.substr( slash+1)))
		{
			return true;
		}
	}
	return isInList( utf8ToLower( text), g_numberWords);
}

static const char* g_topLevelDomains[] = {
	"com","org","net","edu","gov","mil","int","info","biz","io","co","ai","app","dev",
	"de","uk","fr","it","es","ch","at","nl","be","eu","us","ca","au","ru","jp","cn","in","br",0};

bool lex::likeUrl( const std::string& text)
{
	if (text.empty()) return false;
	static const char* prefixes[] = {"http://","https://","www.","ftp.","ftp://",0};
	for (std::size_t pi=0; prefixes[pi]; ++pi)
	{
		if (text.compare( 0, std::strlen( prefixes[pi]), prefixes[pi]) == 0) return true;
	}
	if (text[0] == '.' || text[ text.size()-1] == '.') return false;
	if (text.find( '@') != std::string::npos) return false;
	std::size_t dot = text.rfind( '.');
	if (dot == std::string::npos) return false;
	std::string tld = text.substr( dot+1);
	std::size_t colon = tld.find( ':');
	if (colon != std::string::npos) tld.resize( colon);
	if (!tld.empty() && tld[ tld.size()-1] == '/') return true;
	return isInList( utf8ToLower( tld), g_topLevelDomains);
}

bool lex::likeEmail( const std::string& text)
{
	static const boost::regex expr( "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}");
	return boost::regex_match( text, expr);
}

