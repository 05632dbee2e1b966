/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Reference implementation of a tokenized document
#include "tokmatch/document.hpp"
#include "tokmatch/errors.hpp"
#include "lexicalAttributes.hpp"
#include "unicodeUtils.hpp"
#include "internationalization.hpp"
#include "utils.hpp"

using namespace tokmatch;

static std::string boolValue( bool val)
{
	return val ? "True" : "False";
}

std::string Token::attribute( TokenAttribute attr) const
{
	switch (attr)
	{
		case AttrText: return m_text;
		case AttrLower: return utf8ToLower( m_text);
		case AttrNorm:
		{
			std::map<TokenAttribute,std::string>::const_iterator ai = m_annotations.find( attr);
			return ai == m_annotations.end() ? utf8ToLower( m_text) : ai->second;
		}
		case AttrLemma:
		case AttrPos:
		case AttrTag:
		case AttrDep:
		case AttrMorph:
		case AttrEntType:
		case AttrEntIob:
		case AttrEntId:
		case AttrEntKbId:
		case AttrLang:
			return annotation( attr);
		case AttrShape: return lex::shape( m_text);
		case AttrPrefix: return lex::prefix( m_text);
		case AttrSuffix: return lex::suffix( m_text);
		case AttrLength: return utils::tostring( utf8Length( m_text));
		case AttrIsAlpha: return boolValue( lex::isAlpha( m_text));
		case AttrIsAscii: return boolValue( lex::isAscii( m_text));
		case AttrIsDigit: return boolValue( lex::isDigit( m_text));
		case AttrIsLower: return boolValue( lex::isLower( m_text));
		case AttrIsUpper: return boolValue( lex::isUpper( m_text));
		case AttrIsTitle: return boolValue( lex::isTitle( m_text));
		case AttrIsPunct: return boolValue( lex::isPunct( m_text));
		case AttrIsSpace: return boolValue( lex::isSpace( m_text));
		case AttrIsBracket: return boolValue( lex::isBracket( m_text));
		case AttrIsQuote: return boolValue( lex::isQuote( m_text));
		case AttrIsLeftPunct: return boolValue( lex::isLeftPunct( m_text));
		case AttrIsRightPunct: return boolValue( lex::isRightPunct( m_text));
		case AttrIsCurrency: return boolValue( lex::isCurrency( m_text));
		case AttrIsStop: return boolValue( m_stop < 0 ? lex::isStop( m_text) : (m_stop == 1));
		case AttrIsSentStart: return boolValue( m_sentStart);
		case AttrLikeNum: return boolValue( lex::likeNum( m_text));
		case AttrLikeUrl: return boolValue( lex::likeUrl( m_text));
		case AttrLikeEmail: return boolValue( lex::likeEmail( m_text));
		case AttrRegex: return m_text + m_whitespace;
		case AttrExtension: break;
	}
	throw tokmatch::runtime_error( _TXT("attribute '%s' is not a built-in token attribute"), tokenAttributeName( attr));
}

std::string Token::extension( const std::string& name) const
{
	std::map<std::string,std::string>::const_iterator ei = m_extensions.find( name);
	return ei == m_extensions.end() ? std::string() : ei->second;
}

static const std::string g_emptyValue;

const std::string& Token::annotation( TokenAttribute attr) const
{
	std::map<TokenAttribute,std::string>::const_iterator ai = m_annotations.find( attr);
	return ai == m_annotations.end() ? g_emptyValue : ai->second;
}

void Token::setAnnotation( TokenAttribute attr, const std::string& value)
{
	switch (attr)
	{
		case AttrLemma:
		case AttrNorm:
		case AttrPos:
		case AttrTag:
		case AttrDep:
		case AttrMorph:
		case AttrEntType:
		case AttrEntIob:
		case AttrEntId:
		case AttrEntKbId:
		case AttrLang:
			m_annotations[ attr] = value;
			return;
		default:
			break;
	}
	throw tokmatch::runtime_error( _TXT("attribute '%s' is derived from the token text and cannot be set"), tokenAttributeName( attr));
}

void Token::setExtension( const std::string& name, const std::string& value)
{
	m_extensions[ name] = value;
}

void Token::setExtension( const std::string& name, bool value)
{
	m_extensions[ name] = boolValue( value);
}

Document::Document( const std::vector<std::string>& words)
	:m_tokens()
{
	std::vector<std::string>::const_iterator wi = words.begin(), we = words.end();
	for (; wi != we; ++wi)
	{
		addToken( Token( *wi, " "));
	}
}

Document::Document( const std::vector<std::string>& words, const std::vector<bool>& spaces)
	:m_tokens()
{
	if (words.size() != spaces.size())
	{
		throw tokmatch::runtime_error( _TXT("number of words (%u) and number of space flags (%u) differ"), (unsigned int)words.size(), (unsigned int)spaces.size());
	}
	for (std::size_t wi=0; wi < words.size(); ++wi)
	{
		addToken( Token( words[ wi], spaces[ wi] ? " " : ""));
	}
}

Document Document::fromText( const std::string& text)
{
	Document rt;
	char const* si = text.c_str();
	const char* se = si + text.size();
	while (si < se)
	{
		const char* tokstart = si;
		for (; si < se && !((unsigned char)*si <= 32); ++si){}
		const char* tokend = si;
		for (; si < se && ((unsigned char)*si <= 32); ++si){}
		if (tokend > tokstart)
		{
			rt.addToken( Token( std::string( tokstart, tokend), std::string( tokend, si)));
		}
	}
	return rt;
}

void Document::addToken( const Token& token_)
{
	m_tokens.push_back( token_);
	if (m_tokens.size() == 1)
	{
		m_tokens.back().setSentStart( true);
	}
}

const Token& Document::token( std::size_t idx) const
{
	if (idx >= m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("token index %u out of range"), (unsigned int)idx);
	}
	return m_tokens[ idx];
}

Token& Document::tokenRef( std::size_t idx)
{
	if (idx >= m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("token index %u out of range"), (unsigned int)idx);
	}
	return m_tokens[ idx];
}

bool Document::hasAnnotation( TokenAttribute attr) const
{
	std::vector<Token>::const_iterator ti = m_tokens.begin(), te = m_tokens.end();
	for (; ti != te; ++ti)
	{
		if (!ti->annotation( attr).empty()) return true;
	}
	return false;
}

void Document::merge( std::size_t start, std::size_t end)
{
	if (start >= end || end > m_tokens.size())
	{
		throw tokmatch::runtime_error( _TXT("illegal span [%u,%u) to merge"), (unsigned int)start, (unsigned int)end);
	}
	Token merged( m_tokens[ start]);
	merged.setText( spanText( start, end));
	merged.setWhitespace( m_tokens[ end-1].whitespace());
	m_tokens.erase( m_tokens.begin() + start + 1, m_tokens.begin() + end);
	m_tokens[ start] = merged;
}

std::string Document::spanText( std::size_t start, std::size_t end) const
{
	std::string rt;
	if (end > m_tokens.size()) end = m_tokens.size();
	for (std::size_t ti = start; ti < end; ++ti)
	{
		rt.append( m_tokens[ ti].text());
		if (ti+1 < end) rt.append( m_tokens[ ti].whitespace());
	}
	return rt;
}

std::string Document::text() const
{
	std::string rt;
	std::vector<Token>::const_iterator ti = m_tokens.begin(), te = m_tokens.end();
	for (; ti != te; ++ti)
	{
		rt.append( ti->text());
		rt.append( ti->whitespace());
	}
	return rt;
}

