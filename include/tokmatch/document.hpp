/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Reference implementation of a tokenized document
/// \file document.hpp
#ifndef _TOKMATCH_DOCUMENT_HPP_INCLUDED
#define _TOKMATCH_DOCUMENT_HPP_INCLUDED
#include "tokmatch/tokenInterface.hpp"
#include "tokmatch/documentInterface.hpp"
#include <string>
#include <vector>
#include <map>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Token with the lexical attributes computed from its text and the annotated attributes set by the caller
class Token
	:public TokenInterface
{
public:
	/// \brief Constructor
	/// \param[in] text_ verbatim text of the token
	/// \param[in] whitespace_ whitespace following the token
	explicit Token( const std::string& text_, const std::string& whitespace_=" ")
		:m_text(text_),m_whitespace(whitespace_),m_annotations(),m_extensions(),m_sentStart(false),m_stop(-1){}
	/// \brief Copy constructor
	Token( const Token& o)
		:m_text(o.m_text),m_whitespace(o.m_whitespace),m_annotations(o.m_annotations),m_extensions(o.m_extensions),m_sentStart(o.m_sentStart),m_stop(o.m_stop){}
	virtual ~Token(){}

	virtual std::string attribute( TokenAttribute attr) const;
	virtual std::string extension( const std::string& name) const;
	virtual std::string whitespace() const
	{
		return m_whitespace;
	}

	const std::string& text() const
	{
		return m_text;
	}
	void setText( const std::string& text_)
	{
		m_text = text_;
	}
	void setWhitespace( const std::string& whitespace_)
	{
		m_whitespace = whitespace_;
	}

	/// \brief Set the value of an annotated attribute (LEMMA, NORM, POS, TAG, DEP, MORPH, ENT_TYPE, ENT_IOB, ENT_ID, ENT_KB_ID, LANG)
	/// \note Throws std::runtime_error for attributes derived from the text
	void setAnnotation( TokenAttribute attr, const std::string& value);
	/// \brief Get the value of an annotated attribute, empty if not set
	const std::string& annotation( TokenAttribute attr) const;

	/// \brief Define if the token starts a sentence
	void setSentStart( bool sentStart_)
	{
		m_sentStart = sentStart_;
	}
	bool isSentStart() const
	{
		return m_sentStart;
	}
	/// \brief Overrides the stop word list
	void setStop( bool stop_)
	{
		m_stop = stop_ ? 1 : 0;
	}

	/// \brief Set the value of an extension attribute
	void setExtension( const std::string& name, const std::string& value);
	/// \brief Set the value of a boolean extension attribute
	void setExtension( const std::string& name, bool value);

private:
	std::string m_text;
	std::string m_whitespace;
	std::map<TokenAttribute,std::string> m_annotations;
	std::map<std::string,std::string> m_extensions;
	bool m_sentStart;
	int m_stop;
};

/// \brief Tokenized document
class Document
	:public DocumentInterface
{
public:
	/// \brief Default constructor
	Document()
		:m_tokens(){}
	/// \brief Constructor from a list of words, each followed by a single space
	explicit Document( const std::vector<std::string>& words);
	/// \brief Constructor from a list of words and flags telling if a word is followed by a space
	Document( const std::vector<std::string>& words, const std::vector<bool>& spaces);
	/// \brief Copy constructor
	Document( const Document& o)
		:m_tokens(o.m_tokens){}
	virtual ~Document(){}

	/// \brief Create a document from a text, splitting tokens on whitespace
	static Document fromText( const std::string& text);

	/// \brief Append a token (the first token of a document is a sentence start)
	void addToken( const Token& token_);

	virtual std::size_t size() const
	{
		return m_tokens.size();
	}
	virtual const Token& token( std::size_t idx) const;
	virtual bool hasAnnotation( TokenAttribute attr) const;

	/// \brief Get a token for modification
	Token& tokenRef( std::size_t idx);

	/// \brief Merge a span of tokens into one token
	/// \param[in] start index of first token
	/// \param[in] end index of the token following the last token of the span
	/// \note The merged token gets the text of the span and the annotations of its first token
	void merge( std::size_t start, std::size_t end);

	/// \brief Text of a span of tokens without the whitespace after the last token
	std::string spanText( std::size_t start, std::size_t end) const;
	/// \brief Text of the whole document
	std::string text() const;

private:
	std::vector<Token> m_tokens;
};

}//namespace
#endif

