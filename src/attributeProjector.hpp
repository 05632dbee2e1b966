/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Projection of the values of one attribute of all tokens of a document into a string
/// \file "attributeProjector.hpp"
#ifndef _TOKMATCH_ATTRIBUTE_PROJECTOR_HPP_INCLUDED
#define _TOKMATCH_ATTRIBUTE_PROJECTOR_HPP_INCLUDED
#include "patternAttribute.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <map>

namespace tokmatch {

/// \brief Forward declaration
class DocumentInterface;

/// \brief Placeholder for an empty attribute value (U+E000 from the private use area, UTF-8 encoded)
#define TOKMATCH_EMPTY_VALUE "\xEE\x80\x80"
/// \brief Character replacing whitespace inside an attribute value (U+E001 from the private use area, UTF-8 encoded)
#define TOKMATCH_VALUE_SPACE "\xEE\x80\x81"
#define TOKMATCH_VALUE_SPACE_CODEPOINT 0xE001

/// \brief Map an attribute value to its representation in a projection
/// \note Empty values get a placeholder, unicode whitespace is replaced, so that every value is exactly one non empty run of non space characters
std::string normalizeProjectedValue( const std::string& value);

/// \brief Textual projection of one attribute of all tokens of a document
class AttributeProjection
{
public:
	AttributeProjection( const DocumentInterface& doc, const PatternAttribute& attr);
	AttributeProjection( const AttributeProjection& o)
		:m_text(o.m_text),m_offsets(o.m_offsets){}

	/// \brief Projected text
	const std::string& text() const
	{
		return m_text;
	}
	/// \brief Number of tokens projected
	std::size_t nofTokens() const
	{
		return m_offsets.size()-1;
	}
	/// \brief Character offset of the start of a token, offset(nofTokens()) is the end of the text
	std::size_t offset( std::size_t tokenidx) const
	{
		return m_offsets[ tokenidx];
	}
	/// \brief Index of the first token boundary at or after a character offset
	std::size_t tokenIndex( std::size_t offset_) const;
	/// \brief Index of the token a match starting at a character offset starts in
	/// \note A start inside the whitespace between two tokens belongs to the following token
	std::size_t startTokenIndex( std::size_t offset_) const;

private:
	std::string m_text;
	std::vector<std::size_t> m_offsets;
};

/// \brief Cache of projections built on demand during one matching call
class ProjectionCache
{
public:
	explicit ProjectionCache( const DocumentInterface* doc_)
		:m_doc(doc_),m_map(){}

	/// \brief Get the projection of an attribute, building it on first request
	const AttributeProjection& get( const PatternAttribute& attr);

private:
	ProjectionCache( const ProjectionCache&){}	///> non copyable
	void operator=( const ProjectionCache&){}	///> non copyable

private:
	typedef utils::SharedPtr<AttributeProjection> AttributeProjectionRef;
	const DocumentInterface* m_doc;
	std::map<PatternAttribute,AttributeProjectionRef> m_map;
};

}//namespace
#endif

