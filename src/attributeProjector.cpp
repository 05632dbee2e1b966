/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Projection of the values of one attribute of all tokens of a document into a string
#include "attributeProjector.hpp"
#include "tokmatch/documentInterface.hpp"
#include "tokmatch/tokenInterface.hpp"
#include "unicodeUtils.hpp"
#include <algorithm>
#include <cstdlib>

using namespace tokmatch;

/// \brief Characters a regular expression may see as space
static bool isProjectionSpace( CodePoint ch)
{
	return unicodeIsSpace( ch) || (ch >= 0x1C && ch <= 0x1F);
}

std::string tokmatch::normalizeProjectedValue( const std::string& value)
{
	if (value.empty()) return TOKMATCH_EMPTY_VALUE;
	std::vector<CodePoint> chars = utf8Decode( value);
	bool modified = false;
	std::vector<CodePoint>::iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		if (isProjectionSpace( *ci))
		{
			*ci = TOKMATCH_VALUE_SPACE_CODEPOINT;
			modified = true;
		}
	}
	return modified ? utf8Encode( chars) : value;
}

static std::string projectedValue( const TokenInterface& token, const PatternAttribute& attr)
{
	switch (attr.id)
	{
		case AttrExtension:
			return normalizeProjectedValue( token.extension( attr.extension));
		case AttrLemma:
			return normalizeProjectedValue( utf8ToLower( token.attribute( attr.id)));
		case AttrLength:
		{
			// one character per character of the token, so that length comparisons are repetition bounds
			int len = std::atoi( token.attribute( AttrLength).c_str());
			if (len <= 0) return TOKMATCH_EMPTY_VALUE;
			return std::string( len, '#');
		}
		default:
			return normalizeProjectedValue( token.attribute( attr.id));
	}
}

AttributeProjection::AttributeProjection( const DocumentInterface& doc, const PatternAttribute& attr)
	:m_text(),m_offsets()
{
	std::size_t ti = 0, te = doc.size();
	m_offsets.reserve( te + 1);
	if (attr.id == AttrRegex)
	{
		for (; ti != te; ++ti)
		{
			const TokenInterface& token = doc.token( ti);
			m_offsets.push_back( m_text.size());
			m_text.append( token.attribute( AttrText));
			m_text.append( token.whitespace());
		}
	}
	else
	{
		for (; ti != te; ++ti)
		{
			if (ti) m_text.push_back( ' ');
			m_offsets.push_back( m_text.size());
			m_text.append( projectedValue( doc.token( ti), attr));
		}
	}
	m_offsets.push_back( m_text.size());
}

std::size_t AttributeProjection::tokenIndex( std::size_t offset_) const
{
	std::vector<std::size_t>::const_iterator
		oi = std::lower_bound( m_offsets.begin(), m_offsets.end(), offset_);
	if (oi == m_offsets.end()) return nofTokens();
	return oi - m_offsets.begin();
}

std::size_t AttributeProjection::startTokenIndex( std::size_t offset_) const
{
	if (offset_ >= m_text.size()) return nofTokens();
	std::size_t chrlen = 1;
	while (offset_ + chrlen < m_text.size() && ((unsigned char)m_text[ offset_ + chrlen] & 0xC0) == 0x80) ++chrlen;
	std::vector<CodePoint> chars = utf8Decode( m_text.substr( offset_, chrlen));
	if (!chars.empty() && isProjectionSpace( chars[0])) return tokenIndex( offset_);
	std::vector<std::size_t>::const_iterator
		oi = std::upper_bound( m_offsets.begin(), m_offsets.end(), offset_);
	return (oi - m_offsets.begin()) - 1;
}

const AttributeProjection& ProjectionCache::get( const PatternAttribute& attr)
{
	std::map<PatternAttribute,AttributeProjectionRef>::const_iterator mi = m_map.find( attr);
	if (mi != m_map.end()) return *mi->second;
	AttributeProjectionRef proj( new AttributeProjection( *m_doc, attr));
	m_map[ attr] = proj;
	return *proj;
}

