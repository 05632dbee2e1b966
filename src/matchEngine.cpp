/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Evaluation of a compiled pattern on the projections of a document
#include "matchEngine.hpp"
#include "strus/debugTraceInterface.hpp"
#include <boost/regex/icu.hpp>
#include <set>

#define DEBUG_OPEN( NAME)				if (m_debugtrace) m_debugtrace->open( NAME);
#define DEBUG_CLOSE()					if (m_debugtrace) m_debugtrace->close();
#define DEBUG_EVENT1( NAME, FMT, X1)			if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1);
#define DEBUG_EVENT2( NAME, FMT, X1, X2)		if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2);

using namespace tokmatch;

/// \brief Offset of the UTF-8 character following the one at a byte offset
static std::size_t nextCharOffset( const std::string& text, std::size_t offset)
{
	++offset;
	while (offset < text.size() && ((unsigned char)text[ offset] & 0xC0) == 0x80)
	{
		++offset;
	}
	return offset;
}

bool MatchEngine::passPrefilter( const CompiledPattern& pattern)
{
	std::vector<AttributeExpression>::const_iterator
		ei = pattern.expressions.begin(), ee = pattern.expressions.end();
	for (; ei != ee; ++ei)
	{
		if (!ei->prefilter.get()) continue;
		const AttributeProjection& projection = m_projections->get( ei->attribute);
		if (!ei->prefilter->mayMatch( projection.text(), m_scratch))
		{
			DEBUG_EVENT1( "prefilter", "rejected by attribute %s", ei->attribute.name().c_str());
			return false;
		}
	}
	return true;
}

void MatchEngine::narrow(
		std::vector<Candidate>& result,
		const Candidate& candidate,
		const AttributeExpression& expression,
		const AttributeProjection& projection,
		bool exactMatch) const
{
	const char* tb = projection.text().c_str();
	std::size_t wstart = projection.offset( candidate.window.start);
	std::size_t wend = projection.offset( candidate.window.end);
	std::size_t pos = wstart;

	while (pos <= wend)
	{
		boost::cmatch what;
		if (exactMatch)
		{
			if (!boost::u32regex_match( tb + wstart, tb + wend, what, expression.regex)) break;
		}
		else
		{
			boost::match_flag_type mflags = boost::match_default;
			if (pos > wstart) mflags |= boost::match_prev_avail;
			if (!boost::u32regex_search( tb + pos, tb + wend, what, expression.regex, mflags)) break;
		}
		std::size_t mstart = what[0].first - tb;
		std::size_t mend = what[0].second - tb;
		if (mstart == mend)
		{
			// ... an empty match covers no token
			if (exactMatch) break;
			pos = nextCharOffset( projection.text(), mstart);
			continue;
		}
		TokenSpan window( projection.startTokenIndex( mstart), projection.tokenIndex( mend));

		bool agrees = true;
		AnchorSpanMap anchors( candidate.anchors);
		AttributeExpression::AnchorGroupMap::const_iterator
			gi = expression.anchorGroups.begin(), ge = expression.anchorGroups.end();
		for (; gi != ge; ++gi)
		{
			const boost::csub_match& group = what[ gi->second];
			if (!group.matched) continue;
			TokenSpan span( projection.startTokenIndex( group.first - tb), projection.tokenIndex( group.second - tb));
			AnchorSpanMap::const_iterator ai = candidate.anchors.find( gi->first);
			if (ai == candidate.anchors.end())
			{
				anchors[ gi->first] = span;
			}
			else if (ai->second != span)
			{
				agrees = false;
				break;
			}
		}
		if (agrees)
		{
			result.push_back( Candidate( window, anchors));
		}
		if (exactMatch) break;
		pos = nextCharOffset( projection.text(), mstart);
	}
}

std::vector<TokenSpan> MatchEngine::run( const CompiledPattern& pattern)
{
	std::vector<TokenSpan> rt;
	if (!passPrefilter( pattern)) return rt;

	DEBUG_OPEN( "pattern")
	std::vector<Candidate> candidates;
	const AttributeProjection& first = m_projections->get( pattern.expressions[0].attribute);
	candidates.push_back( Candidate( TokenSpan( 0, first.nofTokens()), AnchorSpanMap()));

	std::vector<AttributeExpression>::const_iterator
		ei = pattern.expressions.begin(), ee = pattern.expressions.end();
	for (int eidx=0; ei != ee && !candidates.empty(); ++ei,++eidx)
	{
		const AttributeProjection& projection = m_projections->get( ei->attribute);
		bool exactMatch = pattern.fixedArity && eidx > 0;

		std::vector<Candidate> matches;
		std::vector<Candidate>::const_iterator ci = candidates.begin(), ce = candidates.end();
		for (; ci != ce; ++ci)
		{
			narrow( matches, *ci, *ei, projection, exactMatch);
		}
		std::vector<Candidate> narrowed;
		std::set<Candidate> visited;
		std::vector<Candidate>::const_iterator mi = matches.begin(), me = matches.end();
		for (; mi != me; ++mi)
		{
			if (visited.insert( *mi).second)
			{
				narrowed.push_back( *mi);
			}
		}
		candidates.swap( narrowed);
		DEBUG_EVENT2( "pass", "attribute=%s candidates=%u", ei->attribute.name().c_str(), (unsigned int)candidates.size());
	}
	std::vector<Candidate>::const_iterator ci = candidates.begin(), ce = candidates.end();
	for (; ci != ce; ++ci)
	{
		if (ci->window.start < ci->window.end)
		{
			rt.push_back( ci->window);
			DEBUG_EVENT2( "match", "start=%u end=%u", (unsigned int)ci->window.start, (unsigned int)ci->window.end);
		}
	}
	DEBUG_CLOSE()
	return rt;
}

