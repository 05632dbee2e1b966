/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Evaluation of a compiled pattern on the projections of a document
/// \file "matchEngine.hpp"
#ifndef _TOKMATCH_MATCH_ENGINE_HPP_INCLUDED
#define _TOKMATCH_MATCH_ENGINE_HPP_INCLUDED
#include "patternCompiler.hpp"
#include "attributeProjector.hpp"
#include "hs.h"
#include <vector>
#include <map>
#include <cstddef>

namespace strus {
/// \brief Forward declaration
class DebugTraceContextInterface;
}

namespace tokmatch {

/// \brief Half open interval of token indices
struct TokenSpan
{
	std::size_t start;
	std::size_t end;

	TokenSpan()
		:start(0),end(0){}
	TokenSpan( std::size_t start_, std::size_t end_)
		:start(start_),end(end_){}
	TokenSpan( const TokenSpan& o)
		:start(o.start),end(o.end){}

	bool operator==( const TokenSpan& o) const
	{
		return start == o.start && end == o.end;
	}
	bool operator!=( const TokenSpan& o) const
	{
		return start != o.start || end != o.end;
	}
	bool operator<( const TokenSpan& o) const
	{
		if (start == o.start) return end < o.end;
		return start < o.start;
	}
};

/// \brief Runs compiled patterns on the projections of one document
class MatchEngine
{
public:
	/// \param[in] projections cache of projections of the document matched
	/// \param[in] scratch hyperscan scratch space for prefilters (NULL if no prefilters defined)
	/// \param[in] debugtrace debug trace context or NULL
	MatchEngine( ProjectionCache* projections_, hs_scratch_t* scratch_, strus::DebugTraceContextInterface* debugtrace_)
		:m_projections(projections_),m_scratch(scratch_),m_debugtrace(debugtrace_){}

	/// \brief Get the token spans matching a pattern in order of discovery
	std::vector<TokenSpan> run( const CompiledPattern& pattern);

private:
	typedef std::map<unsigned int,TokenSpan> AnchorSpanMap;
	struct Candidate
	{
		TokenSpan window;
		AnchorSpanMap anchors;

		Candidate()
			:window(),anchors(){}
		Candidate( const TokenSpan& window_, const AnchorSpanMap& anchors_)
			:window(window_),anchors(anchors_){}
		Candidate( const Candidate& o)
			:window(o.window),anchors(o.anchors){}

		bool operator<( const Candidate& o) const
		{
			if (window != o.window) return window < o.window;
			return anchors < o.anchors;
		}
	};

	bool passPrefilter( const CompiledPattern& pattern);
	void narrow(
		std::vector<Candidate>& result,
		const Candidate& candidate,
		const AttributeExpression& expression,
		const AttributeProjection& projection,
		bool exactMatch) const;

private:
	MatchEngine( const MatchEngine&){}	///> non copyable
	void operator=( const MatchEngine&){}	///> non copyable

private:
	ProjectionCache* m_projections;
	hs_scratch_t* m_scratch;
	strus::DebugTraceContextInterface* m_debugtrace;
};

}//namespace
#endif

