/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Registry of rules matched on tokenized documents
#include "tokmatch/matcher.hpp"
#include "tokmatch/errors.hpp"
#include "ruleTable.hpp"
#include "matchEngine.hpp"
#include "attributeProjector.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include <memory>
#include <map>
#include <set>

#define STRUS_DBGTRACE_COMPONENT_NAME "tokmatch"

#define DEBUG_OPEN( NAME)				if (debugtrace.get()) debugtrace->open( NAME);
#define DEBUG_CLOSE()					if (debugtrace.get()) debugtrace->close();
#define DEBUG_EVENT2( NAME, FMT, X1, X2)		if (debugtrace.get()) debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)		if (debugtrace.get()) debugtrace->event( NAME, FMT, X1, X2, X3);

using namespace tokmatch;

static strus::DebugTraceContextInterface* createDebugTraceContext( strus::ErrorBufferInterface* errorhnd)
{
	if (!errorhnd) return 0;
	strus::DebugTraceInterface* dbgi = errorhnd->debugTrace();
	return dbgi ? dbgi->createTraceContext( STRUS_DBGTRACE_COMPONENT_NAME) : 0;
}

Matcher::Matcher( strus::ErrorBufferInterface* errorhnd_)
	:m_errorhnd(errorhnd_),m_rules(0)
{
	initMessageTextDomain();
	m_rules = new RuleTable();
}

Matcher::~Matcher()
{
	delete m_rules;
}

void Matcher::add( const std::string& key, const nlohmann::json& patterns, const MatchCallbackReference& callback)
{
	std::auto_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTraceContext( m_errorhnd));
	if (!patterns.is_array())
	{
		throw InvalidPatternError( _TXT("patterns of rule '%s' must be a list of patterns, got %s"), key.c_str(), patterns.type_name());
	}
	DEBUG_OPEN( "add")
	std::vector<CompiledPattern> compiled;
	nlohmann::json::const_iterator pi = patterns.begin(), pe = patterns.end();
	for (int pidx=0; pi != pe; ++pi,++pidx)
	{
		DEBUG_EVENT2( "pattern", "key=%s index=%d", key.c_str(), pidx);
		try
		{
			compiled.push_back( compilePattern( *pi, debugtrace.get()));
		}
		catch (const InvalidPatternError& err)
		{
			throw InvalidPatternError( _TXT("invalid pattern %d of rule '%s': %s"), pidx, key.c_str(), err.what());
		}
	}
	// ... everything compiled, from here on the rule is changed
	std::vector<CompiledPattern>::const_iterator ci = compiled.begin(), ce = compiled.end();
	for (; ci != ce; ++ci)
	{
		std::vector<AttributeExpression>::const_iterator
			ei = ci->expressions.begin(), ee = ci->expressions.end();
		for (; ei != ee; ++ei)
		{
			if (ei->prefilter.get()) m_rules->scratch().extend( *ei->prefilter);
		}
	}
	Rule& rule = m_rules->defineRule( key);
	for (ci = compiled.begin(); ci != ce; ++ci)
	{
		std::vector<AttributeExpression>::const_iterator
			ei = ci->expressions.begin(), ee = ci->expressions.end();
		for (; ei != ee; ++ei)
		{
			m_rules->addSeenAttribute( ei->attribute.id);
		}
	}
	rule.compiled.insert( rule.compiled.end(), compiled.begin(), compiled.end());
	rule.patterns.insert( rule.patterns.end(), patterns.begin(), patterns.end());
	rule.callback = callback;
	DEBUG_EVENT3( "rule", "key=%s patterns=%u callback=%s", key.c_str(), (unsigned int)rule.patterns.size(), callback.get() ? "yes":"no");
	DEBUG_CLOSE()
}

void Matcher::remove( const std::string& key)
{
	if (!m_rules->removeRule( key))
	{
		throw UnknownKeyError( _TXT("rule '%s' is not defined"), key.c_str());
	}
}

RuleDefinition Matcher::get( const std::string& key) const
{
	const Rule* rule = m_rules->rule( m_rules->keyid( key));
	if (!rule)
	{
		throw UnknownKeyError( _TXT("rule '%s' is not defined"), key.c_str());
	}
	return RuleDefinition( rule->callback, rule->patterns);
}

bool Matcher::contains( const std::string& key) const
{
	return m_rules->rule( m_rules->keyid( key)) != 0;
}

std::size_t Matcher::size() const
{
	return m_rules->order().size();
}

const char* Matcher::keyName( unsigned int keyid) const
{
	return m_rules->key( keyid);
}

/// \brief Append the spans of one rule, among spans with the same end only the one with the smallest start, each span once
static void appendRuleMatches( std::vector<Match>& result, uint32_t keyid, const char* key, const std::vector<TokenSpan>& spans)
{
	std::map<std::size_t,std::size_t> minStartMap;
	std::vector<TokenSpan>::const_iterator si = spans.begin(), se = spans.end();
	for (; si != se; ++si)
	{
		std::map<std::size_t,std::size_t>::iterator mi = minStartMap.find( si->end);
		if (mi == minStartMap.end())
		{
			minStartMap[ si->end] = si->start;
		}
		else if (si->start < mi->second)
		{
			mi->second = si->start;
		}
	}
	std::set<TokenSpan> emitted;
	for (si = spans.begin(); si != se; ++si)
	{
		if (minStartMap[ si->end] == si->start && emitted.insert( *si).second)
		{
			result.push_back( Match( keyid, key, si->start, si->end));
		}
	}
}

std::vector<Match> Matcher::match( DocumentInterface& document, bool allowMissing) const
{
	std::vector<Match> rt;
	if (!allowMissing)
	{
		std::set<TokenAttribute>::const_iterator
			ai = m_rules->seenAttributes().begin(), ae = m_rules->seenAttributes().end();
		for (; ai != ae; ++ai)
		{
			if (tokenAttributeRequiresAnnotation( *ai) && !document.hasAnnotation( *ai))
			{
				throw MissingAnnotationError( _TXT("attribute %s is used in a rule but the document is not annotated with it (use allowMissing to match anyway)"), tokenAttributeName( *ai));
			}
		}
	}
	if (document.size() == 0) return rt;

	std::auto_ptr<strus::DebugTraceContextInterface> debugtrace( createDebugTraceContext( m_errorhnd));
	DEBUG_OPEN( "match")
	ProjectionCache projections( &document);
	PrefilterScratchClone scratch( m_rules->scratch());
	MatchEngine engine( &projections, scratch.get(), debugtrace.get());

	std::vector<uint32_t>::const_iterator ki = m_rules->order().begin(), ke = m_rules->order().end();
	for (; ki != ke; ++ki)
	{
		const Rule* rule = m_rules->rule( *ki);
		std::vector<TokenSpan> spans;
		std::vector<CompiledPattern>::const_iterator ci = rule->compiled.begin(), ce = rule->compiled.end();
		for (; ci != ce; ++ci)
		{
			std::vector<TokenSpan> patternSpans = engine.run( *ci);
			spans.insert( spans.end(), patternSpans.begin(), patternSpans.end());
		}
		appendRuleMatches( rt, *ki, m_rules->key( *ki), spans);
	}
	DEBUG_EVENT2( "result", "rules=%u matches=%u", (unsigned int)m_rules->order().size(), (unsigned int)rt.size());
	DEBUG_CLOSE()

	std::vector<Match>::const_iterator mi = rt.begin(), me = rt.end();
	for (std::size_t midx=0; mi != me; ++mi,++midx)
	{
		const Rule* rule = m_rules->rule( mi->keyid());
		if (rule && rule->callback.get())
		{
			rule->callback->onMatch( *this, document, midx, rt);
		}
	}
	return rt;
}

