/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Registry of rules matched on tokenized documents
/// \file matcher.hpp
#ifndef _TOKMATCH_MATCHER_HPP_INCLUDED
#define _TOKMATCH_MATCHER_HPP_INCLUDED
#include "tokmatch/match.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "tokmatch/documentInterface.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace strus {
/// \brief Forward declaration
class ErrorBufferInterface;
}

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Forward declaration
class RuleTable;

/// \brief Definition of a rule as passed to the matcher
class RuleDefinition
{
public:
	RuleDefinition( const MatchCallbackReference& callback_, const std::vector<nlohmann::json>& patterns_)
		:m_callback(callback_),m_patterns(patterns_){}
	RuleDefinition( const RuleDefinition& o)
		:m_callback(o.m_callback),m_patterns(o.m_patterns){}

	/// \brief Callback of the rule, NULL if none defined
	const MatchCallbackReference& callback() const		{return m_callback;}
	/// \brief Patterns of the rule as added
	const std::vector<nlohmann::json>& patterns() const	{return m_patterns;}

private:
	MatchCallbackReference m_callback;
	std::vector<nlohmann::json> m_patterns;
};

/// \brief Registry of rules, each identified by a key and defined by a list of alternative patterns
/// \note Calls of add and remove must not overlap with each other nor with calls of match, concurrent calls of match are safe
class Matcher
{
public:
	/// \brief Constructor
	/// \param[in] errorhnd_ error buffer providing the debug trace, no tracing if NULL or without debug trace
	explicit Matcher( strus::ErrorBufferInterface* errorhnd_=0);
	~Matcher();

	/// \brief Add patterns to a rule, create the rule if it does not exist
	/// \param[in] key key of the rule
	/// \param[in] patterns JSON list of patterns, each pattern a list of token-spec objects
	/// \param[in] callback callback for the matches of the rule, replaces the one defined before
	/// \note All patterns are validated before anything is registered, throws InvalidPatternError
	void add( const std::string& key, const nlohmann::json& patterns, const MatchCallbackReference& callback=MatchCallbackReference());

	/// \brief Remove a rule, throws UnknownKeyError if not defined
	void remove( const std::string& key);

	/// \brief Get the definition of a rule, throws UnknownKeyError if not defined
	RuleDefinition get( const std::string& key) const;

	/// \brief Evaluate if a rule is defined
	bool contains( const std::string& key) const;

	/// \brief Number of rules defined
	std::size_t size() const;

	/// \brief Find all matches of all rules in a document and call the callbacks of the matching rules
	/// \param[in,out] document the document, passed to the callbacks
	/// \param[in] allowMissing true, if attributes requiring annotation not present in the document should be tolerated
	/// \return the matches, grouped by rule in order of definition
	/// \note Throws MissingAnnotationError if an attribute used by a rule is not annotated and allowMissing is false
	std::vector<Match> match( DocumentInterface& document, bool allowMissing=false) const;

	/// \brief Get the key of a rule by its numeric identifier or NULL if not known
	const char* keyName( unsigned int keyid) const;

private:
	Matcher( const Matcher&){}		///> non copyable
	void operator=( const Matcher&){}	///> non copyable

private:
	strus::ErrorBufferInterface* m_errorhnd;
	RuleTable* m_rules;
};

}//namespace
#endif

