/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Data of the rules defined in a matcher
/// \file "ruleTable.hpp"
#ifndef _TOKMATCH_RULE_TABLE_HPP_INCLUDED
#define _TOKMATCH_RULE_TABLE_HPP_INCLUDED
#include "tokmatch/matchCallbackInterface.hpp"
#include "tokmatch/tokenAttribute.hpp"
#include "patternCompiler.hpp"
#include "prefilter.hpp"
#include "symbolTable.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <map>
#include <set>
#include <algorithm>

namespace tokmatch {

/// \brief Rule with its compiled and its original patterns
struct Rule
{
	std::vector<CompiledPattern> compiled;
	std::vector<nlohmann::json> patterns;
	MatchCallbackReference callback;

	Rule()
		:compiled(),patterns(),callback(){}
	Rule( const Rule& o)
		:compiled(o.compiled),patterns(o.patterns),callback(o.callback){}
};

/// \brief Rules of a matcher
class RuleTable
{
public:
	RuleTable()
		:m_symtab(),m_order(),m_rules(),m_seenAttributes(),m_scratch(){}

	/// \brief Get the rule of a key id or NULL if not defined
	const Rule* rule( uint32_t keyid) const
	{
		std::map<uint32_t,Rule>::const_iterator ri = m_rules.find( keyid);
		return ri == m_rules.end() ? 0 : &ri->second;
	}
	/// \brief Get the rule of a key, create it if not defined
	Rule& defineRule( const std::string& key)
	{
		uint32_t keyid = m_symtab.getOrCreate( key);
		std::map<uint32_t,Rule>::iterator ri = m_rules.find( keyid);
		if (ri == m_rules.end())
		{
			m_order.push_back( keyid);
			return m_rules[ keyid];
		}
		return ri->second;
	}
	/// \brief Remove the rule of a key, return false if not defined
	bool removeRule( const std::string& key)
	{
		uint32_t keyid = m_symtab.get( key);
		if (!keyid || m_rules.erase( keyid) == 0) return false;
		m_order.erase( std::find( m_order.begin(), m_order.end(), keyid));
		return true;
	}
	/// \brief Key id of a key, 0 if not known
	uint32_t keyid( const std::string& key) const
	{
		return m_symtab.get( key);
	}
	const char* key( uint32_t keyid_) const
	{
		return m_symtab.key( keyid_);
	}
	/// \brief Key ids of the rules defined in order of their definition
	const std::vector<uint32_t>& order() const
	{
		return m_order;
	}
	/// \brief Attributes used in any rule defined, also in rules removed
	const std::set<TokenAttribute>& seenAttributes() const
	{
		return m_seenAttributes;
	}
	void addSeenAttribute( TokenAttribute attr)
	{
		m_seenAttributes.insert( attr);
	}
	/// \brief Prototype of the scratch space for the prefilters of all rules
	PrefilterScratch& scratch()
	{
		return m_scratch;
	}
	const PrefilterScratch& scratch() const
	{
		return m_scratch;
	}

private:
	SymbolTable m_symtab;
	std::vector<uint32_t> m_order;
	std::map<uint32_t,Rule> m_rules;
	std::set<TokenAttribute> m_seenAttributes;
	PrefilterScratch m_scratch;
};

}//namespace
#endif

