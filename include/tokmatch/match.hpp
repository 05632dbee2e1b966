/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Result of matching a rule on a document
/// \file match.hpp
#ifndef _TOKMATCH_MATCH_HPP_INCLUDED
#define _TOKMATCH_MATCH_HPP_INCLUDED
#include <cstddef>
#include <cstring>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Span of tokens [start,end) matched by a rule
class Match
{
public:
	/// \brief Constructor
	/// \param[in] keyid_ numeric identifier of the rule key
	/// \param[in] key_ rule key, owned by the matcher
	/// \param[in] start_ index of the first token of the span
	/// \param[in] end_ index of the token after the span
	Match( unsigned int keyid_, const char* key_, std::size_t start_, std::size_t end_)
		:m_keyid(keyid_),m_key(key_),m_start(start_),m_end(end_){}
	Match( const Match& o)
		:m_keyid(o.m_keyid),m_key(o.m_key),m_start(o.m_start),m_end(o.m_end){}

	/// \brief Numeric identifier of the rule key
	unsigned int keyid() const			{return m_keyid;}
	/// \brief Rule key
	const char* key() const				{return m_key;}
	/// \brief Index of the first token of the span
	std::size_t start() const			{return m_start;}
	/// \brief Index of the token after the span
	std::size_t end() const				{return m_end;}

	bool operator==( const Match& o) const
	{
		return m_keyid == o.m_keyid && m_start == o.m_start && m_end == o.m_end;
	}
	bool operator!=( const Match& o) const
	{
		return !operator==( o);
	}

private:
	unsigned int m_keyid;
	const char* m_key;
	std::size_t m_start;
	std::size_t m_end;
};

}//namespace
#endif

