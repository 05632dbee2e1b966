/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Hyperscan prefilter rejecting projections an attribute expression cannot match
/// \file "prefilter.hpp"
#ifndef _TOKMATCH_PREFILTER_HPP_INCLUDED
#define _TOKMATCH_PREFILTER_HPP_INCLUDED
#include "hs.h"
#include <string>

namespace tokmatch {

/// \brief Hyperscan database of one attribute expression compiled with HS_FLAG_PREFILTER
/// \note A prefilter may report matches the expression does not have, but never misses one
class Prefilter
{
public:
	/// \brief Compile a prefilter for an expression
	/// \param[in] expr regular expression, UTF-8 with unicode character classes
	/// \param[in] caseless true for case insensitive matching
	/// \param[out] errmsg message of hyperscan if the expression is not supported
	/// \return the prefilter or NULL if hyperscan cannot compile the expression
	static Prefilter* create( const std::string& expr, bool caseless, std::string& errmsg);

	~Prefilter();

	/// \brief Evaluate if the expression may match somewhere in a source string
	/// \param[in] src string to scan, valid UTF-8
	/// \param[in] scratch hyperscan scratch allocated for this database, not shared with another thread
	bool mayMatch( const std::string& src, hs_scratch_t* scratch) const;

	const hs_database_t* database() const
	{
		return m_db;
	}

private:
	explicit Prefilter( hs_database_t* db_)
		:m_db(db_){}
	Prefilter( const Prefilter&){}		///> non copyable
	void operator=( const Prefilter&){}	///> non copyable

private:
	hs_database_t* m_db;
};

/// \brief Prototype scratch space big enough for all prefilters of a matcher
class PrefilterScratch
{
public:
	PrefilterScratch()
		:m_scratch(0){}
	~PrefilterScratch();

	/// \brief Grow the scratch space so that it can be used with a prefilter
	void extend( const Prefilter& prefilter);

	/// \brief Prototype to clone scratch spaces from, NULL if no prefilter defined
	const hs_scratch_t* prototype() const
	{
		return m_scratch;
	}

private:
	PrefilterScratch( const PrefilterScratch&){}	///> non copyable
	void operator=( const PrefilterScratch&){}	///> non copyable

private:
	hs_scratch_t* m_scratch;
};

/// \brief Scratch space cloned from a prototype for the time of one matching call
class PrefilterScratchClone
{
public:
	explicit PrefilterScratchClone( const PrefilterScratch& proto);
	~PrefilterScratchClone();

	hs_scratch_t* get() const
	{
		return m_scratch;
	}

private:
	PrefilterScratchClone( const PrefilterScratchClone&){}	///> non copyable
	void operator=( const PrefilterScratchClone&){}		///> non copyable

private:
	hs_scratch_t* m_scratch;
};

}//namespace
#endif

