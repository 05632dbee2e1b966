/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Map of rule key strings to numeric identifiers
/// \file "symbolTable.hpp"
#ifndef _TOKMATCH_SYMBOL_TABLE_HPP_INCLUDED
#define _TOKMATCH_SYMBOL_TABLE_HPP_INCLUDED
#include "strus/base/crc32.hpp"
#include <boost/unordered_map.hpp>
#include <list>
#include <vector>
#include <string>
#include <cstring>
#include <stdint.h>

namespace tokmatch
{

/// \brief Block of memory holding key strings, never reallocated so that key pointers stay valid
class StringMapKeyBlock
{
public:
	enum {DefaultSize = 16300};

public:
	explicit StringMapKeyBlock( std::size_t blksize_=DefaultSize);
	StringMapKeyBlock( const StringMapKeyBlock& o);
	~StringMapKeyBlock();

	/// \brief Allocate a null terminated copy of a key, NULL if the block is full
	const char* allocKey( const char* key, std::size_t keylen);

private:
	char* m_blk;
	std::size_t m_blksize;
	std::size_t m_blkpos;
};

class StringMapKeyBlockList
{
public:
	StringMapKeyBlockList(){}
	StringMapKeyBlockList( const StringMapKeyBlockList& o)
		:m_ar(o.m_ar){}

	const char* allocKey( const char* key, std::size_t keylen);

private:
	std::list<StringMapKeyBlock> m_ar;
};

/// \brief Interning of keys, identifiers are assigned from 1 in order of creation, 0 means undefined
class SymbolTable
{
private:
	struct Key
	{
		const char* str;
		std::size_t len;

		Key()
			:str(0),len(0){}
		Key( const char* str_, std::size_t len_)
			:str(str_),len(len_){}
		Key( const Key& o)
			:str(o.str),len(o.len){}
	};
	struct MapKeyEqual
	{
		bool operator()( const Key& a, const Key& b) const
		{
			return a.len == b.len && std::memcmp( a.str, b.str, a.len) == 0;
		}
	};
	struct HashFunc{
		std::size_t operator()( const Key& key)const
		{
			return strus::utils::Crc32::calc( key.str, key.len);
		}
	};

	typedef boost::unordered_map<Key,uint32_t,HashFunc,MapKeyEqual> Map;

public:
	SymbolTable(){}

	/// \brief Get the identifier of a key, creating it if not defined yet
	uint32_t getOrCreate( const std::string& key);
	/// \brief Get the identifier of a key or 0 if not defined
	uint32_t get( const std::string& key) const;
	/// \brief Get the key of an identifier or NULL if not defined
	const char* key( uint32_t id) const;

	std::size_t size() const
	{
		return m_invmap.size();
	}

private:
	SymbolTable( const SymbolTable&){}	///> non copyable
	void operator=( const SymbolTable&){}	///> non copyable

private:
	Map m_map;
	std::vector<const char*> m_invmap;
	StringMapKeyBlockList m_keystring_blocks;
};

}//namespace
#endif

