/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Hyperscan prefilter rejecting projections an attribute expression cannot match
#include "prefilter.hpp"
#include "hyperscanErrorCode.hpp"
#include "tokmatch/errors.hpp"
#include "internationalization.hpp"
#include <cstring>
#include <limits>

using namespace tokmatch;

namespace {
/// \brief Exception for errors reported by hyperscan carrying the mapped error code
class HyperscanError
	:public tokmatch::runtime_error
{
public:
	HyperscanError( hs_error_t hserr_, const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(3,4)
		:tokmatch::runtime_error(),m_hserr(hserr_)
	{
		va_list args;
		va_start( args, format);
		init( format, args);
		va_end( args);
	}
	virtual int errorcode() const
	{
		return hyperscanErrorCode( m_hserr);
	}

private:
	hs_error_t m_hserr;
};
}//anonymous namespace

Prefilter* Prefilter::create( const std::string& expr, bool caseless, std::string& errmsg)
{
	unsigned int flags = HS_FLAG_PREFILTER | HS_FLAG_ALLOWEMPTY | HS_FLAG_MULTILINE | HS_FLAG_DOTALL | HS_FLAG_UTF8 | HS_FLAG_UCP;
	if (caseless) flags |= HS_FLAG_CASELESS;

	hs_platform_info_t platform;
	std::memset( &platform, 0, sizeof(platform));
	platform.cpu_features = HS_TUNE_FAMILY_GENERIC;

	hs_database_t* db = 0;
	hs_compile_error_t* compile_err = 0;
	hs_error_t err = hs_compile( expr.c_str(), flags, HS_MODE_BLOCK, &platform, &db, &compile_err);
	if (err != HS_SUCCESS)
	{
		if (compile_err)
		{
			errmsg = compile_err->message;
			hs_free_compile_error( compile_err);
		}
		else
		{
			errmsg = hyperscanErrorName( err);
		}
		return 0;
	}
	try
	{
		return new Prefilter( db);
	}
	catch (const std::bad_alloc&)
	{
		hs_free_database( db);
		throw;
	}
}

Prefilter::~Prefilter()
{
	hs_free_database( m_db);
}

static int matchEventHandler( unsigned int, unsigned long long, unsigned long long, unsigned int, void* context)
{
	bool* matched = (bool*)context;
	*matched = true;
	return 1;//... stop at the first match
}

bool Prefilter::mayMatch( const std::string& src, hs_scratch_t* scratch) const
{
	if (src.size() >= (std::size_t)std::numeric_limits<unsigned int>::max())
	{
		return true;
	}
	bool matched = false;
	hs_error_t err = hs_scan( m_db, src.c_str(), src.size(), 0/*reserved*/, scratch, matchEventHandler, &matched);
	if (err == HS_SCAN_TERMINATED)
	{
		return true;
	}
	if (err != HS_SUCCESS)
	{
		throw HyperscanError( err, _TXT("error scanning projection with prefilter (hyperscan error %s)"), hyperscanErrorName( err));
	}
	return matched;
}

PrefilterScratch::~PrefilterScratch()
{
	if (m_scratch) hs_free_scratch( m_scratch);
}

void PrefilterScratch::extend( const Prefilter& prefilter)
{
	hs_error_t err = hs_alloc_scratch( prefilter.database(), &m_scratch);
	if (err != HS_SUCCESS)
	{
		throw HyperscanError( err, _TXT("failed to allocate prefilter scratch space (hyperscan error %s)"), hyperscanErrorName( err));
	}
}

PrefilterScratchClone::PrefilterScratchClone( const PrefilterScratch& proto)
	:m_scratch(0)
{
	if (proto.prototype())
	{
		hs_error_t err = hs_clone_scratch( proto.prototype(), &m_scratch);
		if (err != HS_SUCCESS)
		{
			throw HyperscanError( err, _TXT("failed to clone prefilter scratch space (hyperscan error %s)"), hyperscanErrorName( err));
		}
	}
}

PrefilterScratchClone::~PrefilterScratchClone()
{
	if (m_scratch) hs_free_scratch( m_scratch);
}

