/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Mapping of hyperscan error codes to strus error codes and names
/// \file "hyperscanErrorCode.hpp"
#ifndef _TOKMATCH_HYPERSCAN_ERROR_CODE_HPP_INCLUDED
#define _TOKMATCH_HYPERSCAN_ERROR_CODE_HPP_INCLUDED
#include "strus/errorCodes.hpp"
#include "hs_common.h"

namespace tokmatch {

static inline strus::ErrorCode hyperscanErrorCode( hs_error_t hs_error)
{
	strus::ErrorCode cause = strus::ErrorCodeUnknown;

	switch (hs_error)
	{
		case HS_INVALID:		cause = strus::ErrorCodeInvalidArgument; break;
		case HS_NOMEM:			cause = strus::ErrorCodeOutOfMem; break;
		case HS_SCAN_TERMINATED:	cause = strus::ErrorCodeUnknown; break;
		case HS_COMPILER_ERROR:		cause = strus::ErrorCodeSyntax; break;
		case HS_DB_VERSION_ERROR:	cause = strus::ErrorCodeVersionMismatch; break;
		case HS_DB_PLATFORM_ERROR:	cause = strus::ErrorCodePlatformIncompatibility; break;
		case HS_DB_MODE_ERROR:		cause = strus::ErrorCodeNotImplemented; break;
		case HS_BAD_ALIGN:		cause = strus::ErrorCodeInvalidArgument; break;
		case HS_BAD_ALLOC:		cause = strus::ErrorCodeLogicError; break;
		case HS_SCRATCH_IN_USE:		cause = strus::ErrorCodeLogicError; break;
		case HS_ARCH_ERROR:		cause = strus::ErrorCodePlatformRequirements; break;
		case HS_INSUFFICIENT_SPACE:	cause = strus::ErrorCodeBufferOverflow; break;
	}
	return cause;
}

static inline const char* hyperscanErrorName( hs_error_t hs_error)
{
	switch (hs_error)
	{
		case HS_SUCCESS: return "HS_SUCCESS";
		case HS_INVALID: return "HS_INVALID";
		case HS_NOMEM: return "HS_NOMEM";
		case HS_SCAN_TERMINATED: return "HS_SCAN_TERMINATED";
		case HS_COMPILER_ERROR: return "HS_COMPILER_ERROR";
		case HS_DB_VERSION_ERROR: return "HS_DB_VERSION_ERROR";
		case HS_DB_PLATFORM_ERROR: return "HS_DB_PLATFORM_ERROR";
		case HS_DB_MODE_ERROR: return "HS_DB_MODE_ERROR";
		case HS_BAD_ALIGN: return "HS_BAD_ALIGN";
		case HS_BAD_ALLOC: return "HS_BAD_ALLOC";
		case HS_SCRATCH_IN_USE: return "HS_SCRATCH_IN_USE";
		case HS_ARCH_ERROR: return "HS_ARCH_ERROR";
		case HS_INSUFFICIENT_SPACE: return "HS_INSUFFICIENT_SPACE";
		default: return "unknown";
	}
}

}//namespace
#endif

