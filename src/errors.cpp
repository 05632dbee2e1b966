/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exceptions thrown by the token pattern matcher
/// \file errors.cpp
#include "tokmatch/errors.hpp"
#include "strus/errorCodes.hpp"
#include <cstdio>

using namespace tokmatch;

void runtime_error::init( const char* format, va_list args)
{
	char buf[ 2048];
	int len = std::vsnprintf( buf, sizeof(buf), format, args);
	if (len < 0)
	{
		m_msg = format;
	}
	else
	{
		if ((std::size_t)len >= sizeof(buf))
		{
			len = sizeof(buf)-1;
		}
		m_msg.assign( buf, len);
	}
}

runtime_error::runtime_error( const char* format, ...)
	:std::runtime_error(""),m_msg()
{
	va_list args;
	va_start( args, format);
	init( format, args);
	va_end( args);
}

int runtime_error::errorcode() const
{
	return strus::ErrorCodeRuntimeError;
}

InvalidPatternError::InvalidPatternError( const char* format, ...)
	:runtime_error()
{
	va_list args;
	va_start( args, format);
	init( format, args);
	va_end( args);
}

int InvalidPatternError::errorcode() const
{
	return strus::ErrorCodeSyntax;
}

MissingAnnotationError::MissingAnnotationError( const char* format, ...)
	:runtime_error()
{
	va_list args;
	va_start( args, format);
	init( format, args);
	va_end( args);
}

int MissingAnnotationError::errorcode() const
{
	return strus::ErrorCodeRuntimeError;
}

UnknownKeyError::UnknownKeyError( const char* format, ...)
	:runtime_error()
{
	va_list args;
	va_start( args, format);
	init( format, args);
	va_end( args);
}

int UnknownKeyError::errorcode() const
{
	return strus::ErrorCodeUnknownIdentifier;
}

CallbackTypeError::CallbackTypeError( const char* format, ...)
	:runtime_error()
{
	va_list args;
	va_start( args, format);
	init( format, args);
	va_end( args);
}

int CallbackTypeError::errorcode() const
{
	return strus::ErrorCodeInvalidArgument;
}

