/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exceptions thrown by the token pattern matcher
/// \file errors.hpp
#ifndef _TOKMATCH_ERRORS_HPP_INCLUDED
#define _TOKMATCH_ERRORS_HPP_INCLUDED
#include <stdexcept>
#include <string>
#include <cstdarg>

#ifdef __GNUC__
#define TOKMATCH_FORMAT_ATTRIBUTE(FMTIDX,ARGIDX) __attribute__ ((format (printf, FMTIDX, ARGIDX)))
#else
#define TOKMATCH_FORMAT_ATTRIBUTE(FMTIDX,ARGIDX)
#endif

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Base class of all exceptions thrown by tokmatch, constructed with a printf style format string
class runtime_error
	:public std::runtime_error
{
public:
	runtime_error( const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(2,3);
	virtual ~runtime_error() throw(){}

	virtual const char* what() const throw()
	{
		return m_msg.c_str();
	}
	/// \brief Error code (strus::ErrorCode) used when the error is reported to an error buffer
	virtual int errorcode() const;

protected:
	runtime_error()
		:std::runtime_error(""),m_msg(){}
	void init( const char* format, va_list args);

private:
	std::string m_msg;
};

/// \brief Malformed pattern, token-spec or predicate, unknown attribute or bad quantifier symbol
/// \note Raised when adding a rule, never deferred to matching
class InvalidPatternError
	:public runtime_error
{
public:
	InvalidPatternError( const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(2,3);
	virtual int errorcode() const;
};

/// \brief An attribute requiring upstream annotation is referenced by a rule but not available in the document matched
class MissingAnnotationError
	:public runtime_error
{
public:
	MissingAnnotationError( const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(2,3);
	virtual int errorcode() const;
};

/// \brief Rule key not defined
class UnknownKeyError
	:public runtime_error
{
public:
	UnknownKeyError( const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(2,3);
	virtual int errorcode() const;
};

/// \brief Callback declared for a rule is not something that can be called
class CallbackTypeError
	:public runtime_error
{
public:
	CallbackTypeError( const char* format, ...) TOKMATCH_FORMAT_ATTRIBUTE(2,3);
	virtual int errorcode() const;
};

}//namespace
#endif

