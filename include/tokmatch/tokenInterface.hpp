/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for reading attributes of a token
/// \file tokenInterface.hpp
#ifndef _TOKMATCH_TOKEN_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_TOKEN_INTERFACE_HPP_INCLUDED
#include "tokmatch/tokenAttribute.hpp"
#include <string>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Interface for reading attributes of a token
class TokenInterface
{
public:
	/// \brief Destructor
	virtual ~TokenInterface(){}

	/// \brief Get the value of a built-in attribute
	/// \param[in] attr the attribute (AttrRegex and AttrExtension are not addressed here)
	/// \return the value, booleans as "True" or "False", numbers as decimal
	virtual std::string attribute( TokenAttribute attr) const=0;

	/// \brief Get the value of an extension attribute
	/// \param[in] name name of the extension
	/// \return the value, empty if not defined
	virtual std::string extension( const std::string& name) const=0;

	/// \brief Get the whitespace following the token in the original text
	virtual std::string whitespace() const=0;
};

}//namespace
#endif

