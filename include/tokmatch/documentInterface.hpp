/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a tokenized document as input of the matcher
/// \file documentInterface.hpp
#ifndef _TOKMATCH_DOCUMENT_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_DOCUMENT_INTERFACE_HPP_INCLUDED
#include "tokmatch/tokenAttribute.hpp"
#include <cstddef>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Forward declaration
class TokenInterface;

/// \brief Interface for a tokenized document as input of the matcher
class DocumentInterface
{
public:
	/// \brief Destructor
	virtual ~DocumentInterface(){}

	/// \brief Get the number of tokens
	virtual std::size_t size() const=0;

	/// \brief Get a token
	/// \param[in] idx index of the token starting with 0
	virtual const TokenInterface& token( std::size_t idx) const=0;

	/// \brief Evaluate if the values of an attribute requiring annotation have been computed for this document
	/// \param[in] attr attribute to check
	virtual bool hasAnnotation( TokenAttribute attr) const=0;
};

}//namespace
#endif

