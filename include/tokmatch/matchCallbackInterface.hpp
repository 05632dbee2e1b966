/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a callback called for every match of a rule
/// \file matchCallbackInterface.hpp
#ifndef _TOKMATCH_MATCH_CALLBACK_INTERFACE_HPP_INCLUDED
#define _TOKMATCH_MATCH_CALLBACK_INTERFACE_HPP_INCLUDED
#include "tokmatch/match.hpp"
#include <boost/shared_ptr.hpp>
#include <vector>
#include <cstddef>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Forward declaration
class Matcher;
/// \brief Forward declaration
class DocumentInterface;

/// \brief Interface for a callback called for every match of the rule it is attached to
class MatchCallbackInterface
{
public:
	/// \brief Destructor
	virtual ~MatchCallbackInterface(){}

	/// \brief Called after matching for every match of the rule, in the order of the matches
	/// \param[in] matcher the matcher calling
	/// \param[in,out] document the document matched, the callback may modify it
	/// \param[in] matchidx index of the match in matches
	/// \param[in] matches all matches of the matching call
	/// \note Exceptions thrown abort the dispatching of the callbacks and are propagated to the caller of the match
	virtual void onMatch(
			const Matcher& matcher,
			DocumentInterface& document,
			std::size_t matchidx,
			const std::vector<Match>& matches)=0;
};

/// \brief Shared reference to a callback
typedef boost::shared_ptr<MatchCallbackInterface> MatchCallbackReference;

}//namespace
#endif

