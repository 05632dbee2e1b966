/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of rule definitions and documents from JSON source
/// \file ruleLoader.hpp
#ifndef _TOKMATCH_RULE_LOADER_HPP_INCLUDED
#define _TOKMATCH_RULE_LOADER_HPP_INCLUDED
#include "tokmatch/matcher.hpp"
#include "tokmatch/matchCallbackInterface.hpp"
#include "tokmatch/document.hpp"
#include <string>
#include <map>

/// \brief tokmatch toplevel namespace
namespace tokmatch
{

/// \brief Map of callback names used in rule definitions to callbacks
typedef std::map<std::string,MatchCallbackReference> MatchCallbackMap;

/// \brief Load rule definitions into a matcher
/// \param[in,out] matcher where to add the rules
/// \param[in] source JSON source of the form {"rules":[{"key":K,"patterns":[[...]],"on_match":null|name}]}
/// \param[in] handlers callbacks addressed by name in "on_match"
/// \return the number of rule definitions loaded
/// \note Throws InvalidPatternError for syntax errors (with line and column) and invalid patterns, CallbackTypeError for illegal "on_match" values
/// \note Rules are added one by one, the rules before the erroneous one stay defined
std::size_t loadRules( Matcher& matcher, const std::string& source, const MatchCallbackMap& handlers=MatchCallbackMap());

/// \brief Load a document from its JSON representation, a list of token objects like {"text":"walks","ws":" ","lemma":"walk","pos":"VERB"}
/// \note Throws tokmatch::runtime_error if the source is not valid
Document loadDocumentJson( const std::string& source);

/// \brief Load a document from a JSON representation if the source starts with '[', otherwise from text split by whitespace
Document loadDocument( const std::string& source);

}//namespace
#endif

