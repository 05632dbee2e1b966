/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Some utility classes and funtions for the tokmatch tests
/// \file "testUtils.hpp"
#ifndef _TOKMATCH_TEST_UTILS_HPP_INCLUDED
#define _TOKMATCH_TEST_UTILS_HPP_INCLUDED
#include "tokmatch/matcher.hpp"
#include "tokmatch/match.hpp"
#include "tokmatch/document.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <iostream>

namespace tokmatch {
namespace test {

/// \brief Expected match, list terminated by an element with key NULL
struct ExpectedMatch
{
	const char* key;
	unsigned int start;
	unsigned int end;
};

/// \brief Parse a JSON literal, throws std::runtime_error on syntax errors
nlohmann::json json( const char* src);

/// \brief Create a document from words separated by single spaces
Document document( const char* text);

/// \brief Print matches as "key [start,end] 'text'" one per line
void printMatches( std::ostream& out, const std::vector<Match>& matches, const Document& doc);

/// \brief Compare matches with the expected ones (including order), throws std::runtime_error if they differ
void checkMatches( const char* testname, const std::vector<Match>& matches, const ExpectedMatch* expected);

class ZipfDistribution
{
public:
	explicit ZipfDistribution( std::size_t size, double S = 0.0);
	unsigned int random() const;

private:
	std::vector<double> m_ar;
};

/// \brief Create a document of random words "w1","w2",... with a Zipf distribution over mod different words
Document createRandomDocument( unsigned int size, unsigned int mod);

unsigned int getUintValue( const char* arg);

}} //namespace
#endif

