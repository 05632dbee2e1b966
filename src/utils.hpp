/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Some utility functions and type wrappers used in the implementation
/// \file utils.hpp
#ifndef _TOKMATCH_UTILS_HPP_INCLUDED
#define _TOKMATCH_UTILS_HPP_INCLUDED
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <string>

namespace tokmatch {
namespace utils {

std::string tolower( const std::string& val);
std::string toupper( const std::string& val);
bool caseInsensitiveEquals( const std::string& val1, const std::string& val2);
std::string tostring( long long val);

template <class X>
class SharedPtr
	:public boost::shared_ptr<X>
{
public:
	SharedPtr( X* ptr)
		:boost::shared_ptr<X>(ptr){}
	SharedPtr( const SharedPtr& o)
		:boost::shared_ptr<X>(o){}
	SharedPtr()
		:boost::shared_ptr<X>(){}
};

typedef boost::mutex Mutex;
typedef boost::mutex::scoped_lock ScopedLock;

}} //namespace
#endif

