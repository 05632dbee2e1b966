/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Identifier of an attribute referenced in a pattern, a built-in attribute or an extension addressed by name
/// \file "patternAttribute.hpp"
#ifndef _TOKMATCH_PATTERN_ATTRIBUTE_HPP_INCLUDED
#define _TOKMATCH_PATTERN_ATTRIBUTE_HPP_INCLUDED
#include "tokmatch/tokenAttribute.hpp"
#include <string>

namespace tokmatch {

struct PatternAttribute
{
	TokenAttribute id;
	std::string extension;

	PatternAttribute()
		:id(AttrText),extension(){}
	explicit PatternAttribute( TokenAttribute id_)
		:id(id_),extension(){}
	explicit PatternAttribute( const std::string& extension_)
		:id(AttrExtension),extension(extension_){}
	PatternAttribute( const PatternAttribute& o)
		:id(o.id),extension(o.extension){}

	bool operator < ( const PatternAttribute& o) const
	{
		if (id == o.id) return extension < o.extension;
		return id < o.id;
	}
	bool operator == ( const PatternAttribute& o) const
	{
		return id == o.id && extension == o.extension;
	}

	/// \brief Name of the attribute for messages, "_.<name>" for extensions
	std::string name() const
	{
		if (id == AttrExtension) return std::string("_.") + extension;
		return tokenAttributeName( id);
	}
};

}//namespace
#endif

