/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Closed set of token attributes addressable in patterns
#include "tokmatch/tokenAttribute.hpp"
#include "utils.hpp"

using namespace tokmatch;

static const char* g_attributeNames[ NofTokenAttributes] = {
	"TEXT","LOWER","LEMMA","NORM","POS","TAG","DEP","MORPH","SHAPE","PREFIX","SUFFIX","LENGTH",
	"ENT_TYPE","ENT_IOB","ENT_ID","ENT_KB_ID","LANG",
	"IS_ALPHA","IS_ASCII","IS_DIGIT","IS_LOWER","IS_UPPER","IS_TITLE","IS_PUNCT","IS_SPACE",
	"IS_BRACKET","IS_QUOTE","IS_LEFT_PUNCT","IS_RIGHT_PUNCT","IS_CURRENCY","IS_STOP","IS_SENT_START",
	"LIKE_NUM","LIKE_URL","LIKE_EMAIL","REGEX","_"
};

const char* tokmatch::tokenAttributeName( TokenAttribute attr)
{
	if ((int)attr < 0 || (int)attr >= NofTokenAttributes) return 0;
	return g_attributeNames[ attr];
}

bool tokmatch::tokenAttributeFromName( const std::string& name_, TokenAttribute& attr)
{
	std::string name = utils::toupper( name_);
	if (name == "ORTH")
	{
		attr = AttrText;
		return true;
	}
	if (name == "SENT_START")
	{
		attr = AttrIsSentStart;
		return true;
	}
	for (int ai=0; ai < (int)AttrExtension; ++ai)
	{
		if (name == g_attributeNames[ ai])
		{
			attr = (TokenAttribute)ai;
			return true;
		}
	}
	return false;
}

bool tokmatch::tokenAttributeRequiresAnnotation( TokenAttribute attr)
{
	switch (attr)
	{
		case AttrLemma:
		case AttrPos:
		case AttrTag:
		case AttrDep:
		case AttrMorph:
			return true;
		default:
			return false;
	}
}

