/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief UTF-8 decoding and encoding and some character classification needed for lexical token attributes
#include "unicodeUtils.hpp"
#include "textwolf/charset.hpp"
#include "textwolf/sourceiterator.hpp"
#include "textwolf/textscanner.hpp"
#include "textwolf/cstringiterator.hpp"
#include "textwolf/staticbuffer.hpp"

using namespace tokmatch;

std::vector<CodePoint> tokmatch::utf8Decode( const std::string& src)
{
	typedef textwolf::TextScanner<textwolf::SrcIterator,textwolf::charset::UTF8> TextScanner;
	textwolf::charset::UTF8 utf8;
	textwolf::SrcIterator srcitr( src.c_str(), src.size(), 0);
	TextScanner itr( utf8, srcitr);
	textwolf::UChar ch;

	std::vector<CodePoint> rt;
	rt.reserve( src.size());
	while ((ch = *itr) != 0)
	{
		++itr;
		rt.push_back( ch);
	}
	return rt;
}

std::string tokmatch::utf8Encode( const std::vector<CodePoint>& chars, std::size_t start, std::size_t end)
{
	textwolf::charset::UTF8 utf8;
	std::string rt;
	if (end > chars.size()) end = chars.size();
	for (std::size_t ci = start; ci < end; ++ci)
	{
		char chrbuf[ 16];
		textwolf::StaticBuffer outbuf( chrbuf, sizeof(chrbuf));
		utf8.print( chars[ ci], outbuf);
		rt.append( chrbuf, outbuf.size());
	}
	return rt;
}

std::string tokmatch::utf8Encode( const std::vector<CodePoint>& chars)
{
	return utf8Encode( chars, 0, chars.size());
}

std::size_t tokmatch::utf8Length( const std::string& src)
{
	std::size_t rt = 0;
	std::string::const_iterator si = src.begin(), se = src.end();
	for (; si != se; ++si)
	{
		// count all bytes that are not UTF-8 continuation bytes
		if (((unsigned char)*si & 0xC0) != 0x80) ++rt;
	}
	return rt;
}

std::string tokmatch::utf8ToLower( const std::string& src)
{
	std::vector<CodePoint> chars = utf8Decode( src);
	std::vector<CodePoint>::iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		*ci = unicodeToLower( *ci);
	}
	return utf8Encode( chars);
}

CodePoint tokmatch::unicodeToLower( CodePoint ch)
{
	if (ch < 128)
	{
		return (ch >= 'A' && ch <= 'Z') ? (ch + 32) : ch;
	}
	if (ch >= 0xC0 && ch <= 0xDE && ch != 0xD7) return ch + 0x20;
	if (ch == 0x178) return 0xFF;
	if (ch >= 0x100 && ch <= 0x17F)
	{
		if ((ch >= 0x139 && ch <= 0x148) || (ch >= 0x179 && ch <= 0x17E))
		{
			return (ch & 1) ? (ch + 1) : ch;
		}
		if (ch == 0x130 || ch == 0x131 || ch == 0x138 || ch == 0x149 || ch == 0x17F)
		{
			return ch == 0x130 ? 'i' : ch;
		}
		return (ch & 1) ? ch : (ch + 1);
	}
	if (ch >= 0x391 && ch <= 0x3A9 && ch != 0x3A2) return ch + 0x20;
	if (ch >= 0x410 && ch <= 0x42F) return ch + 0x20;
	if (ch >= 0x400 && ch <= 0x40F) return ch + 0x50;
	if ((ch >= 0x460 && ch <= 0x481) || (ch >= 0x48A && ch <= 0x4BF))
	{
		return (ch & 1) ? ch : (ch + 1);
	}
	return ch;
}

CodePoint tokmatch::unicodeToUpper( CodePoint ch)
{
	if (ch < 128)
	{
		return (ch >= 'a' && ch <= 'z') ? (ch - 32) : ch;
	}
	if (ch >= 0xE0 && ch <= 0xFE && ch != 0xF7) return ch - 0x20;
	if (ch == 0xFF) return 0x178;
	if (ch >= 0x100 && ch <= 0x17F)
	{
		if ((ch >= 0x139 && ch <= 0x148) || (ch >= 0x179 && ch <= 0x17E))
		{
			return (ch & 1) ? ch : (ch - 1);
		}
		if (ch == 0x130 || ch == 0x131 || ch == 0x138 || ch == 0x149 || ch == 0x17F)
		{
			return ch == 0x131 ? 'I' : ch;
		}
		return (ch & 1) ? (ch - 1) : ch;
	}
	if (ch >= 0x3B1 && ch <= 0x3C9 && ch != 0x3C2) return ch - 0x20;
	if (ch == 0x3C2) return 0x3A3;
	if (ch >= 0x430 && ch <= 0x44F) return ch - 0x20;
	if (ch >= 0x450 && ch <= 0x45F) return ch - 0x50;
	if ((ch >= 0x460 && ch <= 0x481) || (ch >= 0x48A && ch <= 0x4BF))
	{
		return (ch & 1) ? (ch - 1) : ch;
	}
	return ch;
}

bool tokmatch::unicodeIsAlpha( CodePoint ch)
{
	if (ch < 128)
	{
		return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
	}
	if (ch == 0xAA || ch == 0xB5 || ch == 0xBA) return true;
	if (ch >= 0xC0 && ch <= 0x2AF) return ch != 0xD7 && ch != 0xF7;
	if (ch >= 0x386 && ch <= 0x3FF) return ch != 0x387;
	if (ch >= 0x400 && ch <= 0x52F) return ch < 0x482 || ch > 0x489;
	if (ch >= 0x531 && ch <= 0x587) return ch < 0x557 || ch > 0x560;
	if (ch >= 0x5D0 && ch <= 0x5EA) return true;
	if (ch >= 0x620 && ch <= 0x64A) return true;
	if (ch >= 0x904 && ch <= 0x939) return true;
	if (ch >= 0x1E00 && ch <= 0x1FFF) return true;
	if (ch >= 0x3041 && ch <= 0x30FF) return ch != 0x30FB;
	if (ch >= 0x4E00 && ch <= 0x9FFF) return true;
	if (ch >= 0xAC00 && ch <= 0xD7A3) return true;
	return false;
}

bool tokmatch::unicodeIsDigit( CodePoint ch)
{
	return (ch >= '0' && ch <= '9')
		|| (ch >= 0x660 && ch <= 0x669)
		|| (ch >= 0x966 && ch <= 0x96F)
		|| (ch >= 0xFF10 && ch <= 0xFF19);
}

bool tokmatch::unicodeIsSpace( CodePoint ch)
{
	if (ch < 128)
	{
		return ch == ' ' || (ch >= 9 && ch <= 13);
	}
	return ch == 0x85 || ch == 0xA0 || ch == 0x1680
		|| (ch >= 0x2000 && ch <= 0x200A)
		|| ch == 0x2028 || ch == 0x2029 || ch == 0x202F || ch == 0x205F || ch == 0x3000;
}

bool tokmatch::unicodeIsUpper( CodePoint ch)
{
	return unicodeToLower( ch) != ch || ch == 0x130;
}

bool tokmatch::unicodeIsLower( CodePoint ch)
{
	return unicodeToUpper( ch) != ch
		|| ch == 0xDF || ch == 0x131 || ch == 0x138 || ch == 0x149 || ch == 0x17F;
}

bool tokmatch::unicodeIsPunct( CodePoint ch)
{
	if (ch < 128)
	{
		switch (ch)
		{
			case '!': case '"': case '#': case '%': case '&': case '\'':
			case '(': case ')': case '*': case ',': case '-': case '.':
			case '/': case ':': case ';': case '?': case '@': case '[':
			case '\\': case ']': case '_': case '{': case '}':
				return true;
			default:
				return false;
		}
	}
	return ch == 0xA1 || ch == 0xA7 || ch == 0xAB || ch == 0xB6 || ch == 0xB7 || ch == 0xBB || ch == 0xBF
		|| (ch >= 0x2010 && ch <= 0x2027)
		|| (ch >= 0x2030 && ch <= 0x2043)
		|| (ch >= 0x2045 && ch <= 0x2051)
		|| (ch >= 0x2053 && ch <= 0x205E)
		|| ch == 0x276E || ch == 0x276F
		|| (ch >= 0x3001 && ch <= 0x3003)
		|| (ch >= 0x3008 && ch <= 0x3011);
}

bool tokmatch::unicodeIsCurrency( CodePoint ch)
{
	return ch == '$' || (ch >= 0xA2 && ch <= 0xA5) || ch == 0x58F || ch == 0x60B
		|| ch == 0x9F2 || ch == 0x9F3 || ch == 0xE3F || ch == 0x17DB
		|| (ch >= 0x20A0 && ch <= 0x20BF) || ch == 0xFDFC || ch == 0xFE69 || ch == 0xFF04
		|| ch == 0xFFE0 || ch == 0xFFE1 || ch == 0xFFE5 || ch == 0xFFE6;
}

