/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of rule definitions and documents from JSON source
#include "tokmatch/ruleLoader.hpp"
#include "tokmatch/errors.hpp"
#include "internationalization.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>

using namespace tokmatch;

typedef nlohmann::json Json;

/// \brief Line, column and a snippet of the source at a byte position for error messages
static std::string sourcePositionInfo( const std::string& source, std::size_t pos)
{
	if (pos > source.size()) pos = source.size();
	unsigned int line = 1;
	unsigned int column = 1;
	std::string::const_iterator si = source.begin(), se = source.begin() + pos;
	for (; si != se; ++si)
	{
		if (*si == '\n')
		{
			++line;
			column = 1;
		}
		else
		{
			++column;
		}
	}
	std::size_t snippetStart = pos > 20 ? pos - 20 : 0;
	std::string snippet = source.substr( snippetStart, pos - snippetStart + 10);
	std::string::iterator ni = snippet.begin(), ne = snippet.end();
	for (; ni != ne; ++ni)
	{
		if ((unsigned char)*ni < 32) *ni = ' ';
	}
	char buf[ 64];
	std::snprintf( buf, sizeof(buf), "line %u, column %u", line, column);
	return std::string(buf) + " near '" + snippet + "'";
}

static Json parseJson( const std::string& source)
{
	try
	{
		return Json::parse( source);
	}
	catch (const Json::parse_error& err)
	{
		// byte of the parse_error is the 1-based position of the last character read
		std::size_t pos = err.byte > 0 ? err.byte - 1 : 0;
		throw InvalidPatternError( _TXT("syntax error in JSON at %s: %s"), sourcePositionInfo( source, pos).c_str(), err.what());
	}
}

static MatchCallbackReference ruleCallback( const Json& ruledef, const std::string& key, const MatchCallbackMap& handlers)
{
	Json::const_iterator ci = ruledef.find( "on_match");
	if (ci == ruledef.end() || ci->is_null())
	{
		return MatchCallbackReference();
	}
	if (!ci->is_string())
	{
		throw CallbackTypeError( _TXT("callback 'on_match' of rule '%s' is not callable: expected null or a handler name, got %s"), key.c_str(), ci->type_name());
	}
	std::string name = ci->get<std::string>();
	MatchCallbackMap::const_iterator hi = handlers.find( name);
	if (hi == handlers.end() || !hi->second.get())
	{
		throw CallbackTypeError( _TXT("callback 'on_match' of rule '%s' is not callable: no handler '%s' defined"), key.c_str(), name.c_str());
	}
	return hi->second;
}

std::size_t tokmatch::loadRules( Matcher& matcher, const std::string& source, const MatchCallbackMap& handlers)
{
	Json content = parseJson( source);
	if (!content.is_object() || content.find( "rules") == content.end())
	{
		throw InvalidPatternError( _TXT("rule source must be an object with a list of rules named 'rules'"));
	}
	const Json& rules = content[ "rules"];
	if (!rules.is_array())
	{
		throw InvalidPatternError( _TXT("'rules' must be a list, got %s"), rules.type_name());
	}
	std::size_t rt = 0;
	Json::const_iterator ri = rules.begin(), re = rules.end();
	for (; ri != re; ++ri,++rt)
	{
		if (!ri->is_object())
		{
			throw InvalidPatternError( _TXT("rule definition %u is not an object"), (unsigned int)rt);
		}
		Json::const_iterator ki = ri->find( "key");
		if (ki == ri->end() || !ki->is_string())
		{
			throw InvalidPatternError( _TXT("rule definition %u has no string 'key'"), (unsigned int)rt);
		}
		std::string key = ki->get<std::string>();
		Json::const_iterator pi = ri->find( "patterns");
		if (pi == ri->end())
		{
			throw InvalidPatternError( _TXT("rule '%s' has no 'patterns'"), key.c_str());
		}
		MatchCallbackReference callback = ruleCallback( *ri, key, handlers);
		matcher.add( key, *pi, callback);
	}
	return rt;
}

static void setTokenProperty( Token& token, const std::string& name, const Json& value, std::size_t tokenidx)
{
	std::string lname = utils::tolower( name);
	if (lname == "text") return;
	if (lname == "ws" || lname == "whitespace")
	{
		if (!value.is_string()) throw runtime_error( _TXT("token %u: '%s' must be a string"), (unsigned int)tokenidx, name.c_str());
		token.setWhitespace( value.get<std::string>());
	}
	else if (name == "_")
	{
		if (!value.is_object()) throw runtime_error( _TXT("token %u: extensions '_' must be an object"), (unsigned int)tokenidx);
		Json::const_iterator ei = value.begin(), ee = value.end();
		for (; ei != ee; ++ei)
		{
			if (ei->is_boolean())
			{
				token.setExtension( ei.key(), ei->get<bool>());
			}
			else if (ei->is_string())
			{
				token.setExtension( ei.key(), ei->get<std::string>());
			}
			else if (ei->is_number_integer())
			{
				token.setExtension( ei.key(), utils::tostring( ei->get<long long>()));
			}
			else
			{
				throw runtime_error( _TXT("token %u: unsupported type %s of extension '%s'"), (unsigned int)tokenidx, ei->type_name(), ei.key().c_str());
			}
		}
	}
	else
	{
		TokenAttribute attr;
		if (!tokenAttributeFromName( name, attr))
		{
			throw runtime_error( _TXT("token %u: unknown attribute '%s'"), (unsigned int)tokenidx, name.c_str());
		}
		if (attr == AttrIsSentStart || attr == AttrIsStop)
		{
			if (!value.is_boolean()) throw runtime_error( _TXT("token %u: '%s' must be a boolean"), (unsigned int)tokenidx, name.c_str());
			if (attr == AttrIsSentStart)
			{
				token.setSentStart( value.get<bool>());
			}
			else
			{
				token.setStop( value.get<bool>());
			}
		}
		else
		{
			if (!value.is_string()) throw runtime_error( _TXT("token %u: '%s' must be a string"), (unsigned int)tokenidx, name.c_str());
			token.setAnnotation( attr, value.get<std::string>());
		}
	}
}

Document tokmatch::loadDocumentJson( const std::string& source)
{
	Json content;
	try
	{
		content = Json::parse( source);
	}
	catch (const Json::parse_error& err)
	{
		std::size_t pos = err.byte > 0 ? err.byte - 1 : 0;
		throw runtime_error( _TXT("syntax error in JSON document at %s: %s"), sourcePositionInfo( source, pos).c_str(), err.what());
	}
	if (!content.is_array())
	{
		throw runtime_error( _TXT("JSON document must be a list of tokens"));
	}
	Document rt;
	Json::const_iterator ti = content.begin(), te = content.end();
	for (std::size_t tidx=0; ti != te; ++ti,++tidx)
	{
		if (!ti->is_object())
		{
			throw runtime_error( _TXT("token %u is not an object"), (unsigned int)tidx);
		}
		Json::const_iterator xi = ti->find( "text");
		if (xi == ti->end() || !xi->is_string())
		{
			throw runtime_error( _TXT("token %u has no string 'text'"), (unsigned int)tidx);
		}
		Token token( xi->get<std::string>());
		Json::const_iterator pi = ti->begin(), pe = ti->end();
		for (; pi != pe; ++pi)
		{
			setTokenProperty( token, pi.key(), pi.value(), tidx);
		}
		rt.addToken( token);
	}
	return rt;
}

Document tokmatch::loadDocument( const std::string& source)
{
	std::string::const_iterator si = source.begin(), se = source.end();
	for (; si != se && (unsigned char)*si <= 32; ++si){}
	if (si != se && *si == '[')
	{
		return loadDocumentJson( source);
	}
	return Document::fromText( source);
}

