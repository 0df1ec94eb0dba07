/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Parsing of the arguments and creating the return values for lua functions
/// \file "lua_parameter.cpp"
#include "lua_parameter.hpp"
#include "lua_5_2.hpp"
#include "automaton.hpp"
#include "error.hpp"
#include "strings.hpp"
#include <cstring>
#include <cmath>
#include <limits>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}
#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

int grauto::lua::checkNofArguments( const char* functionName, lua_State* ls, int minNofArgs, int maxNofArgs)
{
	int nn = lua_gettop( ls);
	if (nn > maxNofArgs)
	{
		throw grauto::Error( grauto::Error::TooManyArguments, grauto::string_format( "%s [%d, maximum %d]", functionName, nn, maxNofArgs));
	}
	if (nn < minNofArgs)
	{
		throw grauto::Error( grauto::Error::TooFewArguments, grauto::string_format( "%s [%d, minimum %d]", functionName, nn, minNofArgs));
	}
	return nn;
}

void grauto::lua::throwArgumentError( const char* functionName, int li, grauto::Error::Code ec)
{
	if (li >= 1)
	{
		throw grauto::Error( ec, grauto::string_format( "%s [%d]", functionName, li));
	}
	else if (functionName)
	{
		throw grauto::Error( ec, functionName);
	}
	else
	{
		throw grauto::Error( ec);
	}
}

std::string_view grauto::lua::getArgumentAsString( const char* functionName, lua_State* ls, int li)
{
	if (!grauto::lua::isArgumentType( functionName, ls, li, (1 << LUA_TSTRING)))
	{
		grauto::lua::throwArgumentError( functionName, li, grauto::Error::ExpectedStringArgument);
	}
	std::size_t len;
	const char* str = lua_tolstring( ls, li, &len);
	return std::string_view( str, len);
}

long grauto::lua::getArgumentAsInteger( const char* functionName, lua_State* ls, int li, grauto::Error::Code ec)
{
	if (!grauto::lua::isArgumentType( functionName, ls, li, (1 << LUA_TNUMBER)) || !lua_isinteger( ls, li))
	{
		grauto::lua::throwArgumentError( functionName, li, ec);
	}
	double val = lua_tonumber( ls, li);
	if (val > (double)std::numeric_limits<int>::max() || val < (double)std::numeric_limits<int>::min())
	{
		grauto::lua::throwArgumentError( functionName, li, ec);
	}
	return (long)std::floor( val + 0.5);
}

long grauto::lua::getArgumentAsCardinal( const char* functionName, lua_State* ls, int li)
{
	long rt = grauto::lua::getArgumentAsInteger( functionName, ls, li, grauto::Error::ExpectedCardinalArgument);
	if (rt <= 0) grauto::lua::throwArgumentError( functionName, li, grauto::Error::ExpectedCardinalArgument);
	return rt;
}

long grauto::lua::getArgumentAsNonNegativeInteger( const char* functionName, lua_State* ls, int li)
{
	long rt = grauto::lua::getArgumentAsInteger( functionName, ls, li, grauto::Error::ExpectedNonNegativeIntegerArgument);
	if (rt < 0) grauto::lua::throwArgumentError( functionName, li, grauto::Error::ExpectedNonNegativeIntegerArgument);
	return rt;
}

void grauto::lua::checkArgumentAsTable( const char* functionName, lua_State* ls, int li)
{
	if (!isArgumentType( functionName, ls, li, (1 << LUA_TTABLE)))
	{
		grauto::lua::throwArgumentError( functionName, li, grauto::Error::ExpectedTableArgument);
	}
}

grauto::lua::CompileOptions grauto::lua::getArgumentAsCompileOptions( const char* functionName, lua_State* ls, int li)
{
	CompileOptions rt;
	if (lua_isnil( ls, li)) return rt;

	checkArgumentAsTable( functionName, ls, li);
	int maxContinuationDepth = rt.limits.maxContinuationDepth();
	int maxStates = rt.limits.maxStates();

	lua_pushvalue( ls, li);
	lua_pushnil( ls);
	while (lua_next( ls, -2))
	{
		const char* keystr = (lua_type( ls, -2) == LUA_TSTRING) ? lua_tostring( ls, -2) : nullptr;
		int vi = lua_gettop( ls);
		if (keystr && 0==std::strcmp( keystr, "limit"))
		{
			maxContinuationDepth = getArgumentAsCardinal( functionName, ls, vi);
		}
		else if (keystr && 0==std::strcmp( keystr, "maxstates"))
		{
			maxStates = getArgumentAsCardinal( functionName, ls, vi);
		}
		else if (keystr && 0==std::strcmp( keystr, "start"))
		{
			rt.start = getArgumentAsString( functionName, ls, vi);
		}
		else if (keystr && 0==std::strcmp( keystr, "format"))
		{
			std::string_view format = getArgumentAsString( functionName, ls, vi);
			if (format == "json")
			{
				rt.json = true;
			}
			else if (format != "bnf")
			{
				throw grauto::Error( grauto::Error::ExpectedTableArgument,
							grauto::string_format( "%s [%d] unknown format %s", functionName, li, std::string( format).c_str()));
			}
		}
		else
		{
			throw grauto::Error( grauto::Error::ExpectedTableArgument,
						grauto::string_format( "%s [%d] unknown option %s", functionName, li, keystr ? keystr : "?"));
		}
		lua_pop( ls, 1);
	}
	lua_pop( ls, 1);
	rt.limits = Automaton::Limits( maxContinuationDepth, maxStates);
	return rt;
}

void grauto::lua::pushErrorList( lua_State* ls, const char* functionName, const std::vector<grauto::Error>& list)
{
	checkStack( functionName, ls, 4);
	lua_createtable( ls, list.size(), 0);
	int eidx = 0;
	for (auto const& err : list)
	{
		lua_pushstring( ls, err.what());
		lua_rawseti( ls, -2, ++eidx);
	}
}

void grauto::lua::pushStringList( lua_State* ls, const char* functionName, const std::vector<std::string>& list)
{
	checkStack( functionName, ls, 4);
	lua_createtable( ls, list.size(), 0);
	int sidx = 0;
	for (auto const& str : list)
	{
		lua_pushlstring( ls, str.c_str(), str.size());
		lua_rawseti( ls, -2, ++sidx);
	}
}

