/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Function to load an automaton from a definition as Lua table printed by the grauto program
/// \file "lua_load_automaton.cpp"

#include "lua_load_automaton.hpp"
#include "lua_5_2.hpp"
#include "automaton.hpp"
#include "error.hpp"
#include "strings.hpp"
#include "version.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <utility>
#include <limits>
extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

/// \brief Get the integer on top of the stack as state index, throws if it does not fit into an int
static int getStateIndex( lua_State *ls, int li, const std::string& context)
{
	lua_Integer val = lua_tointeger( ls, li);
	if (val < 0 || val > std::numeric_limits<int>::max())
	{
		throw Error( Error::BadValueInGeneratedLuaTable, string_format( "%s, state index out of range", context.c_str()));
	}
	return (int)val;
}

static int parseVersionNumber( char const*& vi, char const* vstr, int maxval)
{
	if (*vi < '0' || *vi > '9') throw Error( Error::BadGrautoVersion, vstr);
	int rt = 0;
	for (; *vi >= '0' && *vi <= '9'; ++vi)
	{
		rt = rt * 10 + (*vi - '0');
		if (rt > maxval) throw Error( Error::BadGrautoVersion, vstr);
	}
	return rt;
}

static int parseVersion( char const* vstr)
{
	char const* vi = vstr;
	int major = parseVersionNumber( vi, vstr, 999);
	if (*vi++ != '.') throw Error( Error::BadGrautoVersion, vstr);
	int minor = parseVersionNumber( vi, vstr, 99);
	if (*vi++ != '.') throw Error( Error::BadGrautoVersion, vstr);
	int patch = parseVersionNumber( vi, vstr, 9999);
	if (*vi) throw Error( Error::BadGrautoVersion, vstr);
	int rt = major * 1000000 + minor * 10000 + patch;
	if (rt == 0) throw Error( Error::BadGrautoVersion, vstr);
	return rt;
}

static Automaton::Edge parseEdge( lua_State *ls, int li, int stateidx, int edgeidx)
{
	if (!lua_istable( ls, li) || lua_rawlen( ls, li) != 2)
	{
		throw Error( Error::BadValueInGeneratedLuaTable, string_format( "table 'states', state %d edge %d", stateidx, edgeidx));
	}
	lua_rawgeti( ls, li, 1);
	lua_rawgeti( ls, li, 2);
	if (lua_type( ls, -2) != LUA_TSTRING || !lua_isinteger( ls, -1))
	{
		throw Error( Error::BadValueInGeneratedLuaTable, string_format( "table 'states', state %d edge %d", stateidx, edgeidx));
	}
	std::size_t triggerlen;
	const char* triggerstr = lua_tolstring( ls, -2, &triggerlen);
	int dest = getStateIndex( ls, -1, string_format( "table 'states', state %d edge %d", stateidx, edgeidx));
	lua_pop( ls, 2);
	return Automaton::Edge( std::string( triggerstr, triggerlen), dest);
}

static Automaton::State parseState( lua_State *ls, int li, int stateidx)
{
	if (!lua_istable( ls, li))
	{
		throw Error( Error::BadValueInGeneratedLuaTable, string_format( "table 'states', state %d", stateidx));
	}
	int nofEdges = lua_rawlen( ls, li);
	bool isFinal = false;

	lua_pushnil( ls);
	while (lua_next( ls, li))
	{
		if (lua_type( ls, -2) == LUA_TSTRING && 0==std::strcmp( lua_tostring( ls, -2), "final"))
		{
			if (lua_type( ls, -1) != LUA_TBOOLEAN)
			{
				throw Error( Error::BadValueInGeneratedLuaTable, string_format( "table 'states', state %d final", stateidx));
			}
			isFinal = lua_toboolean( ls, -1);
		}
		else if (!lua_isinteger( ls, -2) || lua_tointeger( ls, -2) < 1 || lua_tointeger( ls, -2) > nofEdges)
		{
			throw Error( Error::BadKeyInGeneratedLuaTable, string_format( "table 'states', state %d", stateidx));
		}
		lua_pop( ls, 1);
	}
	std::vector<Automaton::Edge> edges;
	for (int edgeidx = 1; edgeidx <= nofEdges; ++edgeidx)
	{
		lua_rawgeti( ls, li, edgeidx);
		edges.push_back( parseEdge( ls, lua_gettop( ls), stateidx, edgeidx));
		lua_pop( ls, 1);
	}
	return Automaton::State( std::move( edges), isFinal);
}

static std::vector<Automaton::State> parseStates( lua_State *ls, int li)
{
	std::vector<Automaton::State> rt;
	int nofStates = lua_rawlen( ls, li);

	lua_pushnil( ls);
	while (lua_next( ls, li))
	{
		if (!lua_isinteger( ls, -2) || lua_tointeger( ls, -2) < 1 || lua_tointeger( ls, -2) > nofStates)
		{
			throw Error( Error::BadKeyInGeneratedLuaTable, "table 'states'");
		}
		lua_pop( ls, 1);
	}
	for (int stateidx = 1; stateidx <= nofStates; ++stateidx)
	{
		lua_rawgeti( ls, li, stateidx);
		rt.push_back( parseState( ls, lua_gettop( ls), stateidx));
		lua_pop( ls, 1);
	}
	return rt;
}

Automaton grauto::luaLoadAutomaton( lua_State *ls, int li)
{
	if (!lua_checkstack( ls, 8)) throw Error( Error::LuaStackOutOfMemory, "load automaton");
	if (!lua_istable( ls, li)) throw Error( Error::ExpectedTableArgument, "load automaton");
	li = lua_absindex( ls, li);
	int rowcnt = 0;

	int version = 0;
	int start = 0;
	bool startDefined = false;
	std::vector<Automaton::State> states;

	lua_pushnil( ls);
	while (lua_next( ls, li))
	{
		++rowcnt;
		if (lua_type( ls, -2) != LUA_TSTRING)
		{
			throw Error( Error::BadKeyInGeneratedLuaTable, string_format( "automaton definition, row %d", rowcnt));
		}
		const char* keystr = lua_tostring( ls, -2);
		if (0==std::strcmp( keystr, "grauto"))
		{
			if (lua_type( ls, -1) != LUA_TSTRING) throw Error( Error::BadGrautoVersion, "not a string");
			version = parseVersion( lua_tostring( ls, -1));
			if (version >= (GRAUTO_MAJOR_VERSION+1) * 1000000)
			{
				throw Error( Error::IncompatibleGrautoMajorVersion, lua_tostring( ls, -1));
			}
		}
		else if (0==std::strcmp( keystr, "start"))
		{
			if (!lua_isinteger( ls, -1))
			{
				throw Error( Error::BadValueInGeneratedLuaTable, string_format( "automaton definition '%s', row %d", keystr, rowcnt));
			}
			start = getStateIndex( ls, -1, string_format( "automaton definition '%s', row %d", keystr, rowcnt));
			startDefined = true;
		}
		else if (0==std::strcmp( keystr, "states"))
		{
			if (!lua_istable( ls, -1))
			{
				throw Error( Error::BadValueInGeneratedLuaTable, string_format( "automaton definition '%s', row %d", keystr, rowcnt));
			}
			states = parseStates( ls, lua_gettop( ls));
		}
		else
		{
			throw Error( Error::BadKeyInGeneratedLuaTable, string_format( "automaton definition '%s', row %d", keystr, rowcnt));
		}
		lua_pop( ls, 1);
	}
	if (version == 0)
	{
		throw Error( Error::MissingGrautoVersion);
	}
	if (!startDefined)
	{
		throw Error( Error::BadValueInGeneratedLuaTable, "automaton definition 'start' missing");
	}
	Automaton rt( version, start, std::move( states));
	rt.verify();
	return rt;
}

