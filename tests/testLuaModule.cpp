/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Test program for the Lua module grauto, running scripts in an embedded interpreter
/// \file "testLuaModule.cpp"

#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif

#include "error.hpp"
#include "version.hpp"
#include "utilitiesForTests.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <cstring>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

extern "C" int luaopen_grauto( lua_State* ls);

using namespace grauto;

struct LuaTest
{
	const char* title;
	const char* script;
	const char* expected;
};

static const LuaTest g_tests[] = {
	{"version",
		R"LUA(return grauto.version)LUA",
		GRAUTO_VERSION_STRING},
	{"compile",
		R"LUA(
			local automaton, warnings = grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3})
			return "states " .. automaton:nofstates() .. ", start " .. automaton:start() .. ", warnings " .. #warnings
		)LUA",
		"states 6, start 1, warnings 0"},
	{"compile json",
		R"LUA(
			local automaton = grauto.compile( '{"S": ["\'a\' S \'b\'", "\'c\'"]}', {limit=3, format="json"})
			return "states " .. automaton:nofstates() .. ", render equal " .. tostring( automaton:render() == grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3}):render())
		)LUA",
		"states 6, render equal true"},
	{"unknown format",
		R"LUA(grauto.compile( 'S = "a" ;', {format="yaml"}))LUA",
		"error 413"},
	{"tostring",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3})
			return tostring( automaton)
		)LUA",
		"{\n"
		"\tgrauto = \"" GRAUTO_VERSION_STRING "\",\n"
		"\tstart = 1,\n"
		"\tstates = {\n"
		"\t\t{ final = false, { \"a\", 2 }, { \"c\", 3 } },\n"
		"\t\t{ final = false, { \"a\", 4 }, { \"c\", 5 } },\n"
		"\t\t{ final = true },\n"
		"\t\t{ final = false, { \"c\", 6 } },\n"
		"\t\t{ final = false, { \"b\", 3 } },\n"
		"\t\t{ final = false, { \"b\", 5 } }\n"
		"\t}\n"
		"}\n"},
	{"load exported",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3})
			local loaded = grauto.automaton( load( "return " .. automaton:tostring())())
			return loaded:nofstates() .. " " .. tostring( loaded:tostring() == automaton:tostring())
		)LUA",
		"6 true"},
	{"render",
		R"LUA(
			local automaton = grauto.compile( 'S = L "z" ;\nL = | "y" L ;', {limit=3})
			return automaton:render()
		)LUA",
		"[1]\n\t\xCE\xB5 => 2\n"
		"[2]\n\t\xCE\xB5 => 3\n\t\"y\" => 2\n"
		"[3]\n\t\"z\" => 4\n"
		"[4] FINAL\n"},
	{"generate",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3})
			local valid = {c=true, acb=true, aacbb=true}
			local invalid = 0
			for seed = 1,50 do
				if not valid[ automaton:generate( seed)] then invalid = invalid + 1 end
			end
			local same = automaton:generate( 7, 10) == automaton:generate( 7, 10)
			return "invalid " .. invalid .. ", same seed " .. tostring( same)
		)LUA",
		"invalid 0, same seed true"},
	{"samples",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3})
			local valid = {c=true, acb=true, aacbb=true}
			local list = automaton:samples( 11, 25)
			local invalid = 0
			for _,sample in ipairs( list) do
				if not valid[ sample] then invalid = invalid + 1 end
			end
			return #list .. " samples, invalid " .. invalid .. ", empty list " .. #automaton:samples( 11, 0)
		)LUA",
		"25 samples, invalid 0, empty list 0"},
	{"warnings",
		R"LUA(
			local automaton, warnings = grauto.compile( 'S = "a" ;\nU = "u" ;')
			return warnings[1]
		)LUA",
		"#553 \"Unreachable nonterminal in the grammar definition\" at line 2: U"},
	{"start option",
		R"LUA(
			local automaton = grauto.compile( 'A = "a" ;\nB = "b" ;', {start="B", maxstates=10})
			return automaton:generate( 3)
		)LUA",
		"b"},
	{"undefined symbol",
		R"LUA(grauto.compile( 'S = A ;'))LUA",
		"error 552"},
	{"unknown option",
		R"LUA(grauto.compile( 'S = "a" ;', {depth=3}))LUA",
		"error 413"},
	{"source not a string",
		R"LUA(grauto.compile( {}))LUA",
		"error 407"},
	{"limit out of range",
		R"LUA(grauto.compile( 'S = "a" ;', {limit=300}))LUA",
		"error 572"},
	{"too many states",
		R"LUA(grauto.compile( 'S = "a" S "b" | "c" ;', {limit=3, maxstates=5}))LUA",
		"error 571"},
	{"incompatible version",
		R"LUA(grauto.automaton{ grauto="9.0.0", start=1, states={ {final=true} } })LUA",
		"error 449"},
	{"missing version",
		R"LUA(grauto.automaton{ start=1, states={ {final=true} } })LUA",
		"error 448"},
	{"unknown key",
		R"LUA(grauto.automaton{ grauto="0.1.0", start=1, states={ {final=true} }, foo=1 })LUA",
		"error 581"},
	{"dangling edge",
		R"LUA(grauto.automaton{ grauto="0.1.0", start=1, states={ { final=false, {"a", 2} } } })LUA",
		"error 602"},
	{"state index out of range",
		R"LUA(grauto.automaton{ grauto="0.1.0", start=1, states={ { final=true, {"a", 4294967297} } } })LUA",
		"error 582"},
	{"start index out of range",
		R"LUA(grauto.automaton{ grauto="0.1.0", start=4294967297, states={ {final=true} } })LUA",
		"error 582"},
	{"method called without automaton",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" ;')
			return automaton.render( {})
		)LUA",
		"error 596"},
	{"softlimit out of range",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" ;')
			return automaton:generate( 1, 2147483648)
		)LUA",
		"error 409"},
	{"negative seed",
		R"LUA(
			local automaton = grauto.compile( 'S = "a" ;')
			return automaton:generate( -1)
		)LUA",
		"error 409"},
	{nullptr, nullptr, nullptr}
};

static std::string runScript( lua_State* ls, const char* script)
{
	std::string rt;
	int top = lua_gettop( ls);
	if (luaL_loadbuffer( ls, script, std::strlen( script), "=test") != LUA_OK || lua_pcall( ls, 0, 1, 0) != LUA_OK)
	{
		Error err = Error::parseError( lua_tostring( ls, -1));
		rt = string_format( "error %d", (int)err.code());
	}
	else if (lua_type( ls, -1) == LUA_TSTRING)
	{
		std::size_t len;
		const char* str = lua_tolstring( ls, -1, &len);
		rt.append( str, len);
	}
	else
	{
		rt = luaL_typename( ls, -1);
	}
	lua_settop( ls, top);
	return rt;
}

int main( int argc, const char* argv[] )
{
	lua_State* ls = nullptr;
	try
	{
		bool verbose = (argc > 1 && 0==std::strcmp( argv[1], "-V"));
		std::ostringstream output;
		std::ostringstream expected;

		ls = luaL_newstate();
		if (!ls) throw Error( Error::MemoryAllocationError);
		luaL_openlibs( ls);
		luaL_requiref( ls, "grauto", luaopen_grauto, 1/*global*/);
		lua_pop( ls, 1);

		for (int ti = 0; g_tests[ ti].title; ++ti)
		{
			std::string result = runScript( ls, g_tests[ ti].script);
			if (verbose) std::cerr << "-- " << g_tests[ ti].title << ":\n" << result << std::endl;
			output << "-- " << g_tests[ ti].title << ":\n" << result << "\n";
			expected << "-- " << g_tests[ ti].title << ":\n" << g_tests[ ti].expected << "\n";
		}
		lua_close( ls);
		ls = nullptr;

		if (!checkTestOutput( "testLuaModule", output.str(), expected.str()))
		{
			return 3;
		}
		std::cerr << "OK" << std::endl;
		return 0;
	}
	catch (const grauto::Error& err)
	{
		if (ls) lua_close( ls);
		std::cerr << "ERR " << err.what() << std::endl;
		return (int)err.code();
	}
	catch (const std::runtime_error& err)
	{
		if (ls) lua_close( ls);
		std::cerr << "ERR runtime " << err.what() << std::endl;
		return 1;
	}
	catch (const std::bad_alloc&)
	{
		if (ls) lua_close( ls);
		std::cerr << "ERR out of memory" << std::endl;
		return 2;
	}
	return 0;
}

