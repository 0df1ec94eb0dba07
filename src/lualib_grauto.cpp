/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Lua module grauto: compile grammars to automata, export them, generate sentences
/// \file "lualib_grauto.cpp"
#include "export.hpp"
#include "lua_load_automaton.hpp"
#include "lua_userdata.hpp"
#include "lua_parameter.hpp"
#include "automaton.hpp"
#include "generator.hpp"
#include "grammar.hpp"
#include "grammar_parser.hpp"
#include "grammar_json_parser.hpp"
#include "error.hpp"
#include "version.hpp"
#include "strings.hpp"
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <stdexcept>
#include <new>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

extern "C" int luaopen_grauto( lua_State* ls);

static grauto::Error::Location getLuaScriptErrorLocation( lua_State* ls)
{
	lua_Debug ar;
	if (!lua_getstack( ls, 1, &ar)) return grauto::Error::Location();
	lua_getinfo( ls, "Sl", &ar);
	return grauto::Error::Location( ar.short_src, ar.currentline > 0 ? ar.currentline : ar.linedefined);
}

/// \note Lippincott function: maps the exception in flight to a Lua error
static void lippincottFunction( lua_State* ls)
{
	try
	{
		throw;
	}
	catch (const grauto::Error& err)
	{
		if (err.location().line())
		{
			lua_pushstring( ls, err.what());
		}
		else
		{
			grauto::Error errWithLocation( err, getLuaScriptErrorLocation( ls));
			lua_pushstring( ls, errWithLocation.what());
		}
		lua_error( ls);
	}
	catch (const std::runtime_error& err)
	{
		grauto::Error errWithLocation( grauto::Error::RuntimeException, err.what(), getLuaScriptErrorLocation( ls));
		lua_pushstring( ls, errWithLocation.what());
		lua_error( ls);
	}
	catch (const std::bad_alloc&)
	{
		grauto::Error errWithLocation( grauto::Error::MemoryAllocationError, getLuaScriptErrorLocation( ls));
		lua_pushstring( ls, errWithLocation.what());
		lua_error( ls);
	}
	catch (...)
	{
		grauto::Error errWithLocation( grauto::Error::UnexpectedException, getLuaScriptErrorLocation( ls));
		lua_pushstring( ls, errWithLocation.what());
		lua_error( ls);
	}
}

static grauto_automaton_userdata_t* newAutomatonUserdata( lua_State* ls)
{
	grauto_automaton_userdata_t* ud = (grauto_automaton_userdata_t*)lua_newuserdata( ls, sizeof(grauto_automaton_userdata_t));
	ud->init();
	luaL_getmetatable( ls, grauto_automaton_userdata_t::metatableName());
	lua_setmetatable( ls, -2);
	return ud;
}

static grauto_automaton_userdata_t* getAutomatonUserdata( lua_State* ls, const char* functionName)
{
	grauto_automaton_userdata_t* ud = (grauto_automaton_userdata_t*)luaL_testudata( ls, 1, grauto_automaton_userdata_t::metatableName());
	if (!ud)
	{
		grauto::Error err( grauto::Error::LuaInvalidUserData, functionName, getLuaScriptErrorLocation( ls));
		luaL_error( ls, "%s", err.what());
	}
	return ud;
}

static int grauto_compile( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "grauto.compile";
	int nn = 0;
	try
	{
		nn = grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 2/*maxNofArgs*/);
		(void)grauto::lua::getArgumentAsString( functionName, ls, 1);
		grauto::lua::checkStack( functionName, ls, 6);
	}
	catch (...) { lippincottFunction( ls); }

	grauto_automaton_userdata_t* ud = newAutomatonUserdata( ls);
	try
	{
		std::string_view source = grauto::lua::getArgumentAsString( functionName, ls, 1);
		grauto::lua::CompileOptions options;
		if (nn >= 2) options = grauto::lua::getArgumentAsCompileOptions( functionName, ls, 2);

		std::vector<grauto::Error> warnings;
		grauto::Grammar grammar = options.json ? grauto::parseJsonGrammar( source) : grauto::parseGrammar( source);
		if (!options.start.empty()) grammar.setStart( options.start);
		ud->automaton.build( grammar, warnings, grauto::Automaton::DebugOutput(), options.limits);
		grauto::lua::pushErrorList( ls, functionName, warnings);
	}
	catch (...) { lippincottFunction( ls); }
	return 2;
}

static int grauto_load_automaton( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "grauto.automaton";
	try
	{
		grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 1/*maxNofArgs*/);
		grauto::lua::checkArgumentAsTable( functionName, ls, 1);
		grauto::lua::checkStack( functionName, ls, 10);
	}
	catch (...) { lippincottFunction( ls); }

	grauto_automaton_userdata_t* ud = newAutomatonUserdata( ls);
	try
	{
		ud->automaton = grauto::luaLoadAutomaton( ls, 1);
	}
	catch (...) { lippincottFunction( ls); }
	return 1;
}

static int grauto_destroy_automaton( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:__gc";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	ud->destroy( ls);
	return 0;
}

static int grauto_automaton_tostring( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:tostring";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 2/*maxNofArgs, 2 for the __tostring metamethod*/);
		grauto::lua::checkStack( functionName, ls, 4);
		std::string result = ud->automaton.tostring();
		lua_pushlstring( ls, result.c_str(), result.size());
	}
	catch (...) { lippincottFunction( ls); }
	return 1;
}

static int grauto_automaton_render( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:render";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 1/*maxNofArgs*/);
		grauto::lua::checkStack( functionName, ls, 4);
		std::string result = ud->automaton.debugString();
		lua_pushlstring( ls, result.c_str(), result.size());
	}
	catch (...) { lippincottFunction( ls); }
	return 1;
}

static int grauto_automaton_generate( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:generate( seed [,softlimit])";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		int nn = grauto::lua::checkNofArguments( functionName, ls, 2/*minNofArgs*/, 3/*maxNofArgs*/);
		long seed = grauto::lua::getArgumentAsNonNegativeInteger( functionName, ls, 2);
		long softlimit = (nn >= 3)
				? grauto::lua::getArgumentAsNonNegativeInteger( functionName, ls, 3)
				: (long)grauto::Generator::DefaultSoftLimit;
		grauto::lua::checkStack( functionName, ls, 4);

		grauto::Generator generator( ud->automaton, seed, softlimit);
		std::string result = generator.next();
		lua_pushlstring( ls, result.c_str(), result.size());
	}
	catch (...) { lippincottFunction( ls); }
	return 1;
}

static int grauto_automaton_samples( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:samples( seed, count [,softlimit])";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		int nn = grauto::lua::checkNofArguments( functionName, ls, 3/*minNofArgs*/, 4/*maxNofArgs*/);
		long seed = grauto::lua::getArgumentAsNonNegativeInteger( functionName, ls, 2);
		long count = grauto::lua::getArgumentAsNonNegativeInteger( functionName, ls, 3);
		long softlimit = (nn >= 4)
				? grauto::lua::getArgumentAsNonNegativeInteger( functionName, ls, 4)
				: (long)grauto::Generator::DefaultSoftLimit;

		grauto::Generator generator( ud->automaton, seed, softlimit);
		std::vector<std::string> result;
		result.reserve( count);
		for (long si = 0; si < count; ++si)
		{
			result.push_back( generator.next());
		}
		grauto::lua::pushStringList( ls, functionName, result);
	}
	catch (...) { lippincottFunction( ls); }
	return 1;
}

static int grauto_automaton_nofstates( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:nofstates";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 1/*maxNofArgs*/);
	}
	catch (...) { lippincottFunction( ls); }
	lua_pushinteger( ls, ud->automaton.nofStates());
	return 1;
}

static int grauto_automaton_start( lua_State* ls)
{
	[[maybe_unused]] static const char* functionName = "automaton:start";
	grauto_automaton_userdata_t* ud = getAutomatonUserdata( ls, functionName);
	try
	{
		grauto::lua::checkNofArguments( functionName, ls, 1/*minNofArgs*/, 1/*maxNofArgs*/);
	}
	catch (...) { lippincottFunction( ls); }
	lua_pushinteger( ls, ud->automaton.start());
	return 1;
}

static const struct luaL_Reg grauto_automaton_methods[] = {
	{ "__gc",		grauto_destroy_automaton },
	{ "__tostring",		grauto_automaton_tostring },
	{ "tostring",		grauto_automaton_tostring },
	{ "render",		grauto_automaton_render },
	{ "generate",		grauto_automaton_generate },
	{ "samples",		grauto_automaton_samples },
	{ "nofstates",		grauto_automaton_nofstates },
	{ "start",		grauto_automaton_start },
	{ nullptr,		nullptr }
};

static const struct luaL_Reg grauto_functions[] = {
	{ "compile",		grauto_compile },
	{ "automaton",		grauto_load_automaton },
	{ nullptr,  		nullptr }
};

static void createMetatable( lua_State* ls, const char* metatableName, const struct luaL_Reg* metatableMethods)
{
	luaL_newmetatable( ls, metatableName);
	lua_pushvalue( ls, -1);
	lua_setfield( ls, -2, "__index");
	luaL_setfuncs( ls, metatableMethods, 0);
	lua_pop( ls, 1);
}

DLL_PUBLIC int luaopen_grauto( lua_State* ls)
{
	createMetatable( ls, grauto_automaton_userdata_t::metatableName(), grauto_automaton_methods);

	luaL_newlib( ls, grauto_functions);
	lua_pushliteral( ls, GRAUTO_VERSION_STRING);
	lua_setfield( ls, -2, "version");
	return 1;
}

