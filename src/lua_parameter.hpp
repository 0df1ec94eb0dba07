/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Parsing of the arguments and creating the return values for Lua functions
/// \file "lua_parameter.hpp"
#ifndef _GRAUTO_LUA_PARAMETER_HPP_INCLUDED
#define _GRAUTO_LUA_PARAMETER_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "automaton.hpp"
#include "error.hpp"
#include <string>
#include <string_view>
#include <vector>
extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace grauto {
namespace lua {

/// \brief Options of the compilation of a grammar passed as table {limit=, maxstates=, start=, format="bnf"|"json"}
struct CompileOptions
{
	Automaton::Limits limits;
	std::string start;
	bool json;

	CompileOptions()
		:limits(),start(),json(false){}
};

int checkNofArguments( const char* functionName, lua_State* ls, int minNofArgs, int maxNofArgs);

[[noreturn]] void throwArgumentError( const char* functionName, int li, grauto::Error::Code ec);

inline bool isArgumentType( const char* functionName, lua_State* ls, int li, int luaTypeMask)
{
	return (((1U << lua_type( ls, li)) & luaTypeMask) != 0);
}

std::string_view getArgumentAsString( const char* functionName, lua_State* ls, int li);

long getArgumentAsInteger( const char* functionName, lua_State* ls, int li, grauto::Error::Code ec = grauto::Error::ExpectedIntegerArgument);

long getArgumentAsCardinal( const char* functionName, lua_State* ls, int li);

long getArgumentAsNonNegativeInteger( const char* functionName, lua_State* ls, int li);

void checkArgumentAsTable( const char* functionName, lua_State* ls, int li);

CompileOptions getArgumentAsCompileOptions( const char* functionName, lua_State* ls, int li);

inline void checkStack( const char* functionName, lua_State* ls, int sz)
{
	if (!lua_checkstack( ls, sz)) throw grauto::Error( grauto::Error::LuaStackOutOfMemory, functionName);
}

void pushErrorList( lua_State* ls, const char* functionName, const std::vector<grauto::Error>& list);
void pushStringList( lua_State* ls, const char* functionName, const std::vector<std::string>& list);

}} //namespace
#else
#error Building grauto requires C++17
#endif
#endif

