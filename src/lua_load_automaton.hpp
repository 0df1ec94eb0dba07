/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Function to load an automaton from a definition as Lua table printed by the grauto program
/// \file "lua_load_automaton.hpp"
#ifndef _GRAUTO_LUA_LOAD_AUTOMATON_HPP_INCLUDED
#define _GRAUTO_LUA_LOAD_AUTOMATON_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "automaton.hpp"
extern "C" {
#include <lua.h>
}

namespace grauto {

/// \brief Load an automaton from a Lua table in the format of Automaton::tostring()
/// \note Throws MissingGrautoVersion, BadGrautoVersion, IncompatibleGrautoMajorVersion, BadKeyInGeneratedLuaTable, BadValueInGeneratedLuaTable or AutomatonCorrupted
Automaton luaLoadAutomaton( lua_State *ls, int li);

} //namespace
#else
#error Building grauto requires C++17
#endif
#endif

