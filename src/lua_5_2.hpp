/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/*
 * Functions for compatibility with Lua 5.2, the version required
*/
#ifndef _GRAUTO_LUA_5_2_HPP_INCLUDED
#define _GRAUTO_LUA_5_2_HPP_INCLUDED
#include <cmath>
#include <limits>
extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

#if LUA_VERSION_NUM < 502
#error Building grauto requires Lua 5.2 or newer
#endif

#if LUA_VERSION_NUM == 502
static inline bool lua_isinteger( lua_State *ls, int li)
{
	if (lua_type( ls, li) != LUA_TNUMBER) return false;
	double val = lua_tonumber( ls, li);
	return (val - std::floor( val) < 10*std::numeric_limits<double>::epsilon());
}
#endif
#endif
