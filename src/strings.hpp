/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Functions for building and manipulating strings
/// \file "strings.hpp"
#ifndef _GRAUTO_STRINGS_HPP_INCLUDED
#define _GRAUTO_STRINGS_HPP_INCLUDED
#if __cplusplus >= 201703L
#include <string>
#include <string_view>
#include <cstdarg>

namespace grauto {

std::string string_format_va( const char* fmt, va_list ap);

#ifdef __GNUC__
std::string string_format( const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
#else
std::string string_format( const char* fmt, ...);
#endif

/// \brief Get a string as it is written as double quoted literal in a grammar or a Lua source
/// \note Quotes, backslashes and non printable characters are escaped, characters >= 128 are left as they are (UTF-8)
std::string quoted_string( const std::string_view& str);

}//namespace

#else
#error Building grauto requires C++17
#endif
#endif
