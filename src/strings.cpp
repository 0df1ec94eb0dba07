/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Functions for building and manipulating strings
/// \file "strings.cpp"
#include "strings.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>
#include <stdexcept>
#include <new>

using namespace grauto;

struct AllocString
{
	char* ptr;

	AllocString( std::size_t len)
	{
		ptr = (char*)std::malloc( len+1);
		if (!ptr) throw std::bad_alloc();
	}
	~AllocString()
	{
		std::free( ptr);
	}
};

std::string grauto::string_format_va( const char* fmt, va_list ap)
{
	std::string rt;
	va_list ap_copy;
	va_copy( ap_copy, ap);
	char msgbuf[ 4096];
	int len = ::vsnprintf( msgbuf, sizeof(msgbuf), fmt, ap_copy);
	va_end( ap_copy);
	if (len < (int)sizeof( msgbuf))
	{
		if (len < 0) return std::string();
		rt.append( msgbuf, len);
	}
	else
	{
		AllocString msg( len);
		::vsnprintf( msg.ptr, len+1, fmt, ap);
		rt.append( msg.ptr, len);
	}
	return rt;
}

std::string grauto::string_format( const char* fmt, ...)
{
	std::string rt;
	va_list ap;
	va_start( ap, fmt);
	rt = string_format_va( fmt, ap);
	va_end( ap);
	return rt;
}

std::string grauto::quoted_string( const std::string_view& str)
{
	std::string rt;
	rt.reserve( str.size() + 2);
	rt.push_back( '"');
	for (unsigned char ch : str)
	{
		switch (ch)
		{
			case '"': rt.append( "\\\""); break;
			case '\\': rt.append( "\\\\"); break;
			case '\n': rt.append( "\\n"); break;
			case '\t': rt.append( "\\t"); break;
			case '\r': rt.append( "\\r"); break;
			default:
				if (ch < 32 || ch == 127)
				{
					char buf[ 8];
					std::snprintf( buf, sizeof(buf), "\\%03u", (unsigned int)ch);
					rt.append( buf);
				}
				else
				{
					rt.push_back( ch);
				}
		}
	}
	rt.push_back( '"');
	return rt;
}
