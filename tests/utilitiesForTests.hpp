/*
  Copyright (c) 2020 Patrick P. Frey

  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Some utilities for the grauto test programs
/// \file "utilitiesForTests.hpp"
#ifndef _GRAUTO_UTILITIES_FOR_TESTS_HPP_INCLUDED
#define _GRAUTO_UTILITIES_FOR_TESTS_HPP_INCLUDED

#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif

#include "strings.hpp"
#include "fileio.hpp"
#include <string>
#include <iostream>
#include <cstdio>
#include <cstring>
#include <stdexcept>

/// \brief Compare the output of a test with the expected output, write both to the working directory if they differ
/// \return true if equal
inline bool checkTestOutput( const char* testname, const std::string& output, const std::string& expected)
{
	std::string outfile = grauto::string_format( "%s.out", testname);
	std::string expfile = grauto::string_format( "%s.exp", testname);
	if (output != expected)
	{
		grauto::writeFile( outfile, output);
		grauto::writeFile( expfile, expected);
		std::cerr << "ERR test output differs expected (diff " << outfile << " " << expfile << ")" << std::endl;
		return false;
	}
	else
	{
		grauto::removeFile( outfile);
		grauto::removeFile( expfile);
		return true;
	}
}

#endif

