/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Automaton serialization (Lua syntax) and debug listing
/// \file "automaton_tostring.cpp"
#include "automaton.hpp"
#include "automaton_export.hpp"
#include "strings.hpp"
#include "error.hpp"
#include <string>
#include <sstream>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

std::string Automaton::tostring() const
{
	LuaTableEncoder encoder;
	return exportAutomaton( *this, encoder);
}

std::string Automaton::debugString() const
{
	std::ostringstream outstream;
	int stateidx = 0;
	for (auto const& st : m_states)
	{
		++stateidx;
		outstream << "[" << stateidx << "]";
		if (st.isFinal()) outstream << " FINAL";
		outstream << "\n";
		for (auto const& edge : st.edges())
		{
			outstream << "\t" << (edge.trigger().empty() ? std::string("ε") : quoted_string( edge.trigger()))
					<< " => " << edge.dest() << "\n";
		}
	}
	return outstream.str();
}

