/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Export of an automaton through an encoder
/// \file "automaton_export.cpp"
#include "automaton_export.hpp"
#include "automaton.hpp"
#include "strings.hpp"
#include "version.hpp"
#include <string>
#include <sstream>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

std::string grauto::exportAutomaton( const Automaton& automaton, AutomatonEncoder& encoder)
{
	encoder.begin( automaton.version(), automaton.start(), automaton.nofStates());
	for (int stateidx = 1; stateidx <= automaton.nofStates(); ++stateidx)
	{
		auto const& st = automaton.state( stateidx);
		encoder.state( stateidx, st.isFinal());
		for (auto const& edge : st.edges())
		{
			encoder.edge( edge.trigger(), edge.dest());
		}
	}
	return encoder.end();
}

static std::string versionString( int version)
{
	return string_format( "%d.%d.%d", version / 1000000, (version / 10000) % 100, version % 10000);
}

void LuaTableEncoder::begin( int version, int start, int)
{
	m_out.str( "");
	m_nofStates = 0;
	m_nofEdges = 0;
	m_out << "{\n\tgrauto = " << quoted_string( versionString( version)) << ",\n";
	m_out << "\tstart = " << start << ",\n";
	m_out << "\tstates = {";
}

void LuaTableEncoder::closeState()
{
	if (m_nofStates) m_out << " }";
}

void LuaTableEncoder::state( int, bool isFinal)
{
	closeState();
	m_out << (m_nofStates ? ",\n\t\t{ " : "\n\t\t{ ") << "final = " << (isFinal ? "true" : "false");
	++m_nofStates;
	m_nofEdges = 0;
}

void LuaTableEncoder::edge( const std::string& trigger, int dest)
{
	m_out << ", { " << quoted_string( trigger) << ", " << dest << " }";
	++m_nofEdges;
}

std::string LuaTableEncoder::end()
{
	closeState();
	m_out << (m_nofStates ? "\n\t}\n}\n" : "}\n}\n");
	return m_out.str();
}

