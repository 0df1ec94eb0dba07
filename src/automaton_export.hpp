/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Export of an automaton through an encoder
/// \file "automaton_export.hpp"
#ifndef _GRAUTO_AUTOMATON_EXPORT_HPP_INCLUDED
#define _GRAUTO_AUTOMATON_EXPORT_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "automaton.hpp"
#include <string>
#include <sstream>

namespace grauto {

/// \brief Interface of a serializer of an automaton
/// \note The methods are called in the order begin, then for each state ascending (state, edges in declaration order), then end
class AutomatonEncoder
{
public:
	virtual ~AutomatonEncoder(){}

	virtual void begin( int version, int start, int nofStates)=0;
	virtual void state( int stateidx, bool isFinal)=0;
	virtual void edge( const std::string& trigger, int dest)=0;
	/// \brief Finish the encoding
	/// \return the encoded automaton
	virtual std::string end()=0;
};

/// \brief Encoder of an automaton as Lua table source
class LuaTableEncoder
	:public AutomatonEncoder
{
public:
	LuaTableEncoder()
		:m_out(),m_nofEdges(0),m_nofStates(0){}

	void begin( int version, int start, int nofStates) override;
	void state( int stateidx, bool isFinal) override;
	void edge( const std::string& trigger, int dest) override;
	std::string end() override;

private:
	void closeState();

private:
	std::ostringstream m_out;
	int m_nofEdges;
	int m_nofStates;
};

/// \brief Hand an automaton to an encoder in stable order
/// \return the encoded automaton
std::string exportAutomaton( const Automaton& automaton, AutomatonEncoder& encoder);

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

