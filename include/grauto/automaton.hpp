/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Exception free shared library interface for the compilation of grammars into automata
/// \note This interface is intended for users that want to use grauto in a C++ context without the Lua module or the program
/// \file "grauto/automaton.hpp"
#ifndef _GRAUTO_LIBGRAUTO_AUTOMATON_HPP_INCLUDED
#define _GRAUTO_LIBGRAUTO_AUTOMATON_HPP_INCLUDED
#include <string_view>
#include <string>
#include <vector>
#include <utility>

namespace libgrauto {

class Error
{
public:
	Error() noexcept :m_code(0),m_arg(){}
	Error( const Error& o) = default;
	Error( Error&& o) noexcept = default;
	Error& operator=( const Error& o) = default;
	Error& operator=( Error&& o) = default;

	explicit Error( int code_, std::string arg_="") noexcept :m_code(code_),m_arg(std::move(arg_)){}

	int code() const noexcept 			{return m_code;}
	const std::string& arg() const noexcept 	{return m_arg;}

private:
	int m_code;
	std::string m_arg;
};

class Edge
{
public:
	Edge( std::string trigger_, int dest_) :m_trigger(std::move(trigger_)),m_dest(dest_){}
	Edge( const Edge& o) = default;
	Edge( Edge&& o) noexcept = default;

	/// \brief Text emitted when passing the edge, empty for a transition without output
	const std::string& trigger() const noexcept	{return m_trigger;}
	int dest() const noexcept			{return m_dest;}

private:
	std::string m_trigger;
	int m_dest;
};

class Automaton
{
public:
	enum {
		DefaultMaxContinuationDepth = 10,
		DefaultMaxStates = 1<<20
	};

public:
	Automaton() :m_impl(nullptr){}
	Automaton( const Automaton& o) = delete;
	Automaton( Automaton&& o) noexcept :m_impl(o.m_impl) {o.m_impl = nullptr;}
	~Automaton();

	/// \brief Compile a grammar in source form into the automaton
	/// \param[in] source grammar source
	/// \param[out] warnings where to append the warnings of the compilation
	/// \param[out] error error in case of failure
	/// \param[in] maxContinuationDepth maximum number of grammar symbols pending in a state
	/// \param[in] maxStates maximum number of states
	/// \param[in] start start symbol overriding the one declared in the source if not empty
	/// \return true on success, false on failure
	bool compile( const std::string_view& source, std::vector<Error>& warnings, Error& error,
			int maxContinuationDepth = DefaultMaxContinuationDepth, int maxStates = DefaultMaxStates,
			const std::string_view& start = "") noexcept;

	bool defined() const noexcept			{return m_impl;}
	/// \brief Start state, 0 if the automaton is not defined
	int start() const noexcept;
	/// \brief Number of states, states are numbered from 1 to nofStates()
	int nofStates() const noexcept;
	bool isFinal( int stateidx) const noexcept;
	std::vector<Edge> edges( int stateidx, Error& error) const noexcept;

	/// \brief Get the automaton serialized as Lua table
	std::string tostring( Error& error) const noexcept;
	/// \brief Get a human readable listing of the automaton
	std::string render( Error& error) const noexcept;
	/// \brief Generate sentences by random walks
	std::vector<std::string> generate( unsigned int seed, int count, Error& error) const noexcept;

private:
	void* m_impl;
};

}//namespace
#endif
