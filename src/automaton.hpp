/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Finite automaton built from a context free grammar for the generation of sentences
/// \file "automaton.hpp"
#ifndef _GRAUTO_AUTOMATON_HPP_INCLUDED
#define _GRAUTO_AUTOMATON_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "error.hpp"
#include "grammar.hpp"
#include "version.hpp"
#include <utility>
#include <string>
#include <vector>
#include <iostream>

namespace grauto {

class Automaton
{
public:
	enum {
		DefaultMaxContinuationDepth = 10,
		MaxContinuationDepth = 256,
		DefaultMaxStates = 1<<20
	};

public:
	/// \brief Debug output partially enabled by flags
	class DebugOutput
	{
	public:
		DebugOutput( std::ostream& out_ = std::cerr) noexcept
			:m_enabledMask(0),m_out(out_){}
		DebugOutput( const DebugOutput& o) noexcept
			:m_enabledMask(o.m_enabledMask),m_out(o.m_out){}

		enum Type {None=0x0, Grammar=0x1, Analysis=0x2, States=0x4, Transitions=0x8, All=0xFF};

		DebugOutput& enable( Type type_) noexcept	{m_enabledMask |= (int)(type_); return *this;}
		bool enabled( Type type_) const noexcept	{return (m_enabledMask & (int)(type_)) == (int)(type_);}
		bool enabled() const noexcept			{return m_enabledMask != 0;}

		std::ostream& out() const noexcept		{return m_out;}

	private:
		int m_enabledMask;
		std::ostream& m_out;
	};

	/// \brief Limits for the build of an automaton
	class Limits
	{
	public:
		Limits( int maxContinuationDepth_ = DefaultMaxContinuationDepth, int maxStates_ = DefaultMaxStates) noexcept
			:m_maxContinuationDepth(maxContinuationDepth_),m_maxStates(maxStates_){}
		Limits( const Limits& o) noexcept
			:m_maxContinuationDepth(o.m_maxContinuationDepth),m_maxStates(o.m_maxStates){}
		Limits& operator=( const Limits& o) noexcept
			{m_maxContinuationDepth=o.m_maxContinuationDepth; m_maxStates=o.m_maxStates; return *this;}

		/// \brief Maximum number of grammar symbols still to derive in a state
		int maxContinuationDepth() const noexcept	{return m_maxContinuationDepth;}
		/// \brief Maximum number of states of the automaton
		int maxStates() const noexcept			{return m_maxStates;}

	private:
		int m_maxContinuationDepth;
		int m_maxStates;
	};

	/// \brief Transition consuming a trigger (the text emitted) leading to a destination state
	class Edge
	{
	public:
		Edge( const std::string& trigger_, int dest_)
			:m_trigger(trigger_),m_dest(dest_){}
		Edge( std::string&& trigger_, int dest_) noexcept
			:m_trigger(std::move(trigger_)),m_dest(dest_){}
		Edge( const Edge& o)
			:m_trigger(o.m_trigger),m_dest(o.m_dest){}
		Edge& operator=( const Edge& o)
			{m_trigger=o.m_trigger; m_dest=o.m_dest; return *this;}
		Edge( Edge&& o) noexcept
			:m_trigger(std::move(o.m_trigger)),m_dest(o.m_dest){}
		Edge& operator=( Edge&& o) noexcept
			{m_trigger=std::move(o.m_trigger); m_dest=o.m_dest; return *this;}

		const std::string& trigger() const noexcept		{return m_trigger;}
		int dest() const noexcept				{return m_dest;}

		bool operator == (const Edge& o) const noexcept		{return m_dest == o.m_dest && m_trigger == o.m_trigger;}
		bool operator != (const Edge& o) const noexcept		{return m_dest != o.m_dest || m_trigger != o.m_trigger;}

	private:
		std::string m_trigger;
		int m_dest;
	};

	class State
	{
	public:
		State() noexcept
			:m_edges(),m_final(false){}
		State( const std::vector<Edge>& edges_, bool final_)
			:m_edges(edges_),m_final(final_){}
		State( std::vector<Edge>&& edges_, bool final_) noexcept
			:m_edges(std::move(edges_)),m_final(final_){}
		State( const State& o)
			:m_edges(o.m_edges),m_final(o.m_final){}
		State& operator=( const State& o)
			{m_edges=o.m_edges; m_final=o.m_final; return *this;}
		State( State&& o) noexcept
			:m_edges(std::move(o.m_edges)),m_final(o.m_final){}
		State& operator=( State&& o) noexcept
			{m_edges=std::move(o.m_edges); m_final=o.m_final; return *this;}

		const std::vector<Edge>& edges() const noexcept		{return m_edges;}
		/// \brief True if a walk may stop in this state
		bool isFinal() const noexcept				{return m_final;}

		bool operator == (const State& o) const noexcept	{return m_final == o.m_final && m_edges == o.m_edges;}
		bool operator != (const State& o) const noexcept	{return !operator==( o);}

	private:
		std::vector<Edge> m_edges;
		bool m_final;
	};

public:
	Automaton()
		:m_version(GRAUTO_VERSION_NUMBER),m_start(0),m_states(){}
	Automaton( const Automaton& o)
		:m_version(o.m_version),m_start(o.m_start),m_states(o.m_states){}
	Automaton& operator=( const Automaton& o)
		{m_version=o.m_version; m_start=o.m_start; m_states=o.m_states; return *this;}
	Automaton( Automaton&& o) noexcept
		:m_version(o.m_version),m_start(o.m_start),m_states(std::move(o.m_states)){}
	Automaton& operator=( Automaton&& o) noexcept
		{m_version=o.m_version; m_start=o.m_start; m_states=std::move(o.m_states); return *this;}
	Automaton( int version_, int start_, const std::vector<State>& states_)
		:m_version(version_),m_start(start_),m_states(states_){}
	Automaton( int version_, int start_, std::vector<State>&& states_) noexcept
		:m_version(version_),m_start(start_),m_states(std::move(states_)){}

	/// \brief Build the automaton from a grammar
	/// \note The automaton is left untouched if the build fails
	/// \param[in] grammar the grammar (closure checked by the build)
	/// \param[out] warnings where to append warnings
	/// \param[in] dbgout debug output
	/// \param[in] limits limits of the build
	void build( const Grammar& grammar, std::vector<Error>& warnings, DebugOutput dbgout = DebugOutput(), const Limits& limits = Limits());

	int version() const noexcept						{return m_version;}
	/// \brief Identifier of the start state, states are numbered from 1 to nofStates()
	int start() const noexcept						{return m_start;}
	const State& state( int stateidx) const					{return m_states[ stateidx-1];}
	const std::vector<State>& states() const noexcept			{return m_states;}
	int nofStates() const noexcept						{return m_states.size();}

	/// \brief Check the structural invariants (no dangling edge destinations, all states reachable from the start state)
	/// \note Throws AutomatonCorrupted if an invariant is violated
	void verify() const;

	/// \brief Get the automaton serialized as Lua table
	std::string tostring() const;
	/// \brief Get a human readable listing of the automaton
	std::string debugString() const;

	bool operator == (const Automaton& o) const noexcept			{return m_start == o.m_start && m_states == o.m_states;}
	bool operator != (const Automaton& o) const noexcept			{return !operator==( o);}

private:
	int m_version;
	int m_start;
	std::vector<State> m_states;
};

}//namespace

#else
#error Building grauto requires C++17
#endif
#endif

