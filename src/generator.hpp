/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Generator of random sentences by walks through an automaton
/// \file "generator.hpp"
#ifndef _GRAUTO_GENERATOR_HPP_INCLUDED
#define _GRAUTO_GENERATOR_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "automaton.hpp"
#include <string>
#include <vector>
#include <random>

namespace grauto {

class Generator
{
public:
	enum {
		DefaultSoftLimit = 1000,	///< number of steps after which a walk heads straight to the nearest final state
		StopPercentage = 30		///< probability in percent to stop in a final state that has outgoing edges
	};

public:
	/// \brief Constructor
	/// \note Throws AutomatonCorrupted if the automaton has no states or if a state cannot reach a final state
	/// \param[in] automaton automaton to walk through (reference kept)
	/// \param[in] seed seed of the pseudo random number generator
	/// \param[in] softlimit number of steps after which only edges shortening the distance to a final state are chosen
	Generator( const Automaton& automaton, unsigned int seed, int softlimit = DefaultSoftLimit);
	Generator( const Generator& o) = delete;
	Generator( Generator&& o) = delete;

	/// \brief Perform a walk from the start state to a final state
	/// \return the concatenation of the triggers of the edges passed
	std::string next();

	/// \brief Number of edges on the shortest path from a state to a final state
	int distance( int stateidx) const noexcept		{return m_distance[ stateidx-1];}

private:
	int random( int range);

private:
	const Automaton& m_automaton;
	std::mt19937 m_rnd;
	int m_softlimit;
	std::vector<int> m_distance;
};

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

