/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Generator of random sentences by walks through an automaton
/// \file "generator.cpp"
#include "generator.hpp"
#include "automaton.hpp"
#include "strings.hpp"
#include "error.hpp"
#include <string>
#include <vector>
#include <limits>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

static constexpr int Unreached = std::numeric_limits<int>::max();

// Breadth first search from the final states backwards along the edges
static std::vector<int> getDistanceToFinal( const Automaton& automaton)
{
	int nofStates = automaton.nofStates();
	std::vector<std::vector<int> > predecessors( nofStates);
	std::vector<int> rt( nofStates, Unreached);
	std::vector<int> queue;

	for (int stateidx = 1; stateidx <= nofStates; ++stateidx)
	{
		auto const& st = automaton.state( stateidx);
		for (auto const& edge : st.edges())
		{
			if (edge.dest() < 1 || edge.dest() > nofStates)
			{
				throw Error( Error::AutomatonCorrupted, string_format( "edge of state %d to undefined state %d", stateidx, edge.dest()));
			}
			predecessors[ edge.dest()-1].push_back( stateidx);
		}
		if (st.isFinal())
		{
			rt[ stateidx-1] = 0;
			queue.push_back( stateidx);
		}
	}
	for (std::size_t qidx = 0; qidx < queue.size(); ++qidx)
	{
		int stateidx = queue[ qidx];
		for (int pred : predecessors[ stateidx-1])
		{
			if (rt[ pred-1] == Unreached)
			{
				rt[ pred-1] = rt[ stateidx-1] + 1;
				queue.push_back( pred);
			}
		}
	}
	for (int stateidx = 1; stateidx <= nofStates; ++stateidx)
	{
		if (rt[ stateidx-1] == Unreached)
		{
			throw Error( Error::AutomatonCorrupted, string_format( "no final state reachable from state %d", stateidx));
		}
	}
	return rt;
}

Generator::Generator( const Automaton& automaton, unsigned int seed, int softlimit)
	:m_automaton(automaton),m_rnd(seed),m_softlimit(softlimit),m_distance()
{
	if (automaton.nofStates() == 0 || automaton.start() < 1 || automaton.start() > automaton.nofStates())
	{
		throw Error( Error::AutomatonCorrupted, "no start state");
	}
	m_distance = getDistanceToFinal( automaton);
}

int Generator::random( int range)
{
	return m_rnd() % (unsigned int)range;
}

std::string Generator::next()
{
	std::string rt;
	int stateidx = m_automaton.start();
	for (int step = 0;; ++step)
	{
		auto const& st = m_automaton.state( stateidx);
		if (st.isFinal())
		{
			if (st.edges().empty() || step >= m_softlimit || random( 100) < StopPercentage) break;
		}
		const Automaton::Edge* edge = nullptr;
		if (step >= m_softlimit)
		{
			// ... only edges approaching the nearest final state
			std::vector<const Automaton::Edge*> candidates;
			for (auto const& ee : st.edges())
			{
				if (distance( ee.dest()) < distance( stateidx)) candidates.push_back( &ee);
			}
			edge = candidates[ random( candidates.size())];
		}
		else
		{
			edge = &st.edges()[ random( st.edges().size())];
		}
		rt.append( edge->trigger());
		stateidx = edge->dest();
	}
	return rt;
}

