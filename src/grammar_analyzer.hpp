/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Reachability and termination analysis of a grammar
/// \file "grammar_analyzer.hpp"
#ifndef _GRAUTO_GRAMMAR_ANALYZER_HPP_INCLUDED
#define _GRAUTO_GRAMMAR_ANALYZER_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "grammar.hpp"
#include "error.hpp"
#include <vector>
#include <limits>

namespace grauto {

/// \brief Result of the analysis of a grammar
/// \note The depth of a derivation is the maximum number of grammar symbols pending (not yet derived) at a time
///	during a leftmost derivation, counted relative to the symbols pending after the derivation completes.
///	The depth of a nonterminal is the smallest depth over all of its finite derivations, the depth of an alternative
///	the smallest depth over all finite derivations choosing this alternative first.
class GrammarAnalysis
{
public:
	enum {Unproductive = std::numeric_limits<int>::max()};

public:
	GrammarAnalysis()
		:m_depth(),m_alternativeDepth(),m_reachable(),m_start(-1){}
	GrammarAnalysis( const GrammarAnalysis& o)
		:m_depth(o.m_depth),m_alternativeDepth(o.m_alternativeDepth),m_reachable(o.m_reachable),m_start(o.m_start){}
	GrammarAnalysis( GrammarAnalysis&& o) noexcept
		:m_depth(std::move(o.m_depth)),m_alternativeDepth(std::move(o.m_alternativeDepth))
		,m_reachable(std::move(o.m_reachable)),m_start(o.m_start){}
	GrammarAnalysis( std::vector<int>&& depth_, std::vector<std::vector<int> >&& alternativeDepth_, std::vector<bool>&& reachable_, int start_) noexcept
		:m_depth(std::move(depth_)),m_alternativeDepth(std::move(alternativeDepth_))
		,m_reachable(std::move(reachable_)),m_start(start_){}

	/// \brief Index of the start nonterminal
	int start() const noexcept							{return m_start;}
	/// \brief Evaluate if a nonterminal admits at least one finite derivation
	bool productive( int ntidx) const						{return m_depth[ ntidx] != Unproductive;}
	/// \brief Evaluate if a nonterminal is referenced directly or indirectly by the start nonterminal
	bool reachable( int ntidx) const						{return m_reachable[ ntidx];}
	/// \brief Minimal depth of a nonterminal, Unproductive if there is no finite derivation
	int depth( int ntidx) const							{return m_depth[ ntidx];}
	/// \brief Minimal depth of an alternative, Unproductive if there is no finite derivation
	int alternativeDepth( int ntidx, int altidx) const				{return m_alternativeDepth[ ntidx][ altidx];}

private:
	std::vector<int> m_depth;
	std::vector<std::vector<int> > m_alternativeDepth;
	std::vector<bool> m_reachable;
	int m_start;
};

/// \brief Analyze a grammar before building an automaton from it
/// \note Throws EmptyGrammar, UndefinedSymbol if the grammar is not closed
/// \note Throws NonTerminatingGrammar with the name of the nonterminal if the start nonterminal or a nonterminal reachable from it has no finite derivation
/// \param[in] grammar grammar to analyze
/// \param[out] warnings where to append warnings (unreachable nonterminals, duplicate alternatives)
GrammarAnalysis analyzeGrammar( const Grammar& grammar, std::vector<Error>& warnings);

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

