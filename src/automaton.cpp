/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Build of the finite automaton from a grammar
/// \file "automaton.cpp"
#include "automaton.hpp"
#include "automaton_structs.hpp"
#include "grammar.hpp"
#include "grammar_analyzer.hpp"
#include "strings.hpp"
#include "error.hpp"
#include <string>
#include <vector>
#include <map>
#include <iostream>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

namespace {

/// \brief Grammar with the alternatives encoded as sequences of key symbols and the terminals interned
class EncodedGrammar
{
public:
	explicit EncodedGrammar( const Grammar& grammar)
		:m_grammar(grammar),m_alternatives(),m_terminals(),m_terminalmap()
	{
		for (auto const& rule : grammar.rules())
		{
			m_alternatives.push_back( std::vector<std::vector<int> >());
			for (auto const& alternative : rule.alternatives())
			{
				std::vector<int> symbols;
				for (auto const& tk : alternative)
				{
					if (tk.isTerminal())
					{
						symbols.push_back( ContinuationKey::terminalSymbol( terminalIndex( tk.value())));
					}
					else
					{
						symbols.push_back( ContinuationKey::nonterminalSymbol( grammar.nonterminalIndex( tk.value())));
					}
				}
				m_alternatives.back().push_back( std::move( symbols));
			}
		}
	}

	const std::vector<std::vector<int> >& alternatives( int ntidx) const	{return m_alternatives[ ntidx];}
	const std::string& terminal( int symbol) const				{return m_terminals[ ContinuationKey::terminalIndex( symbol)];}
	const std::string& nonterminal( int symbol) const			{return m_grammar.rule( ContinuationKey::nonterminalIndex( symbol)).name();}

	std::string symbolToString( int symbol) const
	{
		return ContinuationKey::isNonTerminal( symbol) ? nonterminal( symbol) : quoted_string( terminal( symbol));
	}

	std::string keyToString( const ContinuationKey& key) const
	{
		if (key.empty()) return "ε";
		std::string rt;
		for (int symbol : key.symbols())
		{
			if (!rt.empty()) rt.push_back( ' ');
			rt.append( symbolToString( symbol));
		}
		return rt;
	}

private:
	int terminalIndex( const std::string& value)
	{
		auto ins = m_terminalmap.insert( {value, (int)m_terminals.size()});
		if (ins.second)
		{
			m_terminals.push_back( value);
		}
		return ins.first->second;
	}

private:
	const Grammar& m_grammar;
	std::vector<std::vector<std::vector<int> > > m_alternatives;
	std::vector<std::string> m_terminals;
	std::map<std::string,int> m_terminalmap;
};

/// \brief Builder of the states reachable from the start key, processed in order of their allocation
class AutomatonBuilder
{
public:
	AutomatonBuilder( const EncodedGrammar& egrammar_, const GrammarAnalysis& analysis_, const Automaton::Limits& limits_)
		:m_egrammar(egrammar_),m_analysis(analysis_),m_limits(limits_),m_keymap(),m_states(){}

	std::vector<Automaton::State> run()
	{
		int startidx = getState( ContinuationKey( std::vector<int>( 1, ContinuationKey::nonterminalSymbol( m_analysis.start()))));
		for (int stateidx = startidx; stateidx <= (int)m_keymap.size(); ++stateidx)
		{
			expandState( stateidx);
		}
		return std::move( m_states);
	}

	const ContinuationKeyMap& keymap() const noexcept
	{
		return m_keymap;
	}

private:
	int getState( const ContinuationKey& key)
	{
		auto handle = m_keymap.get( key);
		if (handle.second/*new*/)
		{
			if ((int)m_keymap.size() > m_limits.maxStates())
			{
				throw Error( Error::ComplexityMaxStates, string_format( "%d", m_limits.maxStates()));
			}
			m_states.push_back( Automaton::State());
		}
		return handle.first;
	}

	void expandState( int stateidx)
	{
		// Copy of the key, the key map content may be reallocated while new states are allocated:
		ContinuationKey key = m_keymap.content( stateidx);
		std::vector<Automaton::Edge> edges;
		bool isFinal = false;

		if (key.empty())
		{
			isFinal = true;
		}
		else if (!ContinuationKey::isNonTerminal( key.head()))
		{
			int dest = getState( key.tail());
			edges.push_back( Automaton::Edge( m_egrammar.terminal( key.head()), dest));
		}
		else
		{
			int ntidx = ContinuationKey::nonterminalIndex( key.head());
			int contdepth = key.depth() - 1;
			auto const& alternatives = m_egrammar.alternatives( ntidx);

			for (std::size_t altidx = 0; altidx < alternatives.size(); ++altidx)
			{
				int altdepth = m_analysis.alternativeDepth( ntidx, altidx);
				if (altdepth == GrammarAnalysis::Unproductive || altdepth > m_limits.maxContinuationDepth() - contdepth)
				{
					continue; // ... not derivable to the end without exceeding the depth limit
				}
				auto const& alt = alternatives[ altidx];
				if (alt.empty())
				{
					if (contdepth == 0)
					{
						isFinal = true;
					}
					else
					{
						addEdge( edges, Automaton::Edge( "", getState( key.tail())));
					}
				}
				else if (!ContinuationKey::isNonTerminal( alt[0]))
				{
					int dest = getState( key.substitute( alt, 1));
					addEdge( edges, Automaton::Edge( m_egrammar.terminal( alt[0]), dest));
				}
				else
				{
					int dest = getState( key.substitute( alt, 0));
					if (dest != stateidx)
					{
						addEdge( edges, Automaton::Edge( "", dest));
					}
				}
			}
		}
		m_states[ stateidx-1] = Automaton::State( std::move( edges), isFinal);
	}

	static void addEdge( std::vector<Automaton::Edge>& edges, Automaton::Edge&& edge)
	{
		for (auto const& ee : edges)
		{
			if (ee == edge) return;
		}
		edges.push_back( std::move( edge));
	}

private:
	const EncodedGrammar& m_egrammar;
	const GrammarAnalysis& m_analysis;
	Automaton::Limits m_limits;
	ContinuationKeyMap m_keymap;
	std::vector<Automaton::State> m_states;
};

}//anonymous namespace

static void printGrammar( const Grammar& grammar, Automaton::DebugOutput dbgout)
{
	dbgout.out() << "-- Grammar:" << std::endl;
	dbgout.out() << grammar.tostring() << std::endl;
}

static void printAnalysis( const Grammar& grammar, const GrammarAnalysis& analysis, Automaton::DebugOutput dbgout)
{
	dbgout.out() << "-- Analysis:" << std::endl;
	for (int ntidx = 0; ntidx < grammar.nofNonTerminals(); ++ntidx)
	{
		dbgout.out() << grammar.rule( ntidx).name() << ": ";
		if (analysis.productive( ntidx))
		{
			dbgout.out() << "depth " << analysis.depth( ntidx);
		}
		else
		{
			dbgout.out() << "unproductive";
		}
		if (!analysis.reachable( ntidx)) dbgout.out() << " unreachable";
		dbgout.out() << std::endl;
	}
	dbgout.out() << std::endl;
}

static void printStates( const ContinuationKeyMap& keymap, const EncodedGrammar& egrammar, Automaton::DebugOutput dbgout)
{
	dbgout.out() << "-- States:" << std::endl;
	for (int stateidx = 1; stateidx <= (int)keymap.size(); ++stateidx)
	{
		dbgout.out() << "[" << stateidx << "] " << egrammar.keyToString( keymap.content( stateidx)) << std::endl;
	}
	dbgout.out() << std::endl;
}

void Automaton::build( const Grammar& grammar, std::vector<Error>& warnings, DebugOutput dbgout, const Limits& limits)
{
	// [1] Check the limits:
	if (limits.maxContinuationDepth() < 1 || limits.maxContinuationDepth() > MaxContinuationDepth)
	{
		throw Error( Error::ComplexityMaxContinuationDepth,
				string_format( "limit %d out of range 1..%d", limits.maxContinuationDepth(), (int)MaxContinuationDepth));
	}
	if (limits.maxStates() < 1)
	{
		throw Error( Error::ComplexityMaxStates, string_format( "limit %d out of range", limits.maxStates()));
	}
	if (dbgout.enabled( DebugOutput::Grammar)) printGrammar( grammar, dbgout);

	// [2] Analyze the grammar:
	std::vector<Error> analysisWarnings;
	GrammarAnalysis analysis = analyzeGrammar( grammar, analysisWarnings);
	if (dbgout.enabled( DebugOutput::Analysis)) printAnalysis( grammar, analysis, dbgout);

	int startDepth = analysis.depth( analysis.start());
	if (startDepth > limits.maxContinuationDepth())
	{
		throw Error( Error::ComplexityMaxContinuationDepth,
				string_format( "%s needs %d, limit %d", grammar.start().c_str(), startDepth, limits.maxContinuationDepth()));
	}

	// [3] Build the states:
	EncodedGrammar egrammar( grammar);
	AutomatonBuilder builder( egrammar, analysis, limits);
	std::vector<State> states_ = builder.run();
	if (dbgout.enabled( DebugOutput::States)) printStates( builder.keymap(), egrammar, dbgout);

	Automaton result( GRAUTO_VERSION_NUMBER, 1/*start*/, std::move( states_));
	result.verify();
	if (dbgout.enabled( DebugOutput::Transitions))
	{
		dbgout.out() << "-- Transitions:" << std::endl;
		dbgout.out() << result.debugString() << std::endl;
	}

	// [4] Assign the result:
	*this = std::move( result);
	warnings.insert( warnings.end(), analysisWarnings.begin(), analysisWarnings.end());
}

void Automaton::verify() const
{
	if (m_states.empty())
	{
		if (m_start != 0) throw Error( Error::AutomatonCorrupted, string_format( "start state %d undefined", m_start));
		return;
	}
	if (m_start < 1 || m_start > nofStates())
	{
		throw Error( Error::AutomatonCorrupted, string_format( "start state %d undefined", m_start));
	}
	std::vector<bool> reached( m_states.size(), false);
	std::vector<int> stk( {m_start});
	reached[ m_start-1] = true;
	for (std::size_t stkidx = 0; stkidx < stk.size(); ++stkidx)
	{
		for (auto const& edge : state( stk[ stkidx]).edges())
		{
			if (edge.dest() < 1 || edge.dest() > nofStates())
			{
				throw Error( Error::AutomatonCorrupted,
						string_format( "edge of state %d to undefined state %d", stk[ stkidx], edge.dest()));
			}
			if (!reached[ edge.dest()-1])
			{
				reached[ edge.dest()-1] = true;
				stk.push_back( edge.dest());
			}
		}
	}
	for (std::size_t sidx = 0; sidx < reached.size(); ++sidx)
	{
		if (!reached[ sidx])
		{
			throw Error( Error::AutomatonCorrupted, string_format( "state %d unreachable", (int)sidx+1));
		}
	}
}

