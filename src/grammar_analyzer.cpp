/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Reachability and termination analysis of a grammar
/// \file "grammar_analyzer.cpp"
#include "grammar_analyzer.hpp"
#include "grammar.hpp"
#include "error.hpp"
#include "strings.hpp"
#include <vector>
#include <string>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

/// \brief Alternative with the nonterminals replaced by their index and the terminals by -1
typedef std::vector<int> AlternativeRefs;

static std::vector<std::vector<AlternativeRefs> > getAlternativeRefs( const Grammar& grammar)
{
	std::vector<std::vector<AlternativeRefs> > rt;
	for (auto const& rule : grammar.rules())
	{
		rt.push_back( std::vector<AlternativeRefs>());
		for (auto const& alternative : rule.alternatives())
		{
			AlternativeRefs refs;
			for (auto const& tk : alternative)
			{
				refs.push_back( tk.isTerminal() ? -1 : grammar.nonterminalIndex( tk.value()));
			}
			rt.back().push_back( std::move( refs));
		}
	}
	return rt;
}

// The symbols pending when the alternative is selected are the symbols after the first one (they are the tail of a
// state key with a terminal head) or all symbols if the first one is a nonterminal. Each nonterminal at position ii
// contributes its own depth added to the number of symbols following it.
static int getAlternativeDepth( const AlternativeRefs& refs, const std::vector<int>& depth)
{
	int rt = 0;
	int kk = refs.size();
	for (int ii = 0; ii < kk; ++ii)
	{
		if (refs[ ii] < 0)
		{
			if (ii > 0 && kk - ii > rt) rt = kk - ii;
		}
		else
		{
			int dd = depth[ refs[ ii]];
			if (dd == GrammarAnalysis::Unproductive) return GrammarAnalysis::Unproductive;
			if (kk - 1 - ii + dd > rt) rt = kk - 1 - ii + dd;
		}
	}
	return rt;
}

static std::vector<int> getNonTerminalDepths( const std::vector<std::vector<AlternativeRefs> >& refs)
{
	std::vector<int> rt( refs.size(), GrammarAnalysis::Unproductive);
	bool changed = true;
	while (changed)
	{
		changed = false;
		for (std::size_t ntidx = 0; ntidx < refs.size(); ++ntidx)
		{
			for (auto const& alt : refs[ ntidx])
			{
				int dd = getAlternativeDepth( alt, rt);
				if (dd == GrammarAnalysis::Unproductive) continue;
				if (dd < 1) dd = 1; // ... the key of the nonterminal itself is pending
				if (dd < rt[ ntidx])
				{
					rt[ ntidx] = dd;
					changed = true;
				}
			}
		}
	}
	return rt;
}

static std::vector<bool> getReachableNonTerminals( const std::vector<std::vector<AlternativeRefs> >& refs, int start)
{
	std::vector<bool> rt( refs.size(), false);
	std::vector<int> ntstk( {start});
	rt[ start] = true;

	for (std::size_t stkidx = 0; stkidx < ntstk.size(); ++stkidx)
	{
		for (auto const& alt : refs[ ntstk[ stkidx]])
		{
			for (int ref : alt)
			{
				if (ref >= 0 && !rt[ ref])
				{
					rt[ ref] = true;
					ntstk.push_back( ref);
				}
			}
		}
	}
	return rt;
}

static void checkDuplicateAlternatives( const Grammar& grammar, std::vector<Error>& warnings)
{
	for (auto const& rule : grammar.rules())
	{
		auto const& alternatives = rule.alternatives();
		for (std::size_t ai = 0; ai < alternatives.size(); ++ai)
		{
			for (std::size_t aj = 0; aj < ai; ++aj)
			{
				if (alternatives[ ai] == alternatives[ aj])
				{
					warnings.push_back( Error( Error::DuplicateAlternativeInGrammarDef,
						string_format( "%s = %s", rule.name().c_str(), alternativeToString( alternatives[ ai]).c_str()),
						Error::Location( rule.line())));
					break;
				}
			}
		}
	}
}

GrammarAnalysis grauto::analyzeGrammar( const Grammar& grammar, std::vector<Error>& warnings)
{
	// [1] Check closure:
	grammar.check();
	int start = grammar.nonterminalIndex( grammar.start());

	// [2] Calculate productive nonterminals with their minimal depth and the reachable nonterminals:
	std::vector<std::vector<AlternativeRefs> > refs = getAlternativeRefs( grammar);
	std::vector<int> depth = getNonTerminalDepths( refs);
	std::vector<bool> reachable = getReachableNonTerminals( refs, start);

	std::vector<std::vector<int> > alternativeDepth;
	for (auto const& altrefs : refs)
	{
		alternativeDepth.push_back( std::vector<int>());
		for (auto const& alt : altrefs)
		{
			alternativeDepth.back().push_back( getAlternativeDepth( alt, depth));
		}
	}

	// [3] Reject nonterminating grammars, report unreachable nonterminals:
	if (depth[ start] == GrammarAnalysis::Unproductive)
	{
		throw Error( Error::NonTerminatingGrammar, grammar.start(), Error::Location( grammar.rule( start).line()));
	}
	for (int ntidx = 0; ntidx < grammar.nofNonTerminals(); ++ntidx)
	{
		auto const& rule = grammar.rule( ntidx);
		if (reachable[ ntidx])
		{
			if (depth[ ntidx] == GrammarAnalysis::Unproductive)
			{
				throw Error( Error::NonTerminatingGrammar, rule.name(), Error::Location( rule.line()));
			}
		}
		else
		{
			warnings.push_back( Error( Error::UnreachableNonTerminalInGrammarDef, rule.name(), Error::Location( rule.line())));
		}
	}
	checkDuplicateAlternatives( grammar, warnings);

	return GrammarAnalysis( std::move( depth), std::move( alternativeDepth), std::move( reachable), start);
}

