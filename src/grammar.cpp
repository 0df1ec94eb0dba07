/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Context free grammar model implementation
/// \file "grammar.cpp"
#include "grammar.hpp"
#include "error.hpp"
#include "strings.hpp"
#include <string>
#include <vector>
#include <map>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

std::string Token::tostring() const
{
	return m_type == Terminal ? quoted_string( m_value) : m_value;
}

std::string grauto::alternativeToString( const Alternative& alternative)
{
	if (alternative.empty()) return "ε";
	std::string rt;
	for (auto const& tk : alternative)
	{
		if (!rt.empty()) rt.push_back( ' ');
		rt.append( tk.tostring());
	}
	return rt;
}

int Grammar::defineNonTerminal( const std::string_view& name, int line)
{
	auto ins = m_indexmap.insert( {std::string(name), (int)m_rules.size()});
	if (ins.second/*insert took place*/)
	{
		m_rules.push_back( Rule( name, line));
	}
	return ins.first->second;
}

void Grammar::addAlternative( const std::string_view& name, const Alternative& alternative, int line)
{
	m_rules[ defineNonTerminal( name, line)].addAlternative( alternative);
}

void Grammar::addAlternative( const std::string_view& name, Alternative&& alternative, int line)
{
	m_rules[ defineNonTerminal( name, line)].addAlternative( std::move( alternative));
}

int Grammar::nonterminalIndex( const std::string_view& name) const
{
	auto ni = m_indexmap.find( name);
	return ni == m_indexmap.end() ? -1 : ni->second;
}

void Grammar::check() const
{
	if (m_rules.empty())
	{
		throw Error( Error::EmptyGrammar);
	}
	if (nonterminalIndex( start()) < 0)
	{
		throw Error( Error::EmptyGrammar, start());
	}
	for (auto const& rule : m_rules)
	{
		if (rule.alternatives().empty())
		{
			throw Error( Error::NonTerminatingGrammar, rule.name(), Error::Location( rule.line()));
		}
		for (auto const& alternative : rule.alternatives())
		{
			for (auto const& tk : alternative)
			{
				if (tk.type() == Token::NonTerminalRef && nonterminalIndex( tk.value()) < 0)
				{
					throw Error( Error::UndefinedSymbol, tk.value(), Error::Location( rule.line()));
				}
			}
		}
	}
}

std::string Grammar::tostring() const
{
	std::string rt;
	if (!m_start.empty())
	{
		rt.append( string_format( "%%start %s ;\n", m_start.c_str()));
	}
	for (auto const& rule : m_rules)
	{
		if (rule.alternatives().empty())
		{
			// ... a rule without alternatives has no source representation, 'Name = ;' would define an empty alternative
			rt.append( string_format( "# %s has no alternatives\n", rule.name().c_str()));
			continue;
		}
		rt.append( rule.name());
		rt.append( " =");
		int altidx = 0;
		for (auto const& alternative : rule.alternatives())
		{
			rt.append( altidx++ ? " | " : " ");
			rt.append( alternativeToString( alternative));
		}
		rt.append( " ;\n");
	}
	return rt;
}

