/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Context free grammar model (nonterminals with their alternatives)
/// \file "grammar.hpp"
#ifndef _GRAUTO_GRAMMAR_HPP_INCLUDED
#define _GRAUTO_GRAMMAR_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "error.hpp"
#include <utility>
#include <string>
#include <string_view>
#include <map>
#include <vector>

namespace grauto {

/// \brief Element of an alternative, either a terminal (literal text emitted verbatim) or a reference to a nonterminal
class Token
{
public:
	enum Type :char {Terminal, NonTerminalRef};

public:
	Token( Type type_, const std::string_view& value_)
		:m_type(type_),m_value(value_){}
	Token( const Token& o)
		:m_type(o.m_type),m_value(o.m_value){}
	Token& operator=( const Token& o)
		{m_type=o.m_type; m_value=o.m_value; return *this;}
	Token( Token&& o) noexcept
		:m_type(o.m_type),m_value(std::move(o.m_value)){}
	Token& operator=( Token&& o) noexcept
		{m_type=o.m_type; m_value=std::move(o.m_value); return *this;}

	static Token terminal( const std::string_view& text)		{return Token( Terminal, text);}
	static Token nonterminal( const std::string_view& name)		{return Token( NonTerminalRef, name);}

	Type type() const noexcept					{return m_type;}
	bool isTerminal() const noexcept				{return m_type == Terminal;}
	/// \brief Text of a terminal or name of the referenced nonterminal
	const std::string& value() const noexcept			{return m_value;}

	bool operator == (const Token& o) const noexcept		{return m_type == o.m_type && m_value == o.m_value;}
	bool operator != (const Token& o) const noexcept		{return m_type != o.m_type || m_value != o.m_value;}

	std::string tostring() const;

private:
	Type m_type;
	std::string m_value;
};

typedef std::vector<Token> Alternative;

std::string alternativeToString( const Alternative& alternative);


class Grammar
{
public:
	/// \brief All alternatives of a nonterminal in declaration order
	class Rule
	{
	public:
		Rule( const std::string_view& name_, int line_)
			:m_name(name_),m_line(line_),m_alternatives(){}
		Rule( const Rule& o)
			:m_name(o.m_name),m_line(o.m_line),m_alternatives(o.m_alternatives){}
		Rule& operator=( const Rule& o)
			{m_name=o.m_name; m_line=o.m_line; m_alternatives=o.m_alternatives; return *this;}
		Rule( Rule&& o) noexcept
			:m_name(std::move(o.m_name)),m_line(o.m_line),m_alternatives(std::move(o.m_alternatives)){}
		Rule& operator=( Rule&& o) noexcept
			{m_name=std::move(o.m_name); m_line=o.m_line; m_alternatives=std::move(o.m_alternatives); return *this;}

		const std::string& name() const noexcept			{return m_name;}
		/// \brief Line of the first definition in the source or 0 if unknown
		int line() const noexcept					{return m_line;}
		const std::vector<Alternative>& alternatives() const noexcept	{return m_alternatives;}

		void addAlternative( const Alternative& alternative)		{m_alternatives.push_back( alternative);}
		void addAlternative( Alternative&& alternative)			{m_alternatives.push_back( std::move(alternative));}

	private:
		std::string m_name;
		int m_line;
		std::vector<Alternative> m_alternatives;
	};

public:
	Grammar()
		:m_rules(),m_indexmap(),m_start(){}
	Grammar( const Grammar& o)
		:m_rules(o.m_rules),m_indexmap(o.m_indexmap),m_start(o.m_start){}
	Grammar& operator=( const Grammar& o)
		{m_rules=o.m_rules; m_indexmap=o.m_indexmap; m_start=o.m_start; return *this;}
	Grammar( Grammar&& o) noexcept
		:m_rules(std::move(o.m_rules)),m_indexmap(std::move(o.m_indexmap)),m_start(std::move(o.m_start)){}
	Grammar& operator=( Grammar&& o) noexcept
		{m_rules=std::move(o.m_rules); m_indexmap=std::move(o.m_indexmap); m_start=std::move(o.m_start); return *this;}

	/// \brief Define a nonterminal without alternatives if not defined yet
	/// \return the index of the nonterminal
	int defineNonTerminal( const std::string_view& name, int line=0);
	/// \brief Append an alternative to the list of alternatives of a nonterminal, defines the nonterminal if not defined yet
	void addAlternative( const std::string_view& name, const Alternative& alternative, int line=0);
	void addAlternative( const std::string_view& name, Alternative&& alternative, int line=0);

	void setStart( const std::string_view& name)				{m_start = name;}
	/// \brief Name of the start symbol, the first nonterminal defined if not set explicitly
	const std::string& start() const noexcept
	{
		static const std::string empty;
		return m_start.empty() ? (m_rules.empty() ? empty : m_rules[0].name()) : m_start;
	}

	const std::vector<Rule>& rules() const noexcept				{return m_rules;}
	const Rule& rule( int ntidx) const					{return m_rules[ ntidx];}
	int nofNonTerminals() const noexcept					{return m_rules.size();}

	/// \brief Get the index of a nonterminal
	/// \return the index or -1 if the nonterminal is not defined
	int nonterminalIndex( const std::string_view& name) const;

	/// \brief Check that the grammar is closed and that its start symbol is defined
	/// \note Throws EmptyGrammar if there are no rules or the start symbol is not defined
	/// \note Throws NonTerminatingGrammar for a nonterminal without alternatives
	/// \note Throws UndefinedSymbol for the first reference to an undefined nonterminal
	void check() const;

	/// \brief Get the grammar in the source format accepted by parseGrammar
	/// \note Nonterminals without alternatives are listed as comments
	std::string tostring() const;

private:
	std::vector<Rule> m_rules;
	std::map<std::string,int,std::less<> > m_indexmap;
	std::string m_start;
};

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

