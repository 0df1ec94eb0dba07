/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Some internal structures used to build the automaton
/// \file "automaton_structs.hpp"
#ifndef _GRAUTO_AUTOMATON_STRUCTS_HPP_INCLUDED
#define _GRAUTO_AUTOMATON_STRUCTS_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "error.hpp"
#include <utility>
#include <string>
#include <unordered_map>
#include <vector>
#include <functional>

namespace grauto {

struct IntHash
{
	// \brief Robert Jenkins' 32 bit integer hash function
	static unsigned int jenkins32bitIntegerHash( unsigned int aa) noexcept
	{
		aa = (aa+0x7ed55d16) + (aa<<12);
		aa = (aa^0xc761c23c) ^ (aa>>19);
		aa = (aa+0x165667b1) + (aa<<5);
		aa = (aa+0xd3a2646c) ^ (aa<<9);
		aa = (aa+0xfd7046c5) + (aa<<3);
		aa = (aa^0xb55a4f09) ^ (aa>>16);
		return aa;
	}

	static std::size_t hashIntVector( const std::vector<int>& ar) noexcept
	{
		constexpr std::size_t kc = 2654435761/*Knuth's multiplicative hashing scheme*/;
		std::size_t rt = kc * ar.size();
		for (auto elem : ar)
		{
			rt += (rt << 13) + IntHash::jenkins32bitIntegerHash( ((rt >> 17) ^ rt) + elem);
		}
		return rt;
	}
};

/// \brief Key identifying a state of the automaton: the sequence of grammar symbols still to derive.
///	The head symbol is the nonterminal to expand or the terminal to emit next, the rest is the continuation.
///	The empty key represents the state with the continuation consumed.
/// \note Symbols are encoded as integers, nonterminals as negative numbers and terminals as positive numbers
class ContinuationKey
{
public:
	ContinuationKey()
		:m_symbols(){}
	explicit ContinuationKey( const std::vector<int>& symbols_)
		:m_symbols(symbols_){}
	explicit ContinuationKey( std::vector<int>&& symbols_) noexcept
		:m_symbols(std::move(symbols_)){}
	ContinuationKey( const ContinuationKey& o)
		:m_symbols(o.m_symbols){}
	ContinuationKey& operator=( const ContinuationKey& o)
		{m_symbols=o.m_symbols; return *this;}
	ContinuationKey( ContinuationKey&& o) noexcept
		:m_symbols(std::move(o.m_symbols)){}
	ContinuationKey& operator=( ContinuationKey&& o) noexcept
		{m_symbols=std::move(o.m_symbols); return *this;}

	static int nonterminalSymbol( int ntidx) noexcept			{return -(ntidx+1);}
	static int terminalSymbol( int termidx) noexcept			{return termidx+1;}
	static bool isNonTerminal( int symbol) noexcept				{return symbol < 0;}
	static int nonterminalIndex( int symbol) noexcept			{return -symbol-1;}
	static int terminalIndex( int symbol) noexcept				{return symbol-1;}

	bool empty() const noexcept						{return m_symbols.empty();}
	int head() const noexcept						{return m_symbols[0];}
	/// \brief Number of symbols still to derive
	int depth() const noexcept						{return m_symbols.size();}
	const std::vector<int>& symbols() const noexcept			{return m_symbols;}

	/// \brief Key of the continuation of this key (all symbols except the head)
	ContinuationKey tail() const
	{
		return ContinuationKey( std::vector<int>( m_symbols.begin()+1, m_symbols.end()));
	}
	/// \brief Key with the head of this key replaced by a suffix of an alternative
	ContinuationKey substitute( const std::vector<int>& alternative, std::size_t startpos) const
	{
		std::vector<int> symbols_( alternative.begin()+startpos, alternative.end());
		symbols_.insert( symbols_.end(), m_symbols.begin()+1, m_symbols.end());
		return ContinuationKey( std::move( symbols_));
	}

	bool operator == (const ContinuationKey& o) const noexcept		{return m_symbols == o.m_symbols;}
	bool operator != (const ContinuationKey& o) const noexcept		{return m_symbols != o.m_symbols;}

	std::size_t hash() const noexcept
	{
		return IntHash::hashIntVector( m_symbols);
	}

private:
	std::vector<int> m_symbols;
};

}//namespace

namespace std
{
	template<> struct hash<grauto::ContinuationKey>
	{
	public:
		hash<grauto::ContinuationKey>(){}
		std::size_t operator()( grauto::ContinuationKey const& key) const noexcept
		{
			return key.hash();
		}
	};
}

namespace grauto {

/// \brief Map of continuation keys to state handles (allocated in ascending order starting with 1)
class ContinuationKeyMap
{
public:
	ContinuationKeyMap()
		:m_map(),m_inv(){}
	ContinuationKeyMap( const ContinuationKeyMap& o) = delete;
	ContinuationKeyMap( ContinuationKeyMap&& o) = delete;

	/// \brief Get the handle assigned to a key
	/// \return the handle and true if the key is new
	std::pair<int,bool> get( const ContinuationKey& key)
	{
		auto ins = m_map.insert( {key, (int)m_inv.size()+1});
		if (ins.second/*insert took place*/)
		{
			m_inv.push_back( key);
		}
		return {ins.first->second, ins.second};
	}

	const ContinuationKey& content( int handle) const noexcept
	{
		return m_inv[ handle-1];
	}

	std::size_t size() const noexcept
	{
		return m_inv.size();
	}

private:
	std::unordered_map<ContinuationKey,int> m_map;
	std::vector<ContinuationKey> m_inv;
};

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

