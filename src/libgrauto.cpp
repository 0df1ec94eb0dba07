/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Exception free shared library interface for the compilation of grammars into automata
/// \file "libgrauto.cpp"
#include "grauto/automaton.hpp"
#include "automaton.hpp"
#include "grammar.hpp"
#include "grammar_parser.hpp"
#include "generator.hpp"
#include "error.hpp"
#include "strings.hpp"
#include "export.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <new>

static libgrauto::Error getLibraryError( const grauto::Error& err)
{
	return libgrauto::Error( err.code(), err.arg() ? err.arg() : "");
}

static libgrauto::Error lippincottFunction()
{
	try
	{
		throw;
	}
	catch (const grauto::Error& err)
	{
		return getLibraryError( err);
	}
	catch (const std::runtime_error& err)
	{
		return libgrauto::Error( grauto::Error::RuntimeException, err.what());
	}
	catch (const std::bad_alloc&)
	{
		return libgrauto::Error( grauto::Error::MemoryAllocationError);
	}
	catch (...)
	{
		return libgrauto::Error( grauto::Error::UnexpectedException);
	}
}

static const grauto::Automaton& getImpl( const void* impl)
{
	if (!impl) throw grauto::Error( grauto::Error::LogicError, "automaton not defined");
	return *(const grauto::Automaton*)impl;
}

static void checkStateIndex( const grauto::Automaton& automaton, int stateidx)
{
	if (stateidx < 1 || stateidx > automaton.nofStates())
	{
		throw grauto::Error( grauto::Error::LogicError, grauto::string_format( "state %d out of range", stateidx));
	}
}

DLL_PUBLIC libgrauto::Automaton::~Automaton()
{
	if (m_impl) delete (grauto::Automaton*)m_impl;
}

DLL_PUBLIC bool libgrauto::Automaton::compile(
		const std::string_view& source, std::vector<Error>& warnings, Error& error,
		int maxContinuationDepth, int maxStates, const std::string_view& start) noexcept
{
	try
	{
		grauto::Grammar grammar = grauto::parseGrammar( source);
		if (!start.empty()) grammar.setStart( start);

		std::vector<grauto::Error> buildWarnings;
		grauto::Automaton* automaton = new grauto::Automaton();
		try
		{
			automaton->build( grammar, buildWarnings, grauto::Automaton::DebugOutput(),
						grauto::Automaton::Limits( maxContinuationDepth, maxStates));
		}
		catch (...)
		{
			delete automaton;
			throw;
		}
		if (m_impl) delete (grauto::Automaton*)m_impl;
		m_impl = automaton;

		for (auto const& warning : buildWarnings)
		{
			warnings.push_back( getLibraryError( warning));
		}
		return true;
	}
	catch (...)
	{
		error = lippincottFunction();
		return false;
	}
}

DLL_PUBLIC int libgrauto::Automaton::start() const noexcept
{
	return m_impl ? ((const grauto::Automaton*)m_impl)->start() : 0;
}

DLL_PUBLIC int libgrauto::Automaton::nofStates() const noexcept
{
	return m_impl ? ((const grauto::Automaton*)m_impl)->nofStates() : 0;
}

DLL_PUBLIC bool libgrauto::Automaton::isFinal( int stateidx) const noexcept
{
	if (!m_impl) return false;
	const grauto::Automaton& automaton = *(const grauto::Automaton*)m_impl;
	if (stateidx < 1 || stateidx > automaton.nofStates()) return false;
	return automaton.state( stateidx).isFinal();
}

DLL_PUBLIC std::vector<libgrauto::Edge> libgrauto::Automaton::edges( int stateidx, Error& error) const noexcept
{
	try
	{
		const grauto::Automaton& automaton = getImpl( m_impl);
		checkStateIndex( automaton, stateidx);
		std::vector<libgrauto::Edge> rt;
		for (auto const& edge : automaton.state( stateidx).edges())
		{
			rt.push_back( libgrauto::Edge( edge.trigger(), edge.dest()));
		}
		return rt;
	}
	catch (...)
	{
		error = lippincottFunction();
		return std::vector<libgrauto::Edge>();
	}
}

DLL_PUBLIC std::string libgrauto::Automaton::tostring( Error& error) const noexcept
{
	try
	{
		return getImpl( m_impl).tostring();
	}
	catch (...)
	{
		error = lippincottFunction();
		return std::string();
	}
}

DLL_PUBLIC std::string libgrauto::Automaton::render( Error& error) const noexcept
{
	try
	{
		return getImpl( m_impl).debugString();
	}
	catch (...)
	{
		error = lippincottFunction();
		return std::string();
	}
}

DLL_PUBLIC std::vector<std::string> libgrauto::Automaton::generate( unsigned int seed, int count, Error& error) const noexcept
{
	try
	{
		grauto::Generator generator( getImpl( m_impl), seed);
		std::vector<std::string> rt;
		for (int ci = 0; ci < count; ++ci)
		{
			rt.push_back( generator.next());
		}
		return rt;
	}
	catch (...)
	{
		error = lippincottFunction();
		return std::vector<std::string>();
	}
}

