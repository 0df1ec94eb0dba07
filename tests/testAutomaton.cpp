/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Test program for the build of automata from grammars
/// \file "testAutomaton.cpp"

#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif

#include "automaton.hpp"
#include "grammar.hpp"
#include "grammar_parser.hpp"
#include "error.hpp"
#include "strings.hpp"
#include "version.hpp"
#include "utilitiesForTests.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace grauto;

static const char* g_centerRecursion = "S = \"a\" S \"b\" | \"c\" ;";

static std::string buildError( const char* source, const Automaton::Limits& limits)
{
	try
	{
		Automaton automaton;
		std::vector<Error> warnings;
		automaton.build( parseGrammar( source), warnings, Automaton::DebugOutput(), limits);
		return "OK";
	}
	catch (const Error& err)
	{
		return string_format( "%d [%s]", (int)err.code(), err.arg() ? err.arg() : "");
	}
}

static std::string verifyError( const Automaton& automaton)
{
	try
	{
		automaton.verify();
		return "OK";
	}
	catch (const Error& err)
	{
		return string_format( "%d [%s]", (int)err.code(), err.arg() ? err.arg() : "");
	}
}

static Automaton::State createState( bool isFinal, const char* trigger = nullptr, int dest = 0)
{
	std::vector<Automaton::Edge> edges;
	if (trigger) edges.push_back( Automaton::Edge( std::string( trigger), dest));
	return Automaton::State( std::move( edges), isFinal);
}

int main( int argc, const char* argv[] )
{
	try
	{
		bool verbose = false;
		int argi = 1;
		for (; argi < argc; ++argi)
		{
			if (0==std::strcmp( argv[argi], "-V"))
			{
				verbose = true;
			}
			if (0==std::strcmp( argv[argi], "-h"))
			{
				std::cerr << "Usage: testAutomaton [-h][-V]" << std::endl;
			}
		}
		std::ostringstream output;
		std::ostringstream expected;

		// [1] Build with all debug output enabled:
		{
			std::ostringstream dbgstream;
			Automaton::DebugOutput debugout( dbgstream);
			debugout.enable( Automaton::DebugOutput::All);
			Automaton automaton;
			std::vector<Error> warnings;
			automaton.build( parseGrammar( g_centerRecursion), warnings, debugout, Automaton::Limits( 3));
			if (verbose) std::cerr << dbgstream.str() << std::endl;

			output << dbgstream.str();
			expected
				<< "-- Grammar:\n"
				<< "S = \"a\" S \"b\" | \"c\" ;\n\n"
				<< "-- Analysis:\n"
				<< "S: depth 1\n\n"
				<< "-- States:\n"
				<< "[1] S\n"
				<< "[2] S \"b\"\n"
				<< "[3] \xCE\xB5\n"
				<< "[4] S \"b\" \"b\"\n"
				<< "[5] \"b\"\n"
				<< "[6] \"b\" \"b\"\n\n"
				<< "-- Transitions:\n"
				<< "[1]\n\t\"a\" => 2\n\t\"c\" => 3\n"
				<< "[2]\n\t\"a\" => 4\n\t\"c\" => 5\n"
				<< "[3] FINAL\n"
				<< "[4]\n\t\"c\" => 6\n"
				<< "[5]\n\t\"b\" => 3\n"
				<< "[6]\n\t\"b\" => 5\n\n";

			output << automaton.tostring();
			expected
				<< "{\n"
				<< "\tgrauto = \"" << GRAUTO_VERSION_STRING << "\",\n"
				<< "\tstart = 1,\n"
				<< "\tstates = {\n"
				<< "\t\t{ final = false, { \"a\", 2 }, { \"c\", 3 } },\n"
				<< "\t\t{ final = false, { \"a\", 4 }, { \"c\", 5 } },\n"
				<< "\t\t{ final = true },\n"
				<< "\t\t{ final = false, { \"c\", 6 } },\n"
				<< "\t\t{ final = false, { \"b\", 3 } },\n"
				<< "\t\t{ final = false, { \"b\", 5 } }\n"
				<< "\t}\n"
				<< "}\n";

			output << "warnings " << warnings.size() << ", version " << automaton.version() << "\n";
			expected << "warnings 0, version " << GRAUTO_VERSION_NUMBER << "\n";

			// A failing build leaves the automaton untouched:
			Automaton copy( automaton);
			try
			{
				automaton.build( parseGrammar( g_centerRecursion), warnings, Automaton::DebugOutput(), Automaton::Limits( 3, 5));
				output << "build with 5 states succeeded\n";
			}
			catch (const Error& err)
			{
				output << "build with 5 states failed " << (int)err.code() << "\n";
			}
			expected << "build with 5 states failed 571\n";
			output << (copy == automaton ? "untouched" : "modified") << "\n";
			expected << "untouched\n";
		}

		// [2] Default limit, the build is deterministic:
		{
			Automaton first;
			Automaton second;
			std::vector<Error> warnings;
			first.build( parseGrammar( g_centerRecursion), warnings);
			second.build( parseGrammar( g_centerRecursion), warnings);
			output << "default limit states " << first.nofStates() << "\n";
			expected << "default limit states 20\n";
			output << "deterministic " << (first == second && first.tostring() == second.tostring() ? "yes" : "no") << "\n";
			expected << "deterministic yes\n";
		}

		// [3] Empty alternatives, epsilon transitions:
		{
			Automaton automaton;
			std::vector<Error> warnings;
			automaton.build( parseGrammar( "S = L \"z\" ;\nL = | \"y\" L ;"), warnings, Automaton::DebugOutput(), Automaton::Limits( 3));
			output << automaton.debugString();
			expected
				<< "[1]\n\t\xCE\xB5 => 2\n"
				<< "[2]\n\t\xCE\xB5 => 3\n\t\"y\" => 2\n"
				<< "[3]\n\t\"z\" => 4\n"
				<< "[4] FINAL\n";

			automaton.build( parseGrammar( "S = \"x\" L ;\nL = | \"y\" L ;"), warnings, Automaton::DebugOutput(), Automaton::Limits( 3));
			output << automaton.debugString();
			expected
				<< "[1]\n\t\"x\" => 2\n"
				<< "[2] FINAL\n\t\"y\" => 2\n";
		}

		// [4] Continuation depth needed by the start symbol:
		{
			const char* nested = "S = A \"z\" ;\nA = B \"y\" ;\nB = \"x\" ;";
			Automaton automaton;
			std::vector<Error> warnings;
			automaton.build( parseGrammar( nested), warnings, Automaton::DebugOutput(), Automaton::Limits( 3));
			output << "nested states " << automaton.nofStates() << "\n";
			expected << "nested states 6\n";
			output << "nested limit 2: " << buildError( nested, Automaton::Limits( 2)) << "\n";
			expected << "nested limit 2: 572 [S needs 3, limit 2]\n";
		}

		// [5] Warnings are passed through:
		{
			Automaton automaton;
			std::vector<Error> warnings;
			automaton.build( parseGrammar( "S = \"a\" ;\nU = \"u\" ;"), warnings);
			for (auto const& warning : warnings)
			{
				output << "warning " << (int)warning.code() << " line " << warning.line() << " [" << warning.arg() << "]\n";
			}
			expected << "warning 553 line 2 [U]\n";
		}

		// [6] Limits and grammar errors:
		output << "limit 0: " << buildError( g_centerRecursion, Automaton::Limits( 0)) << "\n";
		expected << "limit 0: 572 [limit 0 out of range 1..256]\n";
		output << "limit 257: " << buildError( g_centerRecursion, Automaton::Limits( 257)) << "\n";
		expected << "limit 257: 572 [limit 257 out of range 1..256]\n";
		output << "limit 256: " << buildError( g_centerRecursion, Automaton::Limits( 256)) << "\n";
		expected << "limit 256: OK\n";
		output << "max states 0: " << buildError( g_centerRecursion, Automaton::Limits( 3, 0)) << "\n";
		expected << "max states 0: 571 [limit 0 out of range]\n";
		output << "max states 5: " << buildError( g_centerRecursion, Automaton::Limits( 3, 5)) << "\n";
		expected << "max states 5: 571 [5]\n";
		output << "max states 6: " << buildError( g_centerRecursion, Automaton::Limits( 3, 6)) << "\n";
		expected << "max states 6: OK\n";
		output << "non terminating: " << buildError( "S = \"a\" S ;", Automaton::Limits()) << "\n";
		expected << "non terminating: 557 [S]\n";

		// [7] Verification of automata not built from a grammar:
		{
			output << "empty: " << verifyError( Automaton()) << "\n";
			expected << "empty: OK\n";

			std::vector<Automaton::State> dangling = {createState( false, "a", 3), createState( true)};
			output << "dangling: " << verifyError( Automaton( GRAUTO_VERSION_NUMBER, 1, dangling)) << "\n";
			expected << "dangling: 602 [edge of state 1 to undefined state 3]\n";

			std::vector<Automaton::State> unreachable = {createState( false, "a", 1), createState( true)};
			output << "unreachable: " << verifyError( Automaton( GRAUTO_VERSION_NUMBER, 1, unreachable)) << "\n";
			expected << "unreachable: 602 [state 2 unreachable]\n";

			std::vector<Automaton::State> valid = {createState( false, "a", 2), createState( true)};
			output << "bad start: " << verifyError( Automaton( GRAUTO_VERSION_NUMBER, 3, valid)) << "\n";
			expected << "bad start: 602 [start state 3 undefined]\n";
			output << "valid: " << verifyError( Automaton( GRAUTO_VERSION_NUMBER, 1, valid)) << "\n";
			expected << "valid: OK\n";
		}

		if (!checkTestOutput( "testAutomaton", output.str(), expected.str()))
		{
			return 3;
		}
		std::cerr << "OK" << std::endl;
		return 0;
	}
	catch (const grauto::Error& err)
	{
		std::cerr << "ERR " << err.what() << std::endl;
		return (int)err.code();
	}
	catch (const std::runtime_error& err)
	{
		std::cerr << "ERR runtime " << err.what() << std::endl;
		return 1;
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "ERR out of memory" << std::endl;
		return 2;
	}
	return 0;
}

