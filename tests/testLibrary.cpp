/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Test program for the exception free library interface
/// \file "testLibrary.cpp"

#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif

#include "grauto/automaton.hpp"
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <vector>
#include <cstring>
#include <cstdio>

static std::string errorToString( const libgrauto::Error& err)
{
	std::ostringstream out;
	out << err.code() << " [" << err.arg() << "]";
	return out.str();
}

static void writeTestFile( const char* filename, const std::string& content)
{
	std::ofstream out( filename, std::ios::out | std::ios::binary);
	out << content;
}

int main( int argc, const char* argv[] )
{
	bool verbose = (argc > 1 && 0==std::strcmp( argv[1], "-V"));
	std::ostringstream output;
	std::ostringstream expected;

	// [1] Compile and inspect:
	{
		libgrauto::Automaton automaton;
		libgrauto::Error error;
		std::vector<libgrauto::Error> warnings;
		output << "defined before " << (automaton.defined() ? "yes" : "no") << ", start " << automaton.start() << "\n";
		expected << "defined before no, start 0\n";

		if (!automaton.compile( "S = \"a\" S \"b\" | \"c\" ;", warnings, error, 3))
		{
			std::cerr << "ERR " << errorToString( error) << std::endl;
			return 1;
		}
		output << "states " << automaton.nofStates() << ", start " << automaton.start() << ", warnings " << warnings.size() << "\n";
		expected << "states 6, start 1, warnings 0\n";
		for (int stateidx = 1; stateidx <= automaton.nofStates(); ++stateidx)
		{
			output << stateidx << (automaton.isFinal( stateidx) ? " final" : "");
			for (auto const& edge : automaton.edges( stateidx, error))
			{
				output << " " << edge.trigger() << ">" << edge.dest();
			}
			output << "\n";
		}
		expected
			<< "1 a>2 c>3\n"
			<< "2 a>4 c>5\n"
			<< "3 final\n"
			<< "4 c>6\n"
			<< "5 b>3\n"
			<< "6 b>5\n";

		std::string listing = automaton.render( error);
		output << listing.substr( 0, listing.find( '[', 1));
		expected << "[1]\n\t\"a\" => 2\n\t\"c\" => 3\n";

		std::string table = automaton.tostring( error);
		output << table.substr( 0, table.find( ',')) << "\n";
		expected << "{\n\tgrauto = \"0.1.0\"\n";

		std::vector<std::string> samples = automaton.generate( 17, 20, error);
		int nofInvalid = 0;
		for (auto const& sample : samples)
		{
			if (sample != "c" && sample != "acb" && sample != "aacbb") ++nofInvalid;
		}
		output << "samples " << samples.size() << ", invalid " << nofInvalid << "\n";
		expected << "samples 20, invalid 0\n";

		output << "error after successful calls " << error.code() << "\n";
		expected << "error after successful calls 0\n";

		automaton.edges( 99, error);
		output << "edges of state 99: " << errorToString( error) << "\n";
		expected << "edges of state 99: 402 [state 99 out of range]\n";

		// Moving transfers the automaton:
		libgrauto::Automaton moved( std::move( automaton));
		output << "moved " << moved.nofStates() << " " << automaton.nofStates() << "\n";
		expected << "moved 6 0\n";

		libgrauto::Error undefinedError;
		automaton.tostring( undefinedError);
		output << "undefined: " << errorToString( undefinedError) << "\n";
		expected << "undefined: 402 [automaton not defined]\n";
	}

	// [2] Errors and warnings:
	{
		libgrauto::Automaton automaton;
		libgrauto::Error error;
		std::vector<libgrauto::Error> warnings;
		bool success = automaton.compile( "S = A ;", warnings, error);
		output << "undefined symbol " << (success ? "compiled" : "failed") << ": " << errorToString( error) << "\n";
		expected << "undefined symbol failed: 552 [A]\n";

		error = libgrauto::Error();
		success = automaton.compile( "S = \"a\" S \"b\" | \"c\" ;", warnings, error, 3, 5);
		output << "max states " << (success ? "compiled" : "failed") << ": " << errorToString( error) << "\n";
		expected << "max states failed: 571 [5]\n";
		output << "defined after failure " << (automaton.defined() ? "yes" : "no") << "\n";
		expected << "defined after failure no\n";

		error = libgrauto::Error();
		success = automaton.compile( "A = \"a\" ;\nB = \"b\" ;", warnings, error, 10, 100, "B");
		output << "start override " << (success ? "compiled" : "failed") << ", warnings";
		for (auto const& warning : warnings)
		{
			output << " " << errorToString( warning);
		}
		output << "\n";
		expected << "start override compiled, warnings 553 [A]\n";
		std::vector<std::string> samples = automaton.generate( 1, 3, error);
		output << "samples";
		for (auto const& sample : samples) output << " " << sample;
		output << "\n";
		expected << "samples b b b\n";
	}

	if (verbose) std::cerr << output.str() << std::endl;
	if (output.str() != expected.str())
	{
		writeTestFile( "testLibrary.out", output.str());
		writeTestFile( "testLibrary.exp", expected.str());
		std::cerr << "ERR test output (testLibrary.out) differs from expected (testLibrary.exp)" << std::endl;
		return 3;
	}
	std::remove( "testLibrary.out");
	std::remove( "testLibrary.exp");
	std::cerr << "OK" << std::endl;
	return 0;
}

