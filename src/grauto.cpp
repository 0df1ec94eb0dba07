/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Program compiling a grammar into an automaton for the generation of sentences
/// \file "grauto.cpp"
#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif
#include "automaton.hpp"
#include "grammar.hpp"
#include "grammar_parser.hpp"
#include "grammar_json_parser.hpp"
#include "generator.hpp"
#include "error.hpp"
#include "fileio.hpp"
#include "strings.hpp"
#include "version.hpp"
#include <iostream>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <string>
#include <vector>

using namespace grauto;

#define ERRCODE_MEMORY_ALLOCATION	3
#define ERRCODE_RUNTIME_ERROR 		2
#define ERRCODE_INVALID_ARGUMENTS 	1

static void printUsage()
{
	std::cerr << "Usage: grauto [-h][-v][-V][-j][-o OUTF][-d DBGF][-l LIMIT][-m MAXSTATES][-s START][-g N [-r SEED]] INPFILE" << std::endl;
	std::cerr << "Description: Compile a context free grammar into a finite automaton for\n";
	std::cerr << "             the generation of sentences by random walks (grammar fuzzing).\n";
	std::cerr << "             The automaton is printed as Lua table.\n";
	std::cerr << "Options:\n";
	std::cerr << " --help,\n";
	std::cerr << " -h           : Print this usage.\n";
	std::cerr << " --version,\n";
	std::cerr << " -v           : Print the current version of grauto.\n";
	std::cerr << " --verbose,\n";
	std::cerr << " -V           : Do verbose output to stderr.\n";
	std::cerr << " --json,\n";
	std::cerr << " -j           : Read the grammar in JSON format (default for INPFILE with extension .json).\n";
	std::cerr << " --output <OUTF>,\n";
	std::cerr << " -o <OUTF>    : Write the output to file with path OUTF instead of stdout.\n";
	std::cerr << " --dbgout <DBGF>,\n";
	std::cerr << " -d <DBGF>    : Write the debug output to file with path DBGF instead of stderr.\n";
	std::cerr << " --limit <LIMIT>,\n";
	std::cerr << " -l <LIMIT>   : Maximum number of grammar symbols pending in a state (default "
			<< (int)Automaton::DefaultMaxContinuationDepth << ").\n";
	std::cerr << " --maxstates <MAXSTATES>,\n";
	std::cerr << " -m <MAXSTATES>: Maximum number of states of the automaton (default "
			<< (int)Automaton::DefaultMaxStates << ").\n";
	std::cerr << " --start <START>,\n";
	std::cerr << " -s <START>   : Use the nonterminal START as start symbol.\n";
	std::cerr << " --generate <N>,\n";
	std::cerr << " -g <N>       : Print N generated sentences (one per line) instead of the automaton.\n";
	std::cerr << " --seed <SEED>,\n";
	std::cerr << " -r <SEED>    : Seed of the pseudo random number generator used for -g (default 0).\n";
	std::cerr << "Arguments:\n";
	std::cerr << "INPFILE       : Contains the grammar to compile, either in the BNF dialect of grauto or\n";
	std::cerr << "                as JSON object mapping nonterminals to lists of productions.\n";
}

static void printWarning( const std::string& filename, const Error& error)
{
	if (error.line())
	{
		std::cerr << "Warning on line " << error.line() << " of " << filename << ": ";
	}
	else
	{
		std::cerr << "Warning in " << filename << ": ";
	}
	std::cerr << error.what() << std::endl;
}

static void printOutput( const std::string& filename, const std::string& content)
{
	if (filename.empty())
	{
		std::cout << content << std::flush;
	}
	else
	{
		writeFile( filename, content);
	}
}

/// \brief Match an option with value, either "-x", "-xVALUE", "--long=VALUE" or "-x VALUE"
/// \return the value of the option, nullptr if the option does not match, "" if the value is missing
static const char* getOptionValue( int argc, const char* argv[], int& argi, const char* shortopt, const char* longopt)
{
	const char* arg = argv[argi];
	std::size_t longlen = std::strlen( longopt);
	if (0==std::strncmp( arg, longopt, longlen) && arg[ longlen] == '=')
	{
		return arg + longlen + 1;
	}
	if (0==std::strncmp( arg, shortopt, 2))
	{
		if (arg[2]) return arg + 2;
		if (argi + 1 == argc || argv[argi+1][0] == '-') return "";
		return argv[ ++argi];
	}
	return nullptr;
}

static bool parseCardinal( const char* str, int& value)
{
	char* end = nullptr;
	long val = std::strtol( str, &end, 10);
	if (!*str || *end || val <= 0 || val > (1L<<30)) return false;
	value = val;
	return true;
}

int main( int argc, const char* argv[] )
{
	try
	{
		bool verbose = false;
		bool jsonFormat = false;
		std::string inputFilename;
		std::string outputFilename;
		std::string debugFilename;
		std::string startSymbol;
		int maxContinuationDepth = Automaton::DefaultMaxContinuationDepth;
		int maxStates = Automaton::DefaultMaxStates;
		int nofSamples = 0;
		unsigned int seed = 0;

		int argi = 1;
		for (; argi < argc; ++argi)
		{
			const char* optval = nullptr;
			const char* optname = argv[argi];
			if (0==std::strcmp( argv[argi], "-V") || 0==std::strcmp( argv[argi], "--verbose"))
			{
				verbose = true;
			}
			else if (0==std::strcmp( argv[argi], "-j") || 0==std::strcmp( argv[argi], "--json"))
			{
				jsonFormat = true;
			}
			else if (0==std::strcmp( argv[argi], "-v") || 0==std::strcmp( argv[argi], "--version"))
			{
				std::cout << "grauto version " << GRAUTO_VERSION_STRING << std::endl;
				return 0;
			}
			else if (0==std::strcmp( argv[argi], "-h") || 0==std::strcmp( argv[argi], "--help"))
			{
				printUsage();
				return 0;
			}
			else if (0==std::strcmp( argv[argi], "--"))
			{
				++argi;
				break;
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-o", "--output")))
			{
				outputFilename = optval;
				if (outputFilename.empty())
				{
					std::cerr << "Option -o,--output requires a file path as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-d", "--dbgout")))
			{
				debugFilename = optval;
				if (debugFilename.empty())
				{
					std::cerr << "Option -d,--dbgout requires a file path as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-s", "--start")))
			{
				startSymbol = optval;
				if (startSymbol.empty())
				{
					std::cerr << "Option -s,--start requires a nonterminal name as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-l", "--limit")))
			{
				if (!parseCardinal( optval, maxContinuationDepth))
				{
					std::cerr << "Option -l,--limit requires a positive number as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-m", "--maxstates")))
			{
				if (!parseCardinal( optval, maxStates))
				{
					std::cerr << "Option -m,--maxstates requires a positive number as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-g", "--generate")))
			{
				if (!parseCardinal( optval, nofSamples))
				{
					std::cerr << "Option -g,--generate requires a positive number as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (nullptr != (optval = getOptionValue( argc, argv, argi, "-r", "--seed")))
			{
				int seedval = 0;
				if (0==std::strcmp( optval, "0"))
				{
					seed = 0;
				}
				else if (parseCardinal( optval, seedval))
				{
					seed = seedval;
				}
				else
				{
					std::cerr << "Option -r,--seed requires a non negative number as argument" << std::endl << std::endl;
					printUsage();
					return ERRCODE_INVALID_ARGUMENTS;
				}
			}
			else if (optname[0] == '-')
			{
				std::cerr << "Unknown program option " << optname << std::endl << std::endl;
				printUsage();
				return ERRCODE_INVALID_ARGUMENTS;
			}
			else
			{
				break;
			}
		}
		if (argi == argc)
		{
			std::cerr << "Too few arguments, input file expected" << std::endl << std::endl;
			printUsage();
			return ERRCODE_INVALID_ARGUMENTS;
		}
		if (argi + 1 < argc)
		{
			std::cerr << "Too many arguments, only input file expected" << std::endl << std::endl;
			printUsage();
			return ERRCODE_INVALID_ARGUMENTS;
		}
		inputFilename = argv[ argi];
		std::string source = readFile( inputFilename);
		Grammar grammar = (jsonFormat || isJsonGrammarFile( inputFilename))
					? parseJsonGrammar( source, inputFilename)
					: parseGrammar( source, inputFilename);
		if (!startSymbol.empty()) grammar.setStart( startSymbol);

		std::vector<Error> warnings;
		Automaton automaton;
		Automaton::Limits limits( maxContinuationDepth, maxStates);
		if (debugFilename.empty())
		{
			automaton.build( grammar, warnings, Automaton::DebugOutput().enable( verbose ? Automaton::DebugOutput::All : Automaton::DebugOutput::None), limits);
		}
		else
		{
			std::stringstream dbgoutstream;
			try
			{
				automaton.build( grammar, warnings, Automaton::DebugOutput( dbgoutstream).enable( Automaton::DebugOutput::All), limits);
			}
			catch (const Error&)
			{
				writeFile( debugFilename, dbgoutstream.str());
				throw;
			}
			writeFile( debugFilename, dbgoutstream.str());
		}
		for (auto const& warning : warnings)
		{
			printWarning( inputFilename, warning);
		}
		if (nofSamples)
		{
			Generator generator( automaton, seed);
			std::string content;
			for (int si = 0; si < nofSamples; ++si)
			{
				content.append( generator.next());
				content.push_back( '\n');
			}
			printOutput( outputFilename, content);
		}
		else
		{
			printOutput( outputFilename, automaton.tostring());
		}
		return 0;
	}
	catch (const grauto::Error& err)
	{
		std::cerr << "ERR " << err.what() << std::endl;
		return (int)err.code() < 128 ? (int)err.code() /*errno*/ : ERRCODE_RUNTIME_ERROR;
	}
	catch (const std::runtime_error& err)
	{
		std::cerr << "ERR runtime " << err.what() << std::endl;
		return ERRCODE_RUNTIME_ERROR;
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "ERR out of memory" << std::endl;
		return ERRCODE_MEMORY_ALLOCATION;
	}
	return 0;
}

