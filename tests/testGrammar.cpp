/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Test program for the grammar model and the parser of the grammar text format
/// \file "testGrammar.cpp"

#if __cplusplus < 201703L
#error Building grauto requires at least C++17
#endif

#include "grammar.hpp"
#include "grammar_parser.hpp"
#include "grammar_json_parser.hpp"
#include "error.hpp"
#include "strings.hpp"
#include "utilitiesForTests.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace grauto;

static const char* g_exampleGrammar =
	"# Arithmetic expressions\n"
	"%start Expr ;\n"
	"Expr = Term | Expr \"+\" Term ;\n"
	"Term : Factor | Term '*' Factor ;\n"
	"Factor ::= \"(\" Expr \")\" | Number ;\n"
	"Number \xE2\x86\x92 \"1\" | \"2\\t\" | '\\x41' ;  // arrow as assignment\n"
	"Opt = \xCE\xB5 | \"x\" | %empty ;\n"
	"/* alternatives of a nonterminal\n"
	"   defined twice accumulate */\n"
	"Expr = \"-\" Expr ;\n"
	"List = | Opt List ;\n";

static const char* g_exampleGrammarExpected =
	"%start Expr ;\n"
	"Expr = Term | Expr \"+\" Term | \"-\" Expr ;\n"
	"Term = Factor | Term \"*\" Factor ;\n"
	"Factor = \"(\" Expr \")\" | Number ;\n"
	"Number = \"1\" | \"2\\t\" | \"A\" ;\n"
	"Opt = \xCE\xB5 | \"x\" | \xCE\xB5 ;\n"
	"List = \xCE\xB5 | Opt List ;\n";

struct ErrorTest
{
	const char* source;
	const char* expected;
};

static const ErrorTest g_errorTests[] = {
	{"S = \"a\" @ ;", "501 line 1 [@]"},
	{"S = \"a\"", "503 line 1 []"},
	{"S ;", "531 line 1 [S]"},
	{"S = \"a\\q\" ;", "532 line 1 [\\q]"},
	{"S = \"a\\300\" ;", "532 line 1 [\\300]"},
	{"%start A ;\n%start B ;\nA = \"a\" ;", "555 line 2 [B]"},
	{"%foo X ;", "542 line 1 [foo]"},
	{"%start A B ;", "541 line 1 [start]"},
	{"S = \"a\" = ;", "504 line 1 [=]"},
	{"S = \"abc\n;", "531 line 1 [string not terminated]"},
	{"/* open comment\nS = \"a\" ;", "503 line 1 [comment not terminated]"},
	{"S = A ;\nB = \"b\" ;", "552 line 1 [A]"},
	{"", "556 line 0 []"},
	{"# only a comment\n", "556 line 0 []"},
	{"%start X ;\nS = \"a\" ;", "556 line 0 [X]"},
	{"S = \"a\" | \"b\" ;\n", "OK"},
	{nullptr, nullptr}
};

static const char* g_jsonGrammar =
	"{\n"
	"  \"Expr\": [\"Term\", \"Expr '+' Term\"],\n"
	"  \"Term\": [\"'x'\", \"'(' Expr ')'\", \"\\\"[\\\" Expr \\\"]\\\"\"],\n"
	"  \"Opt\": [\"\", \"'a b' Opt\"]\n"
	"}\n";

static const char* g_jsonGrammarExpected =
	"Expr = Term | Expr \"+\" Term ;\n"
	"Term = \"x\" | \"(\" Expr \")\" | \"[\" Expr \"]\" ;\n"
	"Opt = \xCE\xB5 | \"a b\" Opt ;\n";

static const ErrorTest g_jsonErrorTests[] = {
	{"{\n\"S\": [\"'a'\"],\n}", "535 line 3"},
	{"{\"S\": [\"'a'\"]", "535 line 1"},
	{"[\"S\"]", "536 line 0 [top level value is not an object]"},
	{"{\"S\": \"'a'\"}", "536 line 0 [S is not a list]"},
	{"{\"S\": [\"'a'\", 1]}", "536 line 0 [S [2] is not a string]"},
	{"{\"S\": [\"'a\"]}", "531 line 0 [S [1] string not terminated]"},
	{"{\"S\": [\"A\"]}", "552 line 0 [A]"},
	{"{\"S\": [\"'x'\", \"B\"], \"B\": []}", "557 line 0 [B]"},
	{"{}", "556 line 0 []"},
	{"{\"S\": [\"'a' S 'b'\", \"'c'\"]}", "OK"},
	{nullptr, nullptr}
};

static std::string checkGrammar( const Grammar& grammar)
{
	try
	{
		grammar.check();
		return "OK";
	}
	catch (const Error& err)
	{
		return string_format( "%d line %d [%s]", (int)err.code(), err.line(), err.arg() ? err.arg() : "");
	}
}

static std::string parseJsonAndCheck( const char* source)
{
	try
	{
		Grammar grammar = parseJsonGrammar( source);
		grammar.check();
		return "OK";
	}
	catch (const Error& err)
	{
		if (err.code() == Error::BadJsonInGrammarDef)
		{
			// ... the argument is the message of the JSON library
			return string_format( "%d line %d", (int)err.code(), err.line());
		}
		return string_format( "%d line %d [%s]", (int)err.code(), err.line(), err.arg() ? err.arg() : "");
	}
}

static std::string parseAndCheck( const char* source)
{
	try
	{
		Grammar grammar = parseGrammar( source);
		grammar.check();
		return "OK";
	}
	catch (const Error& err)
	{
		return string_format( "%d line %d [%s]", (int)err.code(), err.line(), err.arg() ? err.arg() : "");
	}
}

int main( int argc, const char* argv[] )
{
	try
	{
		bool verbose = (argc > 1 && 0==std::strcmp( argv[1], "-V"));
		std::ostringstream output;
		std::ostringstream expected;

		// Parse a grammar using all notations:
		Grammar grammar = parseGrammar( g_exampleGrammar, "example.g");
		grammar.check();
		output << grammar.tostring();
		expected << g_exampleGrammarExpected;

		output << "start " << grammar.start() << ", rules " << grammar.nofNonTerminals() << "\n";
		expected << "start Expr, rules 6\n";
		output << "line of Expr " << grammar.rule( grammar.nonterminalIndex( "Expr")).line() << "\n";
		expected << "line of Expr 3\n";

		// The printed grammar is parsed back to the same grammar:
		Grammar reparsed = parseGrammar( grammar.tostring());
		output << (reparsed.tostring() == grammar.tostring() ? "reparsed equal" : "reparsed differs") << "\n";
		expected << "reparsed equal\n";

		// Grammar built without parser, start symbol defaults to the first rule:
		Grammar built;
		built.addAlternative( "S", {Token::terminal( "a"), Token::nonterminal( "S"), Token::terminal( "b")});
		built.addAlternative( "S", {Token::terminal( "c")});
		built.check();
		output << built.tostring() << "start " << built.start() << "\n";
		expected << "S = \"a\" S \"b\" | \"c\" ;\nstart S\n";

		// A nonterminal without alternatives is not printed as empty alternative:
		Grammar withoutAlternatives;
		withoutAlternatives.addAlternative( "S", {Token::terminal( "x")});
		withoutAlternatives.addAlternative( "S", {Token::nonterminal( "B")});
		withoutAlternatives.defineNonTerminal( "B");
		output << withoutAlternatives.tostring();
		expected << "S = \"x\" | B ;\n# B has no alternatives\n";
		output << "without alternatives: " << checkGrammar( withoutAlternatives) << "\n";
		expected << "without alternatives: 557 line 0 [B]\n";
		output << "without alternatives reparsed: " << checkGrammar( parseGrammar( withoutAlternatives.tostring())) << "\n";
		expected << "without alternatives reparsed: 552 line 1 [B]\n";

		// Grammar in JSON format, the order of the rules is kept:
		Grammar jsonGrammar = parseJsonGrammar( g_jsonGrammar, "example.json");
		jsonGrammar.check();
		output << jsonGrammar.tostring();
		expected << g_jsonGrammarExpected;
		output << "json start " << jsonGrammar.start() << ", rules " << jsonGrammar.nofNonTerminals() << "\n";
		expected << "json start Expr, rules 3\n";
		output << "json files " << isJsonGrammarFile( "grammar.json") << isJsonGrammarFile( ".json") << isJsonGrammarFile( "grammar.g") << "\n";
		expected << "json files 100\n";

		for (int ti = 0; g_jsonErrorTests[ ti].source; ++ti)
		{
			std::string result = parseJsonAndCheck( g_jsonErrorTests[ ti].source);
			if (verbose) std::cerr << "JSON error test " << ti << ": " << result << std::endl;
			output << "json error test " << ti << ": " << result << "\n";
			expected << "json error test " << ti << ": " << g_jsonErrorTests[ ti].expected << "\n";
		}

		// Errors:
		for (int ti = 0; g_errorTests[ ti].source; ++ti)
		{
			std::string result = parseAndCheck( g_errorTests[ ti].source);
			if (verbose) std::cerr << "Error test " << ti << ": " << result << std::endl;
			output << "error test " << ti << ": " << result << "\n";
			expected << "error test " << ti << ": " << g_errorTests[ ti].expected << "\n";
		}
		if (!checkTestOutput( "testGrammar", output.str(), expected.str()))
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

