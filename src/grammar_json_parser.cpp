/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Loader of grammars in JSON format
/// \file "grammar_json_parser.cpp"
#include "grammar_json_parser.hpp"
#include "grammar.hpp"
#include "error.hpp"
#include "strings.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <algorithm>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

static int lineOfBytePosition( const std::string_view& source, std::size_t byte)
{
	if (byte == 0) return 0;
	std::size_t end = std::min( byte-1, source.size());
	return 1 + std::count( source.begin(), source.begin() + end, '\n');
}

static Alternative parseProduction( const std::string& production, const std::string& name, int prodidx, const std::string_view& filename)
{
	Alternative rt;
	char const* pi = production.c_str();
	char const* pe = pi + production.size();
	while (pi != pe)
	{
		if ((unsigned char)*pi <= 32)
		{
			++pi;
		}
		else if (*pi == '\'' || *pi == '"')
		{
			char eb = *pi++;
			char const* start = pi;
			for (; pi != pe && *pi != eb; ++pi){}
			if (pi == pe)
			{
				throw Error( Error::UnexpectedEndOfRuleInGrammarDef,
						string_format( "%s [%d] string not terminated", name.c_str(), prodidx), Error::Location( filename, 0));
			}
			rt.push_back( Token::terminal( std::string_view( start, pi - start)));
			++pi;
		}
		else
		{
			char const* start = pi;
			for (; pi != pe && (unsigned char)*pi > 32 && *pi != '\'' && *pi != '"'; ++pi){}
			rt.push_back( Token::nonterminal( std::string_view( start, pi - start)));
		}
	}
	return rt;
}

Grammar grauto::parseJsonGrammar( const std::string_view& source, const std::string_view& filename)
{
	nlohmann::ordered_json document;
	try
	{
		document = nlohmann::ordered_json::parse( source.begin(), source.end());
	}
	catch (const nlohmann::ordered_json::parse_error& err)
	{
		throw Error( Error::BadJsonInGrammarDef, err.what(), Error::Location( filename, lineOfBytePosition( source, err.byte)));
	}
	if (!document.is_object())
	{
		throw Error( Error::BadStructureOfJsonGrammarDef, "top level value is not an object", Error::Location( filename, 0));
	}
	Grammar rt;
	for (auto const& item : document.items())
	{
		const std::string& name = item.key();
		if (!item.value().is_array())
		{
			throw Error( Error::BadStructureOfJsonGrammarDef, string_format( "%s is not a list", name.c_str()), Error::Location( filename, 0));
		}
		rt.defineNonTerminal( name);
		int prodidx = 0;
		for (auto const& production : item.value())
		{
			++prodidx;
			if (!production.is_string())
			{
				throw Error( Error::BadStructureOfJsonGrammarDef,
						string_format( "%s [%d] is not a string", name.c_str(), prodidx), Error::Location( filename, 0));
			}
			rt.addAlternative( name, parseProduction( production.get<std::string>(), name, prodidx, filename));
		}
	}
	return rt;
}

bool grauto::isJsonGrammarFile( const std::string_view& filename) noexcept
{
	static const std::string_view extension = ".json";
	return filename.size() > extension.size()
		&& filename.substr( filename.size() - extension.size()) == extension;
}

