/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Loader of grammars in the JSON format used by grammar fuzzers (nonterminal mapped to its list of productions)
/// \file "grammar_json_parser.hpp"
#ifndef _GRAUTO_GRAMMAR_JSON_PARSER_HPP_INCLUDED
#define _GRAUTO_GRAMMAR_JSON_PARSER_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "grammar.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace grauto {

/// \brief Parse a grammar defined as JSON object mapping nonterminal names to lists of productions
/// \note Example '{"S": ["'a' S 'b'", "'c'"]}'. A production is a string of terminals in single or double quotes
///	and names of nonterminals separated by spaces, the empty string is the empty production.
///	The start symbol is the first key of the object.
/// \param[in] source JSON source
/// \param[in] filename name of the source file used for error locations
/// \return the grammar, not checked yet for closure
Grammar parseJsonGrammar( const std::string_view& source, const std::string_view& filename = "");

/// \brief Decide by the file name if a grammar file is in JSON format
bool isJsonGrammarFile( const std::string_view& filename) noexcept;

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

