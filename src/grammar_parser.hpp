/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Parser of the textual grammar definition
/// \file "grammar_parser.hpp"
#ifndef _GRAUTO_GRAMMAR_PARSER_HPP_INCLUDED
#define _GRAUTO_GRAMMAR_PARSER_HPP_INCLUDED
#if __cplusplus >= 201703L
#include "grammar.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace grauto {

/// \brief Parse a grammar in the BNF dialect of grauto
/// \note Rules are written as 'Name = "terminal" Nonterminal | ... ;' ('→' and '::=' are accepted as well as '='),
///	an empty alternative as nothing or 'ε' or '%empty', the start symbol is selected with '%start Name ;'
/// \param[in] source grammar source
/// \param[in] filename name of the source file used for error locations
/// \return the grammar, not checked yet for closure
Grammar parseGrammar( const std::string_view& source, const std::string_view& filename = "");

}//namespace
#else
#error Building grauto requires C++17
#endif
#endif

