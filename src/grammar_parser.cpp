/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Parser of the textual grammar definition
/// \file "grammar_parser.cpp"
#include "grammar_parser.hpp"
#include "grammar.hpp"
#include "error.hpp"
#include "strings.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <cstring>
#include <cctype>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

namespace {

struct GrammarLexem
{
	enum Type
	{
		Eof,
		Ident,
		String,
		Percent,
		Assign,
		Or,
		Semicolon,
		Epsilon
	};

	Type type;
	std::string value;
	int line;

	GrammarLexem( Type type_, const std::string_view& value_, int line_)
		:type(type_),value(value_),line(line_){}
};

class GrammarScanner
{
public:
	GrammarScanner( const std::string_view& source_, const std::string_view& filename_)
		:m_end(source_.data()+source_.size()),m_itr(source_.data()),m_line(1),m_filename(filename_){}

	GrammarLexem next()
	{
		skipSpacesAndComments();
		if (m_itr == m_end) return GrammarLexem( GrammarLexem::Eof, "", m_line);

		char ch = *m_itr;
		if (isAlpha( ch))
		{
			char const* start = m_itr;
			for (++m_itr; m_itr != m_end && (isAlpha( *m_itr) || isDigit( *m_itr)); ++m_itr){}
			return GrammarLexem( GrammarLexem::Ident, std::string_view( start, m_itr-start), m_line);
		}
		else if (ch == '"' || ch == '\'')
		{
			int line = m_line;
			return GrammarLexem( GrammarLexem::String, parseString(), line);
		}
		else if (ch == '%')
		{
			++m_itr;
			return GrammarLexem( GrammarLexem::Percent, "%", m_line);
		}
		else if (ch == '=' || ch == ':')
		{
			if (ch == ':' && startsWith( "::=")) m_itr += 3; else ++m_itr;
			return GrammarLexem( GrammarLexem::Assign, "=", m_line);
		}
		else if (startsWith( "→"))
		{
			m_itr += std::strlen( "→");
			return GrammarLexem( GrammarLexem::Assign, "=", m_line);
		}
		else if (startsWith( "ε"))
		{
			m_itr += std::strlen( "ε");
			return GrammarLexem( GrammarLexem::Epsilon, "ε", m_line);
		}
		else if (ch == '|')
		{
			++m_itr;
			return GrammarLexem( GrammarLexem::Or, "|", m_line);
		}
		else if (ch == ';')
		{
			++m_itr;
			return GrammarLexem( GrammarLexem::Semicolon, ";", m_line);
		}
		throw Error( Error::BadCharacterInGrammarDef, std::string_view( m_itr, 1), location());
	}

	Error::Location location() const noexcept
	{
		return Error::Location( m_filename, m_line);
	}

private:
	static bool isAlpha( char ch) noexcept		{return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';}
	static bool isDigit( char ch) noexcept		{return ch >= '0' && ch <= '9';}
	static bool isHexDigit( char ch) noexcept	{return isDigit( ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');}
	static int hexValue( char ch) noexcept		{return isDigit( ch) ? (ch - '0') : ((ch | 32) - 'a' + 10);}

	bool startsWith( const char* str) const noexcept
	{
		std::size_t len = std::strlen( str);
		return (std::size_t)(m_end - m_itr) >= len && 0==std::memcmp( m_itr, str, len);
	}

	void skipSpacesAndComments()
	{
		while (m_itr != m_end)
		{
			if (*m_itr == '\n')
			{
				++m_line;
				++m_itr;
			}
			else if ((unsigned char)*m_itr <= 32)
			{
				++m_itr;
			}
			else if (*m_itr == '#' || startsWith( "//"))
			{
				for (; m_itr != m_end && *m_itr != '\n'; ++m_itr){}
			}
			else if (startsWith( "/*"))
			{
				int line = m_line;
				for (m_itr += 2; m_itr != m_end && !startsWith( "*/"); ++m_itr)
				{
					if (*m_itr == '\n') ++m_line;
				}
				if (m_itr == m_end)
				{
					throw Error( Error::UnexpectedEofInGrammarDef, "comment not terminated", Error::Location( m_filename, line));
				}
				m_itr += 2;
			}
			else
			{
				break;
			}
		}
	}

	std::string parseString()
	{
		std::string rt;
		char eb = *m_itr++;
		while (m_itr != m_end && *m_itr != eb)
		{
			if (*m_itr == '\n')
			{
				throw Error( Error::UnexpectedEndOfRuleInGrammarDef, "string not terminated", location());
			}
			else if (*m_itr == '\\')
			{
				++m_itr;
				if (m_itr == m_end) break;
				char ch = *m_itr++;
				switch (ch)
				{
					case 'n': rt.push_back( '\n'); break;
					case 't': rt.push_back( '\t'); break;
					case 'r': rt.push_back( '\r'); break;
					case '\\': rt.push_back( '\\'); break;
					case '\'': rt.push_back( '\''); break;
					case '"': rt.push_back( '"'); break;
					case 'x':
					{
						if (m_end - m_itr < 2 || !isHexDigit( m_itr[0]) || !isHexDigit( m_itr[1]))
						{
							throw Error( Error::BadEscapeInGrammarDef, "\\x", location());
						}
						rt.push_back( (char)(hexValue( m_itr[0]) * 16 + hexValue( m_itr[1])));
						m_itr += 2;
						break;
					}
					default:
						if (isDigit( ch))
						{
							// decimal escape \ddd as in Lua, up to 3 digits
							int val = ch - '0';
							for (int di = 1; di < 3 && m_itr != m_end && isDigit( *m_itr); ++di,++m_itr)
							{
								val = val * 10 + (*m_itr - '0');
							}
							if (val > 255)
							{
								throw Error( Error::BadEscapeInGrammarDef, string_format( "\\%d", val), location());
							}
							rt.push_back( (char)val);
						}
						else
						{
							throw Error( Error::BadEscapeInGrammarDef, std::string( "\\") + ch, location());
						}
				}
			}
			else
			{
				rt.push_back( *m_itr++);
			}
		}
		if (m_itr == m_end)
		{
			throw Error( Error::UnexpectedEofInGrammarDef, "string not terminated", location());
		}
		++m_itr;
		return rt;
	}

private:
	char const* m_end;
	char const* m_itr;
	int m_line;
	std::string_view m_filename;
};

static bool caseInsensitiveCompare( const std::string_view& a, const std::string_view& b)
{
	auto ai = a.begin(), ae = a.end(), bi = b.begin(), be = b.end();
	for (; ai != ae && bi != be; ++ai,++bi)
	{
		if (std::tolower(*ai) != std::tolower(*bi)) return false;
	}
	return ai == ae && bi == be;
}

}//anonymous namespace

Grammar grauto::parseGrammar( const std::string_view& source, const std::string_view& filename)
{
	enum State {
		Init,
		ParseAssign,
		ParseAlternative,
		ParseEndOfEmptyAlternative,
		ParseCommand,
		ParseCommandArg
	};
	State state = Init;
	GrammarScanner scanner( source, filename);
	Grammar rt;
	std::string rulename;
	int ruleline = 0;
	Alternative alternative;
	std::string cmdname;
	std::vector<std::string> cmdargs;
	bool startDefined = false;

	GrammarLexem lexem = scanner.next();
	for (; lexem.type != GrammarLexem::Eof; lexem = scanner.next())
	{
		Error::Location location( filename, lexem.line);
		switch (lexem.type)
		{
			case GrammarLexem::Eof:
				throw Error( Error::LogicError, string_format( "%s line %d", __FILE__, (int)__LINE__)); //... loop exit condition met
			case GrammarLexem::Ident:
				if (state == Init)
				{
					rulename = lexem.value;
					ruleline = lexem.line;
					state = ParseAssign;
				}
				else if (state == ParseAlternative)
				{
					alternative.push_back( Token::nonterminal( lexem.value));
				}
				else if (state == ParseCommand)
				{
					cmdname = lexem.value;
					cmdargs.clear();
					state = ParseCommandArg;
				}
				else if (state == ParseCommandArg)
				{
					cmdargs.push_back( lexem.value);
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
			case GrammarLexem::String:
				if (state == ParseAlternative)
				{
					alternative.push_back( Token::terminal( lexem.value));
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, quoted_string( lexem.value), location);
				}
				break;
			case GrammarLexem::Percent:
				if (state == Init)
				{
					state = ParseCommand;
				}
				else if (state == ParseAlternative && alternative.empty())
				{
					// ... '%empty' marks an empty alternative
					lexem = scanner.next();
					if (lexem.type != GrammarLexem::Ident || !caseInsensitiveCompare( lexem.value, "empty"))
					{
						throw Error( Error::UnexpectedTokenInGrammarDef, std::string("%") + lexem.value, Error::Location( filename, lexem.line));
					}
					state = ParseEndOfEmptyAlternative;
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
			case GrammarLexem::Epsilon:
				if (state == ParseAlternative && alternative.empty())
				{
					state = ParseEndOfEmptyAlternative;
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
			case GrammarLexem::Assign:
				if (state == ParseAssign)
				{
					alternative.clear();
					state = ParseAlternative;
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
			case GrammarLexem::Or:
				if (state == ParseAlternative || state == ParseEndOfEmptyAlternative)
				{
					rt.addAlternative( rulename, std::move( alternative), ruleline);
					alternative.clear();
					state = ParseAlternative;
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
			case GrammarLexem::Semicolon:
				if (state == ParseAlternative || state == ParseEndOfEmptyAlternative)
				{
					rt.addAlternative( rulename, std::move( alternative), ruleline);
					alternative.clear();
					state = Init;
				}
				else if (state == ParseCommandArg)
				{
					if (caseInsensitiveCompare( cmdname, "start"))
					{
						if (cmdargs.size() != 1)
						{
							throw Error( Error::CommandNumberOfArgumentsInGrammarDef, cmdname, location);
						}
						if (startDefined)
						{
							throw Error( Error::StartSymbolDefinedTwiceInGrammarDef, cmdargs[0], location);
						}
						rt.setStart( cmdargs[0]);
						startDefined = true;
					}
					else
					{
						throw Error( Error::CommandNameUnknownInGrammarDef, cmdname, location);
					}
					state = Init;
				}
				else if (state == ParseAssign)
				{
					throw Error( Error::UnexpectedEndOfRuleInGrammarDef, rulename, location);
				}
				else
				{
					throw Error( Error::UnexpectedTokenInGrammarDef, lexem.value, location);
				}
				break;
		}
	}
	if (state != Init)
	{
		throw Error( Error::UnexpectedEofInGrammarDef, scanner.location());
	}
	return rt;
}

