/*
  Copyright (c) 2020 Patrick P. Frey
 
  Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
*/
/// \brief Error structure
/// \file "error.cpp"
#include "error.hpp"
#include <utility>
#include <string>
#include <stdexcept>
#include <exception>
#include <cstdio>
#include <cstring>
#include <limits>

#if __cplusplus < 201703L
#error Building grauto requires C++17
#endif

using namespace grauto;

Error Error::parseError( const char* errstr) noexcept
{
	Code code_ = Ok;
	int line_ = 0;
	std::string_view filename_ = "";
	char const* ei = errstr;
	char const* param_ = 0;
	char const* msgstart = 0;
	enum State {StateInit, StateParseMessage, StateParseEndOfMessage, StateParseLineNo, StateParseFileName, StateParseArgument, StateEnd};
	State state = StateInit;

	if (*errstr) while (state != StateEnd) switch (state)
	{
		case StateInit:
			if (*ei == '#')
			{
				++ei;
				int cd = parseInteger( ei);
				skipSpaces( ei);

				if (cd <= 0 || cd > std::numeric_limits<short>::max())
				{
					code_ = RuntimeException;
					param_ = errstr;
					state = StateEnd;
				}
				else
				{
					code_ = (Error::Code)cd;
					state = StateParseMessage;
				}
			}
			else
			{
				// ... message not created by an Error, e.g. an error raised by a Lua script
				param_ = errstr;
				code_ = RuntimeException;
				state = StateParseLineNo;
			}
			break;
		case StateParseMessage:
			if (*ei == '\"')
			{
				++ei;
				msgstart = ei;
				state = StateParseEndOfMessage;
			}
			else
			{
				code_ = RuntimeException;
				param_ = errstr;
				state = StateEnd;
			}
			break;
		case StateParseEndOfMessage:
			if (!skipUntil( ei, '\"'))
			{
				code_ = RuntimeException;
				param_ = errstr;
				state = StateEnd;
			}
			else if ((std::size_t)(ei-msgstart) == std::strlen( code2String( code_))
				&& 0==std::memcmp( msgstart, code2String( code_), ei-msgstart))
			{
				++ei;
				skipSpaces( ei);
				param_ = 0;
				state = StateParseLineNo;
			}
			else
			{
				++ei; //... a double quote inside the message, continue parsing the end of message
			}
			break;
		case StateParseLineNo:
			if (0==std::strncmp( ei, "at line ", 8))
			{
				ei += 8;
				line_ = parseInteger( ei);
				if (*ei == ' ')
				{
					++ei;
					state = StateParseFileName;
				}
				else
				{
					state = StateParseArgument;
				}
			}
			else
			{
				state = StateParseArgument;
			}
			break;
		case StateParseFileName:
			if (0==std::strncmp( ei, "in file ", 8))
			{
				ei += 8;
				if (*ei == '"' || *ei == '\'')
				{
					filename_ = parseString( ei);
				}
			}
			state = StateParseArgument;
			break;
		case StateParseArgument:
			if (ei[0] == ':' && ei[1] == ' ')
			{
				param_ = ei +2;
			}
			else if (!param_)
			{
				param_ = "";
			}
			state = StateEnd;
			break;
		case StateEnd:
			break;
	}//... end for switch

	if (!param_) param_ = "";
	if (!filename_.empty())
	{
		return Error( code_, param_, Location( filename_, line_));
	}
	else
	{
		return Error( code_, param_, Location( line_));
	}
}

int Error::parseInteger( char const*& si) noexcept
{
	int rt = 0;
	for (; *si >= '0' && *si <= '9'; ++si)
	{
		rt = (rt * 10) + (*si - '0');
	}
	return rt;
}

std::string_view Error::parseString( char const*& si) noexcept
{
	char eb = *si++;
	char const* start = si;
	for (;*si && *si != eb; ++si){}
	std::string_view rt( start, si-start);
	if (*si) ++si;
	return rt;
}

void Error::skipSpaces( char const*& si) noexcept
{
	for (; *si && (unsigned char)*si <= 32; ++si){}
}

bool Error::skipUntil( char const*& si, char eb) noexcept
{
	for (; *si && *si != eb; ++si){}
	return *si == eb;
}

const char* Error::code2String( int code_) noexcept
{
	if (code_ && code_ < 300)
	{
		return std::strerror( code_);
	}
	else switch ((Code)code_)
	{
		case Ok: return "";
		case MemoryAllocationError: return "Memory allocation error";
		case LogicError: return "Logic error";
		case RuntimeException: return "Runtime error exception";
		case UnexpectedException: return "Unexpected exception";

		case ExpectedStringArgument: return "Expected string as argument";
		case ExpectedIntegerArgument: return "Expected integer as argument";
		case ExpectedNonNegativeIntegerArgument: return "Expected non negative integer as argument";
		case ExpectedCardinalArgument: return "Expected positive integer as argument";
		case ExpectedTableArgument: return "Expected table as argument";
		case TooFewArguments: return "Too few arguments";
		case TooManyArguments: return "Too many arguments";

		case BadGrautoVersion: return "Bad grauto version";
		case MissingGrautoVersion: return "Missing grauto version";
		case IncompatibleGrautoMajorVersion: return "Incompatible grauto major version. You need a higher version of grauto to load this automaton";

		case BadCharacterInGrammarDef: return "Bad character in the grammar definition";
		case UnexpectedEofInGrammarDef: return "Unexpected EOF in the grammar definition";
		case UnexpectedTokenInGrammarDef: return "Unexpected token in the grammar definition";
		case UnexpectedEndOfRuleInGrammarDef: return "Unexpected end of rule in the grammar definition";
		case BadEscapeInGrammarDef: return "Bad escape sequence in a terminal of the grammar definition";
		case BadJsonInGrammarDef: return "Syntax error in the JSON grammar definition";
		case BadStructureOfJsonGrammarDef: return "JSON grammar definition is not an object mapping nonterminals to lists of productions";

		case CommandNumberOfArgumentsInGrammarDef: return "Wrong number of arguments for command (followed by '%') in the grammar definition";
		case CommandNameUnknownInGrammarDef: return "Unknown command (followed by '%') in the grammar definition";

		case UndefinedSymbol: return "Reference to a nonterminal that is not defined in the grammar";
		case UnreachableNonTerminalInGrammarDef: return "Unreachable nonterminal in the grammar definition";
		case StartSymbolDefinedTwiceInGrammarDef: return "Start symbol defined more than once in the grammar definition";
		case EmptyGrammar: return "The grammar is empty or its start symbol is not defined";
		case NonTerminatingGrammar: return "Nonterminal without finite derivation in the grammar";
		case DuplicateAlternativeInGrammarDef: return "Duplicate alternative for a nonterminal in the grammar definition";

		case ComplexityMaxStates: return "Too many states in the automaton built from the grammar";
		case ComplexityMaxContinuationDepth: return "Maximum continuation depth too small for the shortest derivation of the start symbol";

		case BadKeyInGeneratedLuaTable: return "Bad key encountered in table generated by grauto";
		case BadValueInGeneratedLuaTable: return "Bad value encountered in table generated by grauto";

		case LuaStackOutOfMemory: return "Lua stack out of memory";
		case LuaInvalidUserData: return "Userdata argument of this call is invalid";

		case AutomatonCorrupted: return "Logic error, the automaton is corrupt";
	}
	return "Unknown error";
}

std::string Error::map2string( Code code_, const std::string_view& param_, const Location& location_)
{
	char parambuf[ 512];
	std::size_t len = param_.size() >= sizeof(parambuf) ? (sizeof(parambuf)-1):param_.size();
	std::memcpy( parambuf, param_.data(), len);
	parambuf[ len] = 0;
	return map2string( code_, parambuf, location_);
}

std::string Error::map2string( Code code_, const char* param_, const Location& location_)
{
	char msgbuf[ 256];
	if (code_ == Ok)
	{
		msgbuf[0] = 0;
	}
	else if (location_.line())
	{
		if (location_.filename()[0])
		{
			std::snprintf( msgbuf, sizeof(msgbuf), "#%d \"%s\" at line %d in file \"%s\"",
					(int)code_, code2String((int)code_), location_.line(), location_.filename());
		}
		else
		{
			std::snprintf( msgbuf, sizeof(msgbuf), "#%d \"%s\" at line %d",
					(int)code_, code2String((int)code_), location_.line());
		}
	}
	else
	{
		std::snprintf( msgbuf, sizeof(msgbuf), "#%d \"%s\"", (int)code_, code2String((int)code_));
	}
	try
	{
		std::string rt( msgbuf);
		if (param_ && param_[0])
		{
			rt.push_back(':');
			rt.push_back(' ');
			rt.append( param_);
		}
		return rt;
	}
	catch (const std::bad_alloc&)
	{
		std::snprintf( msgbuf, sizeof(msgbuf), "#%d", (int)MemoryAllocationError);
		return std::string( msgbuf);
	}
}

