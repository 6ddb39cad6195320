/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      lexer.cpp
@brief     lpat pattern lexer
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <lpat/lexer.h>

namespace lpat {

bool Token::operator==(const Token& token) const
{
  if (type != token.type || pos != token.pos)
    return false;
  switch (type)
  {
    case LITERAL:
      return byte == token.byte;
    case CLASS:
      return cls == token.cls && negate == token.negate;
    case SET:
    case FRONTIER:
      return chars == token.chars;
    case BALANCED:
      return byte == token.byte && byte2 == token.byte2;
    case BACKREF:
      return index == token.index;
    default:
      return true;
  }
}

std::vector<Token> Lexer::tokenize()
{
  DBGLOG("BEGIN tokenize(\"%s\")", pat_.c_str());
  std::vector<Token> tokens;
  Token token;
  loc_ = 0;
  while (next(token))
    tokens.push_back(token);
  DBGLOG("END tokenize() %zu tokens", tokens.size());
  return tokens;
}

bool Lexer::next(Token& token)
{
  if (loc_ >= pat_.size())
    return false;
  size_t pos = loc_;
  uint8_t c = static_cast<uint8_t>(pat_[loc_++]);
  token = Token(Token::LITERAL, pos);
  switch (c)
  {
    case '.':
      token.type = Token::ANY;
      break;
    case '*':
      token.type = Token::STAR;
      break;
    case '+':
      token.type = Token::PLUS;
      break;
    case '-':
      token.type = Token::MINUS;
      break;
    case '?':
      token.type = Token::OPTIONAL;
      break;
    case '(':
      if (loc_ < pat_.size() && pat_[loc_] == ')')
      {
        ++loc_;
        token.type = Token::POSITION;
      }
      else
      {
        token.type = Token::OPEN;
      }
      break;
    case ')':
      token.type = Token::CLOSE;
      break;
    case '^':
      token.type = Token::BEGIN;
      break;
    case '$':
      token.type = Token::END;
      break;
    case '[':
      token.type = Token::SET;
      scan_set(token);
      break;
    case '%':
      scan_escape(token);
      break;
    default:
      token.byte = c;
  }
  DBGLOGN("token %u at %zu", token.type, token.pos);
  return true;
}

void Lexer::scan_escape(Token& token)
{
  if (loc_ >= pat_.size())
    error(pattern_error::ends_with_escape, token.pos);
  uint8_t c = static_cast<uint8_t>(pat_[loc_++]);
  if (c == 'b')
  {
    if (loc_ + 2 > pat_.size())
      error(pattern_error::missing_arguments, token.pos);
    token.type = Token::BALANCED;
    token.byte = static_cast<uint8_t>(pat_[loc_++]);
    token.byte2 = static_cast<uint8_t>(pat_[loc_++]);
  }
  else if (c == 'f')
  {
    if (loc_ >= pat_.size() || pat_[loc_] != '[')
      error(pattern_error::missing_frontier, token.pos);
    ++loc_;
    token.type = Token::FRONTIER;
    scan_set(token);
  }
  else if (c >= '0' && c <= '9')
  {
    token.type = Token::BACKREF;
    token.index = c - '0';
  }
  else if (class_of(c, token.cls, token.negate))
  {
    token.type = Token::CLASS;
  }
  else
  {
    token.byte = c;
  }
}

// loc_ is just past the [ of the set, the first member after [ or [^ is
// never the closing ], a % escapes the byte that follows it
void Lexer::scan_set(Token& token)
{
  size_t start = loc_ - 1;
  bool negate = false;
  if (loc_ < pat_.size() && pat_[loc_] == '^')
  {
    negate = true;
    ++loc_;
  }
  size_t end = loc_;
  do
  {
    if (end >= pat_.size())
      error(pattern_error::missing_bracket, start);
    if (pat_[end++] == '%' && end < pat_.size())
      ++end;
  } while (end >= pat_.size() || pat_[end] != ']');
  Chars& chars = token.chars;
  for (size_t p = loc_; p < end; ++p)
  {
    uint8_t c = static_cast<uint8_t>(pat_[p]);
    if (c == '%')
    {
      uint8_t e = static_cast<uint8_t>(pat_[++p]);
      Class cls;
      bool neg;
      if (class_of(e, cls, neg))
        chars.add(cls, neg);
      else
        chars.add(e);
    }
    else if (p + 2 < end && pat_[p + 1] == '-')
    {
      uint8_t hi = static_cast<uint8_t>(pat_[p + 2]);
      if (c <= hi)
        chars.add(c, hi);
      p += 2;
    }
    else
    {
      chars.add(c);
    }
  }
  if (negate)
    chars.flip();
  loc_ = end + 1;
}

void Lexer::error(pattern_error_type code, size_t pos) const
{
  DBGLOG("Lexer error %d at %zu", code, pos);
  throw lex_error(code, pat_, pos);
}

} // namespace lpat
