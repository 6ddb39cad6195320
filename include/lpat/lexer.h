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
@file      lexer.h
@brief     lpat pattern lexer
@copyright (c) BSD-3 License - see LICENSE.txt

The lexer scans a pattern into a flat sequence of tokens.  It is context free
per token: whether a quantifier has something to quantify and whether `^` and
`$` are anchors is decided by the parser, see lpat::Pattern.

| Pattern text   | Token                                              |
| -------------- | -------------------------------------------------- |
| `x`            | LITERAL `x`                                        |
| `%x`           | LITERAL `x` for a non-alphanumeric or non-class x  |
| `.`            | ANY                                                |
| `%a` ... `%X`  | CLASS, negated when uppercase                      |
| `[set]`        | SET                                                |
| `*` `+` `-` `?`| STAR, PLUS, MINUS, OPTIONAL                        |
| `(` `)` `()`   | OPEN, CLOSE, POSITION                              |
| `%bxy`         | BALANCED `x` `y`                                   |
| `%f[set]`      | FRONTIER                                           |
| `%0` ... `%9`  | BACKREF                                            |
| `^` `$`        | BEGIN, END                                         |
*/

#ifndef LPAT_LEXER_H
#define LPAT_LEXER_H

#include <lpat/chars.h>
#include <lpat/debug.h>
#include <lpat/error.h>
#include <string>
#include <vector>

namespace lpat {

/// Pattern token.
struct Token {
  /// Token types.
  enum Type {
    LITERAL,  ///< byte
    ANY,      ///< `.`
    CLASS,    ///< `%a`, `%A`, ...
    SET,      ///< `[...]`
    STAR,     ///< `*`
    PLUS,     ///< `+`
    MINUS,    ///< `-`
    OPTIONAL, ///< `?`
    OPEN,     ///< `(`
    CLOSE,    ///< `)`
    POSITION, ///< `()`
    BALANCED, ///< `%bxy`
    FRONTIER, ///< `%f[...]`
    BACKREF,  ///< `%0` to `%9`
    BEGIN,    ///< `^`
    END,      ///< `$`
  };
  Token(Type type = LITERAL, size_t pos = 0)
    :
      type(type),
      pos(pos),
      byte(0),
      byte2(0),
      cls(CLASS_ALPHA),
      negate(false),
      index(0)
  { }
  /// Returns true if this is a quantifier token.
  bool quantifier() const
  {
    return type == STAR || type == PLUS || type == MINUS || type == OPTIONAL;
  }
  bool operator==(const Token& token) const;
  bool operator!=(const Token& token) const
  {
    return !operator==(token);
  }
  Type    type;   ///< token type
  size_t  pos;    ///< byte offset of the token in the pattern
  uint8_t byte;   ///< LITERAL byte or BALANCED open byte
  uint8_t byte2;  ///< BALANCED close byte
  Class   cls;    ///< CLASS class
  bool    negate; ///< CLASS complement
  size_t  index;  ///< BACKREF capture index
  Chars   chars;  ///< SET and FRONTIER members
};

/// Pattern lexer.
class Lexer {
 public:
  /// Construct a lexer for a pattern.
  explicit Lexer(const std::string& pattern) ///< pattern text
    :
      pat_(pattern),
      loc_(0)
  { }
  /// Scan the pattern into tokens, throws lpat::lex_error on malformed tokens.
  std::vector<Token> tokenize()
    /// @returns tokens in pattern order
    ;
  /// Scan the next token, throws lpat::lex_error on a malformed token.
  bool next(Token& token) ///< the token scanned
    /// @returns false when the pattern is exhausted
    ;
 private:
  void scan_escape(Token& token);
  void scan_set(Token& token);
  void error(pattern_error_type code, size_t pos) const;
  std::string        pat_; ///< the pattern
  size_t             loc_; ///< current location in the pattern
};

} // namespace lpat

#endif
