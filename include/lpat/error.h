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
@file      error.h
@brief     lpat pattern errors
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef LPAT_ERROR_H
#define LPAT_ERROR_H

#include <cstdio>
#include <stdexcept>
#include <string>

namespace lpat {

inline std::string ztoa(size_t n)
{
  char buf[24];
  snprintf(buf, sizeof(buf), "%zu", n);
  return std::string(buf);
}

/// Pattern error exception error code.
typedef int pattern_error_type;

/// Pattern errors raised by the lexer, the parser and the matcher.
class pattern_error : public std::runtime_error {
 public:
  /// The stage that raised the error.
  enum Kind { LEX, PARSE, MATCH };
  static const pattern_error_type ends_with_escape      = 0;  ///< `%` is the last byte of the pattern
  static const pattern_error_type missing_bracket       = 1;  ///< set `[...` is not terminated
  static const pattern_error_type missing_arguments     = 2;  ///< `%b` is not followed by two bytes
  static const pattern_error_type missing_frontier      = 3;  ///< `%f` is not followed by a set
  static const pattern_error_type invalid_capture       = 4;  ///< `)` without a matching `(`
  static const pattern_error_type unfinished_capture    = 5;  ///< `(` without a matching `)`
  static const pattern_error_type invalid_capture_index = 6;  ///< `%n` refers to a capture that is not closed before it
  static const pattern_error_type no_prior_element      = 7;  ///< quantifier without a single-byte item to quantify
  static const pattern_error_type too_many_captures     = 8;  ///< more than Const::MAXCAPTURES captures
  static const pattern_error_type too_complex           = 9;  ///< matcher recursion depth limit reached
  /// Construct pattern error info.
  pattern_error(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos = 0)
    :
      std::runtime_error(pattern_error_report(code, pattern, pos)),
      code_(code),
      pos_(pos),
      msg_(message_of(code, pattern, pos))
  { }
  /// Destructor.
  virtual ~pattern_error() throw()
  { }
  /// Returns error code, a lpat::pattern_error_type constant.
  pattern_error_type code()
    const
  {
    return code_;
  }
  /// Returns position of the error in the pattern.
  size_t pos()
    const
  {
    return pos_;
  }
  /// Returns the stage that raised this error.
  Kind kind()
    const
  {
    return code_ <= missing_frontier ? LEX : code_ <= too_many_captures ? PARSE : MATCH;
  }
  /// Returns the error message without the pattern excerpt.
  const std::string& message()
    const
  {
    return msg_;
  }
  /// Returns the error message of an error code, the pattern is used to name the capture index of invalid_capture_index.
  static std::string message_of(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos);
 private:
  static std::string pattern_error_report(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos);
  pattern_error_type code_;
  size_t             pos_;
  std::string        msg_;
};

/// Malformed token in a pattern, raised by lpat::Lexer.
class lex_error : public pattern_error {
 public:
  lex_error(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos = 0)
    :
      pattern_error(code, pattern, pos)
  { }
};

/// Malformed pattern structure, raised by lpat::Pattern.
class parse_error : public pattern_error {
 public:
  parse_error(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos = 0)
    :
      pattern_error(code, pattern, pos)
  { }
};

/// Match attempt aborted, raised by lpat::Matcher.
class match_error : public pattern_error {
 public:
  match_error(
      pattern_error_type code,
      const std::string& pattern,
      size_t             pos = 0)
    :
      pattern_error(code, pattern, pos)
  { }
};

} // namespace lpat

#endif
