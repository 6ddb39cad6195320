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
@file      error.cpp
@brief     lpat pattern errors
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <lpat/error.h>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace lpat {

const pattern_error_type pattern_error::ends_with_escape;
const pattern_error_type pattern_error::missing_bracket;
const pattern_error_type pattern_error::missing_arguments;
const pattern_error_type pattern_error::missing_frontier;
const pattern_error_type pattern_error::invalid_capture;
const pattern_error_type pattern_error::unfinished_capture;
const pattern_error_type pattern_error::invalid_capture_index;
const pattern_error_type pattern_error::no_prior_element;
const pattern_error_type pattern_error::too_many_captures;
const pattern_error_type pattern_error::too_complex;

std::string pattern_error::message_of(pattern_error_type code, const std::string& pattern, size_t pos)
{
  static const char *messages[] = {
    "malformed pattern (ends with '%')",
    "malformed pattern (missing ']')",
    "missing arguments to '%b'",
    "missing '[' after '%f' in pattern",
    "invalid pattern capture",
    "unfinished capture",
    "invalid capture index",
    "malformed pattern (no prior element to quantify)",
    "too many captures",
    "pattern too complex",
  };
  if (code < 0 || static_cast<size_t>(code) >= sizeof(messages)/sizeof(messages[0]))
    return "invalid pattern";
  std::string message(messages[code]);
  // the offending backreference is at pos, name its index
  if (code == invalid_capture_index && pos + 1 < pattern.size() && pattern[pos] == '%')
    message.append(" %").push_back(pattern[pos + 1]);
  return message;
}

// A report shows the pattern window of up to 79 bytes around pos, with the
// message placed against the error position like so:
//
//   error at position 3
//   %a+)
//      \___invalid pattern capture
//
// Control bytes in the window are shown as '?' to keep the column alignment.
std::string pattern_error::pattern_error_report(pattern_error_type code, const std::string& pattern, size_t pos)
{
  std::string message(message_of(code, pattern, pos));
  size_t l = pattern.size();
  if (pos > l)
    pos = l;
  size_t n = pos / 40;
  size_t k = pos % 40 + (n == 0 ? 0 : 20);
  size_t from = n == 0 ? 0 : 40 * n - 20;
  size_t m = std::min(l - from, static_cast<size_t>(79));
  std::string window(pattern, from, m);
  for (std::string::iterator i = window.begin(); i != window.end(); ++i)
    if (std::iscntrl(static_cast<unsigned char>(*i)))
      *i = '?';
  std::string what("error at position ");
  what.append(ztoa(pos)).append("\n").append(window).append("\n");
  if (k >= message.size() + 4)
    what.append(k - message.size() - 4, ' ').append(message).append("___/\n");
  else
    what.append(k, ' ').append("\\___").append(message).append("\n");
  return what;
}

} // namespace lpat
