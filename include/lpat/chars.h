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
@file      chars.h
@brief     lpat byte classes and 256-bit byte sets
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef LPAT_CHARS_H
#define LPAT_CHARS_H

#include <cstddef>
#include <cstdint>

namespace lpat {

/// Byte classes named by a `%` escape, an uppercase escape letter denotes the complement of the class.
enum Class {
  CLASS_ALPHA,  ///< `%a` letters
  CLASS_CNTRL,  ///< `%c` control bytes
  CLASS_DIGIT,  ///< `%d` decimal digits
  CLASS_GRAPH,  ///< `%g` printable bytes except space
  CLASS_LOWER,  ///< `%l` lowercase letters
  CLASS_PUNCT,  ///< `%p` punctuation
  CLASS_SPACE,  ///< `%s` white space
  CLASS_UPPER,  ///< `%u` uppercase letters
  CLASS_ALNUM,  ///< `%w` letters and digits
  CLASS_XDIGIT, ///< `%x` hexadecimal digits
};

/// Look up the class named by an escape letter.
bool class_of(
    uint8_t c,      ///< escape letter following a `%`
    Class&  cls,    ///< set to the class named by the letter
    bool&   negate) ///< set to true when the letter is uppercase
  /// @returns true if c names a class
  ;

/// Check if byte c is a member of class cls.
bool class_test(
    Class   cls, ///< class
    uint8_t c)   ///< byte to test
  /// @returns true if c is in the class
  ;

/// Get the escape letter of a class, lowercase or uppercase when negated.
char class_letter(Class cls, bool negate);

/// Set of 8-bit bytes.
struct Chars {
  Chars()                                 { clear(); }
  void   clear()                          { b[0] = b[1] = b[2] = b[3] = 0ULL; }
  bool   any()                      const { return b[0] | b[1] | b[2] | b[3]; }
  bool   contains(uint8_t c)        const { return b[c >> 6] & (1ULL << (c & 0x3f)); }
  Chars& add(uint8_t c)                   { b[c >> 6] |= 1ULL << (c & 0x3f); return *this; }
  Chars& add(uint8_t lo, uint8_t hi)      { for (unsigned c = lo; c <= hi; ++c) add(static_cast<uint8_t>(c)); return *this; }
  Chars& add(Class cls, bool negate = false);
  Chars& flip()                           { b[0] = ~b[0]; b[1] = ~b[1]; b[2] = ~b[2]; b[3] = ~b[3]; return *this; }
  Chars& operator|=(const Chars& c)       { b[0] |= c.b[0]; b[1] |= c.b[1]; b[2] |= c.b[2]; b[3] |= c.b[3]; return *this; }
  Chars  operator~()                const { return Chars(*this).flip(); }
  bool   operator!=(const Chars& c) const { return (b[0] ^ c.b[0]) | (b[1] ^ c.b[1]) | (b[2] ^ c.b[2]) | (b[3] ^ c.b[3]); }
  bool   operator==(const Chars& c) const { return !(c != *this); }
  size_t count()                    const;
  uint64_t b[4]; ///< 256 bits to store a set of 8-bit bytes
};

} // namespace lpat

#endif
