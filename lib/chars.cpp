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
@file      chars.cpp
@brief     lpat byte classes and 256-bit byte sets
@copyright (c) BSD-3 License - see LICENSE.txt

Classes follow the "C" locale character classification of the ASCII range,
bytes 128 to 255 are not in any class.
*/

#include <lpat/chars.h>

namespace lpat {

// Byte ranges of each class, pairs of lo and hi terminated by 0, 0
static const int Alpha[]  = { 'A', 'Z', 'a', 'z', 0, 0 };
static const int Cntrl[]  = { 0, 31, 127, 127, 0, 0 };
static const int Digit[]  = { '0', '9', 0, 0 };
static const int Graph[]  = { '!', '~', 0, 0 };
static const int Lower[]  = { 'a', 'z', 0, 0 };
static const int Punct[]  = { '!', '/', ':', '@', '[', '`', '{', '~', 0, 0 };
static const int Space[]  = { 9, 13, 32, 32, 0, 0 };
static const int Upper[]  = { 'A', 'Z', 0, 0 };
static const int Alnum[]  = { '0', '9', 'A', 'Z', 'a', 'z', 0, 0 };
static const int XDigit[] = { '0', '9', 'A', 'F', 'a', 'f', 0, 0 };

static const int *ranges(Class cls)
{
  switch (cls)
  {
    case CLASS_ALPHA:  return Alpha;
    case CLASS_CNTRL:  return Cntrl;
    case CLASS_DIGIT:  return Digit;
    case CLASS_GRAPH:  return Graph;
    case CLASS_LOWER:  return Lower;
    case CLASS_PUNCT:  return Punct;
    case CLASS_SPACE:  return Space;
    case CLASS_UPPER:  return Upper;
    case CLASS_ALNUM:  return Alnum;
    case CLASS_XDIGIT: return XDigit;
  }
  return Digit;
}

bool class_of(uint8_t c, Class& cls, bool& negate)
{
  negate = c >= 'A' && c <= 'Z';
  switch (negate ? c - 'A' + 'a' : c)
  {
    case 'a': cls = CLASS_ALPHA;  break;
    case 'c': cls = CLASS_CNTRL;  break;
    case 'd': cls = CLASS_DIGIT;  break;
    case 'g': cls = CLASS_GRAPH;  break;
    case 'l': cls = CLASS_LOWER;  break;
    case 'p': cls = CLASS_PUNCT;  break;
    case 's': cls = CLASS_SPACE;  break;
    case 'u': cls = CLASS_UPPER;  break;
    case 'w': cls = CLASS_ALNUM;  break;
    case 'x': cls = CLASS_XDIGIT; break;
    default:
      negate = false;
      return false;
  }
  return true;
}

bool class_test(Class cls, uint8_t c)
{
  switch (cls)
  {
    case CLASS_ALPHA:
      return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    case CLASS_CNTRL:
      return c < 32 || c == 127;
    case CLASS_DIGIT:
      return c >= '0' && c <= '9';
    case CLASS_GRAPH:
      return c > 32 && c < 127;
    case CLASS_LOWER:
      return c >= 'a' && c <= 'z';
    case CLASS_PUNCT:
      return c > 32 && c < 127 && !class_test(CLASS_ALNUM, c);
    case CLASS_SPACE:
      return c == ' ' || (c >= '\t' && c <= '\r');
    case CLASS_UPPER:
      return c >= 'A' && c <= 'Z';
    case CLASS_ALNUM:
      return class_test(CLASS_ALPHA, c) || class_test(CLASS_DIGIT, c);
    case CLASS_XDIGIT:
      return class_test(CLASS_DIGIT, c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
  }
  return false;
}

char class_letter(Class cls, bool negate)
{
  static const char letters[] = "acdglpsuwx";
  char c = letters[cls];
  return negate ? static_cast<char>(c - 'a' + 'A') : c;
}

Chars& Chars::add(Class cls, bool negate)
{
  Chars chars;
  for (const int *r = ranges(cls); r[0] != 0 || r[1] != 0; r += 2)
    chars.add(static_cast<uint8_t>(r[0]), static_cast<uint8_t>(r[1]));
  if (negate)
    chars.flip();
  return *this |= chars;
}

size_t Chars::count() const
{
  size_t n = 0;
  for (int i = 0; i < 4; ++i)
    for (uint64_t w = b[i]; w != 0; w &= w - 1)
      ++n;
  return n;
}

} // namespace lpat
