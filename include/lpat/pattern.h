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
@file      pattern.h
@brief     lpat pattern parser and compiled pattern
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef LPAT_PATTERN_H
#define LPAT_PATTERN_H

#include <lpat/chars.h>
#include <lpat/debug.h>
#include <lpat/error.h>
#include <lpat/lexer.h>
#include <cstdio>
#include <string>
#include <vector>

namespace lpat {

/// Pattern class holds a pattern string and its compiled item sequence for the lpat::Matcher engine.
/**
A pattern is compiled once at construction and is immutable afterwards: it
holds no match state and can be shared read-only by any number of matchers,
also across threads.

Pattern options are given as a string of the form `(l|w|n=name|f=file.txt|;)*`:

| Option        | Effect                                                        |
| ------------- | ------------------------------------------------------------- |
| `l`           | a quantifier without a prior single-byte item is a literal    |
| `w`           | write the error report to stderr before throwing              |
| `n=name`      | name the pattern in item listings                             |
| `f=file.txt`  | write an item listing to file.txt, `stdout.txt` for stdout    |

A leading `+` in a file name appends the listing to the file.
*/
class Pattern {
  friend class Matcher; ///< permit access by the lpat::Matcher engine
 public:
  typedef uint32_t Index; ///< index into the item sequence and capture indexing
  /// Common constants.
  struct Const {
    static const Index MAXCAPTURES = 32; ///< max number of captures in a pattern
  };
  /// Pattern item, a single matchable unit.
  struct Item {
    /// Item kinds.
    enum Kind {
      LITERAL,  ///< a byte
      ANY,      ///< any byte
      CLASS,    ///< a byte in a class
      SET,      ///< a byte in a set
      OPEN,     ///< capture start, or a position capture
      CLOSE,    ///< capture end
      BALANCED, ///< balanced byte pair and its content
      FRONTIER, ///< zero-width transition into a set
      BACKREF,  ///< repetition of a closed capture
    };
    /// Item quantifiers.
    enum Quantifier {
      NONE,     ///< exactly once
      STAR,     ///< `*` greedy zero or more
      PLUS,     ///< `+` greedy one or more
      MINUS,    ///< `-` lazy zero or more
      OPTIONAL, ///< `?` zero or one
    };
    Item(Kind kind = LITERAL, size_t pos = 0)
      :
        kind(kind),
        quantifier(NONE),
        pos(pos),
        byte(0),
        byte2(0),
        cls(CLASS_ALPHA),
        negate(false),
        index(0),
        position(false)
    { }
    /// Returns true if this item matches exactly one byte and may be quantified.
    bool single() const
    {
      return kind == LITERAL || kind == ANY || kind == CLASS || kind == SET;
    }
    /// Returns true if byte c matches this single-byte item.
    bool matches(uint8_t c) const
    {
      switch (kind)
      {
        case LITERAL:
          return c == byte;
        case ANY:
          return true;
        case CLASS:
          return class_test(cls, c) != negate;
        case SET:
          return chars.contains(c);
        default:
          return false;
      }
    }
    bool operator==(const Item& item) const;
    bool operator!=(const Item& item) const
    {
      return !operator==(item);
    }
    Kind       kind;       ///< item kind
    Quantifier quantifier; ///< quantifier of a single-byte item
    size_t     pos;        ///< byte offset of the item in the pattern
    uint8_t    byte;       ///< LITERAL byte or BALANCED open byte
    uint8_t    byte2;      ///< BALANCED close byte
    Class      cls;        ///< CLASS class
    bool       negate;     ///< CLASS complement
    Index      index;      ///< OPEN, CLOSE and BACKREF capture index 1 to Const::MAXCAPTURES
    bool       position;   ///< OPEN is a position capture `()`
    Chars      chars;      ///< SET and FRONTIER members
  };
  typedef std::vector<Item> Items;
  /// Construct a pattern object given a pattern string.
  explicit Pattern(
      const char *pattern,
      const char *options = NULL)
    :
      pat_(pattern != NULL ? pattern : "")
  {
    init(options);
  }
  /// Construct a pattern object given a pattern string.
  explicit Pattern(
      const std::string& pattern,
      const char        *options = NULL)
    :
      pat_(pattern)
  {
    init(options);
  }
  /// Construct a pattern object given a pattern string.
  Pattern(
      const std::string& pattern,
      const std::string& options)
    :
      pat_(pattern)
  {
    init(options.c_str());
  }
  /// Returns the pattern string.
  const std::string& str() const
  {
    return pat_;
  }
  /// Returns the compiled items.
  const Items& items() const
  {
    return items_;
  }
  /// Returns item at index i.
  const Item& operator[](Index i) const
  {
    return items_.at(i);
  }
  /// Returns the number of items.
  size_t size() const
  {
    return items_.size();
  }
  /// Returns the number of captures declared by this pattern.
  Index captures() const
  {
    return ncap_;
  }
  /// Returns true if the pattern starts with a `^` anchor.
  bool anchored_start() const
  {
    return bob_;
  }
  /// Returns true if the pattern ends with a `$` anchor.
  bool anchored_end() const
  {
    return eob_;
  }
  /// Returns the pattern name set with option `n=name`, or "PATTERN".
  const std::string& name() const
  {
    return opt_.n;
  }
  /// Structural equality of the compiled items and anchors.
  bool operator==(const Pattern& pattern) const
  {
    return bob_ == pattern.bob_ && eob_ == pattern.eob_ && ncap_ == pattern.ncap_ && items_ == pattern.items_;
  }
  bool operator!=(const Pattern& pattern) const
  {
    return !operator==(pattern);
  }
  /// Write a listing of the items to a file.
  void write(FILE *file) const;
 protected:
  /// Throw an error.
  void error(
      pattern_error_type code,    ///< error code
      size_t             pos = 0) ///< location of the error in the pattern string Pattern::pat_
    const;
 private:
  /// Pattern options.
  struct Option {
    Option() : l(), w(), n("PATTERN"), f() { }
    bool                     l; ///< quantifier bytes without a quantifiable prior item are literals
    bool                     w; ///< write error message to stderr
    std::string              n; ///< pattern name
    std::vector<std::string> f; ///< output the item listing to file(s)
  };
  void init(const char *options);
  void init_options(const char *options);
  void parse(const std::vector<Token>& tokens);
  void export_items() const;
  Option      opt_;  ///< pattern options
  std::string pat_;  ///< pattern string
  Items       items_;///< compiled items
  Index       ncap_; ///< number of captures
  bool        bob_;  ///< anchored at the start of the search `^`
  bool        eob_;  ///< anchored at the end of the subject `$`
};

} // namespace lpat

#endif
