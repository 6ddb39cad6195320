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
@file      matcher.h
@brief     lpat backtracking matcher engine
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef LPAT_MATCHER_H
#define LPAT_MATCHER_H

#include <lpat/debug.h>
#include <lpat/error.h>
#include <lpat/pattern.h>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace lpat {

/// A capture recorded by a match: a span of the subject or, for `()`, a position.
struct Capture {
  static const size_t OPEN = static_cast<size_t>(-1); ///< end of a capture that is not closed yet
  Capture(
      size_t start = 0,
      size_t end = OPEN,
      bool   position = false)
    :
      start(start),
      end(end),
      position(position)
  { }
  /// Returns true if the capture is closed.
  bool closed() const
  {
    return end != OPEN;
  }
  /// Returns the length of a closed span capture, zero for position captures.
  size_t size() const
  {
    return position || end == OPEN ? 0 : end - start;
  }
  bool operator==(const Capture& capture) const
  {
    return start == capture.start && end == capture.end && position == capture.position;
  }
  size_t start;    ///< offset of the span in the subject, or the position of a position capture
  size_t end;      ///< offset after the span, equal to start for position captures, or OPEN
  bool   position; ///< true for a position capture `()`
};

/// The result of a match attempt.
struct MatchResult {
  MatchResult()
    :
      matched(false),
      start(0),
      end(0)
  { }
  /// Returns the captures, or the whole match as one capture when the pattern has no captures.
  std::vector<Capture> values() const
  {
    if (matched && captures.empty())
      return std::vector<Capture>(1, Capture(start, end));
    return captures;
  }
  bool                 matched;  ///< true if the pattern matched
  size_t               start;    ///< offset of the match in the subject
  size_t               end;      ///< offset after the match
  std::vector<Capture> captures; ///< captures 1 to N of the pattern
};

/// lpat matcher engine class, matches a lpat::Pattern against a subject byte sequence.
/**
A matcher owns its capture table and recursion counter, the pattern is shared
and must persist.  The subject is not copied when given as a pointer and
length, but is copied when given as a std::string.

Matcher options are given as a string of the form `(D=n|M=n|;)*`:

| Option | Effect                                                                  |
| ------ | ----------------------------------------------------------------------- |
| `D=n`  | recursion depth limit, 200 by default                                   |
| `M=n`  | stop the `find` iteration after n matches, 0 (default) is no limit      |

Example:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    lpat::Pattern pattern("(%a+)=(%d+)");
    lpat::Matcher matcher(pattern, "x=1, y=22");
    for (lpat::Matcher::iterator match = matcher.find.begin(); match != matcher.find.end(); ++match)
      std::cout << match->str(1) << " is " << match->str(2) << std::endl;
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/
class Matcher {
 public:
  typedef Pattern::Item  Item;
  typedef Pattern::Index Index;
  /// Common constants.
  struct Const {
    static const size_t NPOS     = static_cast<size_t>(-1); ///< no match
    static const size_t MAXDEPTH = 200;                     ///< default recursion depth limit
  };
  /// Matcher::Iterator class for searching successive matches.
  class Iterator {
    friend class Matcher;
   public:
    typedef std::input_iterator_tag iterator_category;
    typedef Matcher                 value_type;
    typedef std::ptrdiff_t          difference_type;
    typedef Matcher*                pointer;
    typedef Matcher&                reference;
    /// Construct an end iterator.
    Iterator()
      :
        matcher_(NULL)
    { }
    /// Matcher::Iterator dereference.
    Matcher& operator*() const
      /// @returns reference to the iterator's matcher
    {
      return *matcher_;
    }
    /// Matcher::Iterator pointer.
    Matcher* operator->() const
      /// @returns pointer to the iterator's matcher
    {
      return matcher_;
    }
    bool operator==(const Iterator& rhs) const
    {
      return matcher_ == rhs.matcher_;
    }
    bool operator!=(const Iterator& rhs) const
    {
      return matcher_ != rhs.matcher_;
    }
    /// Matcher::Iterator preincrement finds the next match.
    Iterator& operator++()
    {
      if (matcher_->match() == 0)
        matcher_ = NULL;
      return *this;
    }
    /// Matcher::Iterator postincrement.
    Iterator operator++(int)
    {
      Iterator it = *this;
      operator++();
      return it;
    }
   private:
    /// Construct an iterator positioned at the next match of the matcher.
    explicit Iterator(Matcher *matcher)
      :
        matcher_(matcher)
    {
      if (matcher_ != NULL && matcher_->match() == 0)
        matcher_ = NULL;
    }
    Matcher *matcher_; ///< the matcher used by this iterator
  };
  typedef Iterator iterator;
  /// Matcher::Operation functor to search the next match, also provides an iterator over the matches.
  class Operation {
   public:
    explicit Operation(Matcher *matcher)
      :
        matcher_(matcher)
    { }
    /// Find the next match.
    size_t operator()() const
      /// @returns 1 for a match or 0 for end of matches
    {
      return matcher_->match();
    }
    /// Returns an input iterator to the next match.
    iterator begin() const
    {
      return iterator(matcher_);
    }
    /// Returns the end iterator.
    iterator end() const
    {
      return iterator();
    }
   private:
    Matcher *matcher_; ///< the matcher used by this functor
  };
  /// Construct a matcher for a pattern and a subject that is not copied.
  Matcher(
      const Pattern& pattern,         ///< pattern, shared and must persist
      const char    *subject,         ///< subject bytes
      size_t         size,            ///< subject length
      const char    *opt = NULL)      ///< option string of the form `(D=n|M=n|;)*`
    :
      find(this),
      pat_(&pattern),
      own_(false)
  {
    input(subject, size);
    reset(opt);
  }
  /// Construct a matcher for a pattern and a copy of a subject.
  Matcher(
      const Pattern&     pattern,    ///< pattern, shared and must persist
      const std::string& subject,    ///< subject string
      const char        *opt = NULL) ///< option string of the form `(D=n|M=n|;)*`
    :
      find(this),
      pat_(&pattern),
      own_(false)
  {
    input(subject);
    reset(opt);
  }
  /// Construct a matcher for a pattern string and a copy of a subject, throws lpat::lex_error or lpat::parse_error.
  Matcher(
      const char        *pattern,    ///< pattern string, compiled with default pattern options
      const std::string& subject,    ///< subject string
      const char        *opt = NULL) ///< option string of the form `(D=n|M=n|;)*`
    :
      find(this),
      pat_(new Pattern(pattern)),
      own_(true)
  {
    input(subject);
    reset(opt);
  }
  /// Copy constructor, the pattern is shared unless owned.
  Matcher(const Matcher& matcher)
    :
      find(this),
      pat_(matcher.own_ ? new Pattern(*matcher.pat_) : matcher.pat_),
      own_(matcher.own_)
  {
    copy(matcher);
  }
  /// Assign a matcher, the pattern is shared unless owned.
  Matcher& operator=(const Matcher& matcher);
  /// Delete matcher, deletes the pattern when owned.
  virtual ~Matcher()
  {
    if (own_)
      delete pat_;
  }
  /// Returns a reference to the pattern associated with this matcher.
  const Pattern& pattern() const
  {
    return *pat_;
  }
  /// Set the subject, not copied, and restart the search at offset 0.
  Matcher& input(
      const char *subject, ///< subject bytes
      size_t      size)    ///< subject length
  {
    buf_.clear();
    sub_ = subject;
    len_ = size;
    restart();
    return *this;
  }
  /// Set the subject to a copy of a string and restart the search at offset 0.
  Matcher& input(const std::string& subject) ///< subject string
  {
    buf_ = subject;
    sub_ = buf_.data();
    len_ = buf_.size();
    restart();
    return *this;
  }
  /// Reset the options when given and restart the search at offset 0.
  void reset(const char *opt = NULL);
  /// Set the offset in the subject to start the next find at.
  Matcher& at(size_t init) ///< start offset, the search is exhausted if beyond the end of the subject
  {
    restart();
    cur_ = init;
    return *this;
  }
  /// Search the leftmost match starting at offset init, at offset init only when the pattern is anchored with `^`.
  const MatchResult& search(size_t init = 0) ///< start offset
    /// @returns match result, MatchResult::matched is false when there is no match
    ;
  /// Attempt one match at exactly offset init, regardless of a `^` anchor.
  bool match_at(size_t init) ///< offset
    /// @returns true if the pattern matches at init
    ;
  /// Returns the result of the last match attempt.
  const MatchResult& result() const
  {
    return res_;
  }
  /// Returns true if the last match attempt succeeded.
  bool matched() const
  {
    return res_.matched;
  }
  /// Returns offset of the match in the subject.
  size_t first() const
  {
    return res_.start;
  }
  /// Returns offset after the match in the subject.
  size_t last() const
  {
    return res_.end;
  }
  /// Returns the length of the match.
  size_t size() const
  {
    return res_.end - res_.start;
  }
  /// Returns a pointer to the match in the subject (not 0-terminated).
  const char *begin() const
  {
    return sub_ + res_.start;
  }
  /// Returns the match as a string.
  std::string str() const
  {
    return std::string(begin(), size());
  }
  /// Returns capture n as a string, the whole match for n == 0, the decimal offset for a position capture, or empty.
  std::string str(Index n) const;
  /// Returns the number of captures of the pattern.
  Index groups() const
  {
    return pat_->captures();
  }
  /// Returns capture n, 1 <= n <= groups(), of the last match.
  const Capture& capture(Index n) const
  {
    return res_.captures.at(n - 1);
  }
  /// Returns captured text as a std::pair<const char*,size_t> with string pointer (non-0-terminated) and length, the whole match for n == 0.
  std::pair<const char*,size_t> operator[](Index n) const;
  /// Returns the number of matches found by the find iteration since the last restart.
  size_t matches_found() const
  {
    return num_;
  }
  /// Returns the subject.
  const char *subject() const
  {
    return sub_;
  }
  /// Returns the length of the subject.
  size_t subject_size() const
  {
    return len_;
  }
  Operation find; ///< functor to search successive matches
 private:
  /// Matcher options.
  struct Option {
    Option()
      :
        D(Const::MAXDEPTH),
        M(0)
    { }
    size_t D; ///< recursion depth limit
    size_t M; ///< max number of matches produced by find, 0 for no limit
  };
  void   copy(const Matcher& matcher);
  void   restart();
  size_t match();
  size_t attempt(size_t s);
  size_t do_match(size_t s, Index p, size_t depth);
  size_t max_expand(size_t s, Index p, size_t depth);
  size_t min_expand(size_t s, Index p, size_t depth);
  size_t start_capture(size_t s, Index p, size_t depth);
  size_t end_capture(size_t s, Index p, size_t depth);
  size_t match_balance(size_t s, const Item& item) const;
  size_t match_backref(size_t s, Index n) const;
  bool   match_frontier(size_t s, const Item& item) const;
  /// Returns true if the byte at s matches single-byte item.
  bool single(size_t s, const Item& item) const
  {
    return s < len_ && item.matches(static_cast<uint8_t>(sub_[s]));
  }
  void   error(pattern_error_type code, size_t pos) const;
  const Pattern *pat_;                              ///< points to the pattern
  bool           own_;                              ///< true if Matcher::pat_ was allocated and should be deleted
  std::string    buf_;                              ///< copy of the subject when given as a string
  const char    *sub_;                              ///< the subject
  size_t         len_;                              ///< length of the subject
  Option         opt_;                              ///< matcher options
  Capture        cap_[Pattern::Const::MAXCAPTURES]; ///< capture table, capture n at n - 1
  MatchResult    res_;                              ///< result of the last match attempt
  size_t         cur_;                              ///< offset where the next find starts
  size_t         num_;                              ///< number of matches found since the last restart
  bool           eof_;                              ///< true if the find iteration is exhausted
};

} // namespace lpat

#endif
