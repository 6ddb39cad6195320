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
@file      matcher.cpp
@brief     lpat backtracking matcher engine
@copyright (c) BSD-3 License - see LICENSE.txt

The engine walks the item sequence of a pattern with two cursors, the item
index p and the subject offset s.  Items that cannot backtrack (single bytes
without a quantifier, `%b`, `%f` and backreferences) advance in a loop, only
quantifiers and captures recurse.  The recursion depth is passed down by value
and checked against the depth limit on entry.
*/

#include <lpat/matcher.h>
#include <cctype>
#include <cstring>

namespace lpat {

const size_t Capture::OPEN;
const size_t Matcher::Const::NPOS;
const size_t Matcher::Const::MAXDEPTH;

Matcher& Matcher::operator=(const Matcher& matcher)
{
  if (this != &matcher)
  {
    if (own_)
      delete pat_;
    own_ = matcher.own_;
    pat_ = own_ ? new Pattern(*matcher.pat_) : matcher.pat_;
    copy(matcher);
  }
  return *this;
}

void Matcher::copy(const Matcher& matcher)
{
  buf_ = matcher.buf_;
  sub_ = matcher.sub_ == matcher.buf_.data() ? buf_.data() : matcher.sub_;
  len_ = matcher.len_;
  opt_ = matcher.opt_;
  for (Index i = 0; i < Pattern::Const::MAXCAPTURES; ++i)
    cap_[i] = matcher.cap_[i];
  res_ = matcher.res_;
  cur_ = matcher.cur_;
  num_ = matcher.num_;
  eof_ = matcher.eof_;
}

void Matcher::reset(const char *opt)
{
  DBGLOG("Matcher::reset()");
  if (opt != NULL)
  {
    opt_ = Option();
    for (const char *s = opt; *s != '\0'; ++s)
    {
      switch (*s)
      {
        case 'D':
        case 'M':
          {
            char c = *s;
            size_t n = 0;
            s += (s[1] == '=');
            while (std::isdigit(static_cast<unsigned char>(s[1])))
              n = 10 * n + (*++s - '0');
            if (c == 'D')
              opt_.D = n;
            else
              opt_.M = n;
          }
          break;
      }
    }
  }
  restart();
}

void Matcher::restart()
{
  res_ = MatchResult();
  cur_ = 0;
  num_ = 0;
  eof_ = false;
}

const MatchResult& Matcher::search(size_t init)
{
  DBGLOG("BEGIN Matcher::search(%zu)", init);
  res_ = MatchResult();
  if (init > len_)
    return res_;
  size_t s = init;
  do
  {
    if (attempt(s) != Const::NPOS)
      break;
  } while (s++ < len_ && !pat_->anchored_start());
  DBGLOG("END Matcher::search() %s", res_.matched ? "match" : "no match");
  return res_;
}

bool Matcher::match_at(size_t init)
{
  res_ = MatchResult();
  return init <= len_ && attempt(init) != Const::NPOS;
}

// find the next match at or after cur_, an empty match moves cur_ one byte
// further so the iteration always terminates
size_t Matcher::match()
{
  res_ = MatchResult();
  if (eof_ || (opt_.M > 0 && num_ >= opt_.M))
  {
    eof_ = true;
    return 0;
  }
  for (size_t s = cur_; s <= len_; ++s)
  {
    size_t e = attempt(s);
    if (e != Const::NPOS)
    {
      DBGLOG("Matcher::match() %zu found at %zu..%zu", num_ + 1, s, e);
      cur_ = e > s ? e : e + 1;
      ++num_;
      if (pat_->anchored_start())
        eof_ = true;
      return 1;
    }
    if (pat_->anchored_start())
      break;
  }
  eof_ = true;
  return 0;
}

size_t Matcher::attempt(size_t s)
{
  Index n = pat_->captures();
  for (Index i = 0; i < n; ++i)
    cap_[i] = Capture();
  size_t e = do_match(s, 0, 0);
  if (e == Const::NPOS)
    return e;
  res_.matched = true;
  res_.start = s;
  res_.end = e;
  res_.captures.assign(cap_, cap_ + n);
  return e;
}

size_t Matcher::do_match(size_t s, Index p, size_t depth)
{
  const Pattern::Items& items = pat_->items_;
  if (depth >= opt_.D)
    error(pattern_error::too_complex, p < items.size() ? items[p].pos : pat_->str().size());
  while (p < items.size())
  {
    const Item& item = items[p];
    switch (item.kind)
    {
      case Item::OPEN:
        return start_capture(s, p, depth);
      case Item::CLOSE:
        return end_capture(s, p, depth);
      case Item::BALANCED:
        s = match_balance(s, item);
        if (s == Const::NPOS)
          return s;
        break;
      case Item::FRONTIER:
        if (!match_frontier(s, item))
          return Const::NPOS;
        break;
      case Item::BACKREF:
        s = match_backref(s, item.index);
        if (s == Const::NPOS)
          return s;
        break;
      case Item::LITERAL:
      case Item::ANY:
      case Item::CLASS:
      case Item::SET:
        switch (item.quantifier)
        {
          case Item::NONE:
            if (!single(s, item))
              return Const::NPOS;
            ++s;
            break;
          case Item::OPTIONAL:
            if (single(s, item))
            {
              size_t e = do_match(s + 1, p + 1, depth + 1);
              if (e != Const::NPOS)
                return e;
            }
            break;
          case Item::PLUS:
            return single(s, item) ? max_expand(s + 1, p, depth) : Const::NPOS;
          case Item::STAR:
            return max_expand(s, p, depth);
          case Item::MINUS:
            return min_expand(s, p, depth);
        }
        break;
    }
    ++p;
  }
  if (pat_->anchored_end() && s != len_)
    return Const::NPOS;
  return s;
}

// match the longest run of the single-byte item at p, then give back one
// byte at a time until the rest of the pattern matches
size_t Matcher::max_expand(size_t s, Index p, size_t depth)
{
  const Item& item = pat_->items_[p];
  size_t i = 0;
  while (single(s + i, item))
    ++i;
  while (true)
  {
    size_t e = do_match(s + i, p + 1, depth + 1);
    if (e != Const::NPOS)
      return e;
    if (i == 0)
      return Const::NPOS;
    --i;
  }
}

// try the rest of the pattern first, then consume one more byte and retry
size_t Matcher::min_expand(size_t s, Index p, size_t depth)
{
  const Item& item = pat_->items_[p];
  while (true)
  {
    size_t e = do_match(s, p + 1, depth + 1);
    if (e != Const::NPOS)
      return e;
    if (!single(s, item))
      return Const::NPOS;
    ++s;
  }
}

size_t Matcher::start_capture(size_t s, Index p, size_t depth)
{
  const Item& item = pat_->items_[p];
  Capture& cap = cap_[item.index - 1];
  Capture saved = cap;
  cap = Capture(s, item.position ? s : Capture::OPEN, item.position);
  size_t e = do_match(s, p + 1, depth + 1);
  if (e == Const::NPOS)
    cap = saved;
  return e;
}

size_t Matcher::end_capture(size_t s, Index p, size_t depth)
{
  Capture& cap = cap_[pat_->items_[p].index - 1];
  DBGCHK(!cap.closed());
  cap.end = s;
  size_t e = do_match(s, p + 1, depth + 1);
  if (e == Const::NPOS)
    cap.end = Capture::OPEN;
  return e;
}

// the close byte is checked before the open byte, %bxx matches up to the next x
size_t Matcher::match_balance(size_t s, const Item& item) const
{
  if (s >= len_ || static_cast<uint8_t>(sub_[s]) != item.byte)
    return Const::NPOS;
  size_t level = 1;
  while (++s < len_)
  {
    uint8_t c = static_cast<uint8_t>(sub_[s]);
    if (c == item.byte2)
    {
      if (--level == 0)
        return s + 1;
    }
    else if (c == item.byte)
    {
      ++level;
    }
  }
  return Const::NPOS;
}

// a backreference to a position capture never matches
size_t Matcher::match_backref(size_t s, Index n) const
{
  const Capture& cap = cap_[n - 1];
  if (cap.position || !cap.closed())
    return Const::NPOS;
  size_t len = cap.size();
  if (len_ - s < len || std::memcmp(sub_ + cap.start, sub_ + s, len) != 0)
    return Const::NPOS;
  return s + len;
}

// the byte before the subject and the byte after it are taken to be \0
bool Matcher::match_frontier(size_t s, const Item& item) const
{
  uint8_t prev = s == 0 ? '\0' : static_cast<uint8_t>(sub_[s - 1]);
  uint8_t next = s < len_ ? static_cast<uint8_t>(sub_[s]) : '\0';
  return !item.chars.contains(prev) && item.chars.contains(next);
}

std::string Matcher::str(Index n) const
{
  if (n > 0 && n <= res_.captures.size() && res_.captures[n - 1].position)
    return ztoa(res_.captures[n - 1].start);
  std::pair<const char*,size_t> text = operator[](n);
  if (text.first == NULL)
    return std::string();
  return std::string(text.first, text.second);
}

std::pair<const char*,size_t> Matcher::operator[](Index n) const
{
  if (!res_.matched)
    return std::pair<const char*,size_t>(static_cast<const char*>(NULL), 0);
  if (n == 0)
    return std::pair<const char*,size_t>(begin(), size());
  if (n > res_.captures.size())
    return std::pair<const char*,size_t>(static_cast<const char*>(NULL), 0);
  const Capture& cap = res_.captures[n - 1];
  return std::pair<const char*,size_t>(sub_ + cap.start, cap.size());
}

void Matcher::error(pattern_error_type code, size_t pos) const
{
  DBGLOG("Matcher error %d at %zu", code, pos);
  throw match_error(code, pat_->str(), pos);
}

} // namespace lpat
