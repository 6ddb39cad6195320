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
@file      matcher_test.cpp
@brief     lpat matcher tests
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <lpat/matcher.h>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

namespace {

using ::lpat::Capture;
using ::lpat::MatchResult;
using ::lpat::Matcher;
using ::lpat::Pattern;
using ::lpat::match_error;
using ::lpat::pattern_error;

typedef std::pair<size_t,size_t> Span;

// the spans of all matches produced by the find iteration
std::vector<Span> FindAll(Matcher& matcher)
{
  std::vector<Span> spans;
  for (Matcher::iterator match = matcher.find.begin(); match != matcher.find.end(); ++match)
    spans.push_back(Span(match->first(), match->last()));
  return spans;
}

std::vector<std::string> FindAllText(const char *pattern, const std::string& subject)
{
  std::vector<std::string> texts;
  Matcher matcher(pattern, subject);
  while (matcher.find())
    texts.push_back(matcher.str());
  return texts;
}

TEST(MatcherTest, SearchIsRepeatable)
{
  Pattern pattern("(%a+)%s*=%s*(%d+)");
  Matcher matcher(pattern, "  key = 42;");
  MatchResult first = matcher.search();
  MatchResult second = matcher.search();
  ASSERT_TRUE(first.matched);
  EXPECT_EQ(first.start, second.start);
  EXPECT_EQ(first.end, second.end);
  EXPECT_EQ(first.captures, second.captures);
  EXPECT_EQ(first.start, 2u);
  EXPECT_EQ(first.end, 10u);
  EXPECT_EQ(matcher.str(1), "key");
  EXPECT_EQ(matcher.str(2), "42");
}

TEST(MatcherTest, AnchorIsRelativeToStartOffset)
{
  Pattern pattern("^abc");
  Matcher matcher(pattern, "xabc");
  EXPECT_FALSE(matcher.search(0).matched);
  const MatchResult& result = matcher.search(1);
  ASSERT_TRUE(result.matched);
  EXPECT_EQ(result.start, 1u);
  EXPECT_EQ(result.end, 4u);
}

TEST(MatcherTest, UnanchoredScans)
{
  Pattern pattern("abc");
  Matcher matcher(pattern, "xabc");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 1u);
  EXPECT_EQ(matcher.last(), 4u);
  EXPECT_EQ(matcher.str(), "abc");
  EXPECT_FALSE(matcher.search(2).matched);
}

TEST(MatcherTest, StartOffsetBeyondSubject)
{
  Pattern pattern("");
  Matcher matcher(pattern, "ab");
  EXPECT_TRUE(matcher.search(2).matched);
  EXPECT_FALSE(matcher.search(3).matched);
  Matcher empty(pattern, "");
  EXPECT_TRUE(empty.search().matched);
  EXPECT_FALSE(empty.search(1).matched);
}

TEST(MatcherTest, EndAnchor)
{
  Pattern pattern("a$");
  Matcher matcher(pattern, "aba");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 2u);
  Pattern both("^$");
  EXPECT_TRUE(Matcher(both, "").search().matched);
  EXPECT_FALSE(Matcher(both, "x").search().matched);
}

TEST(MatcherTest, GreedyAndLazy)
{
  Pattern greedy("a.*b");
  Matcher matcher(greedy, "axbxb");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 0u);
  EXPECT_EQ(matcher.last(), 5u);

  Pattern lazy("a.-b");
  Matcher other(lazy, "axbxb");
  ASSERT_TRUE(other.search().matched);
  EXPECT_EQ(other.first(), 0u);
  EXPECT_EQ(other.last(), 3u);

  Pattern minus("a-");
  Matcher empty(minus, "aaa");
  ASSERT_TRUE(empty.search().matched);
  EXPECT_EQ(empty.size(), 0u);
}

TEST(MatcherTest, PlusAndOptional)
{
  EXPECT_EQ(FindAllText("%d+", "a1b22c333"), (std::vector<std::string>{ "1", "22", "333" }));
  Pattern pattern("colou?r");
  EXPECT_TRUE(Matcher(pattern, "color").search().matched);
  EXPECT_TRUE(Matcher(pattern, "colour").search().matched);
  EXPECT_FALSE(Matcher(pattern, "colouur").search().matched);
}

TEST(MatcherTest, GreedyGivesBack)
{
  Pattern pattern("(a+)ab");
  Matcher matcher(pattern, "aaab");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.str(1), "aa");
  Pattern fails("(a+)b");
  EXPECT_FALSE(Matcher(fails, "aaac").search().matched);
}

TEST(MatcherTest, Captures)
{
  Pattern pattern("(%a+) (%a+)");
  Matcher matcher(pattern, "hello world");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.groups(), 2u);
  EXPECT_EQ(matcher.capture(1), Capture(0, 5));
  EXPECT_EQ(matcher.capture(2), Capture(6, 11));
  EXPECT_EQ(matcher.str(1), "hello");
  EXPECT_EQ(matcher.str(2), "world");
  EXPECT_EQ(matcher.str(0), "hello world");
  std::pair<const char*,size_t> text = matcher[2];
  EXPECT_EQ(std::string(text.first, text.second), "world");
  EXPECT_EQ(matcher[3].first, static_cast<const char*>(NULL));
}

TEST(MatcherTest, NestedCaptures)
{
  Pattern pattern("((a)(b))");
  Matcher matcher(pattern, "xab");
  ASSERT_TRUE(matcher.search().matched);
  std::vector<Capture> values = matcher.result().values();
  ASSERT_EQ(values.size(), 3u);
  EXPECT_EQ(values[0], Capture(1, 3));
  EXPECT_EQ(values[1], Capture(1, 2));
  EXPECT_EQ(values[2], Capture(2, 3));
}

TEST(MatcherTest, CapturesRollBack)
{
  Pattern pattern("(a*)b");
  Matcher matcher(pattern, "aac aab");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.capture(1), Capture(4, 6));
}

TEST(MatcherTest, PositionCapture)
{
  Pattern pattern("a()b");
  Matcher matcher(pattern, "abc");
  ASSERT_TRUE(matcher.search().matched);
  const Capture& capture = matcher.capture(1);
  EXPECT_TRUE(capture.position);
  EXPECT_EQ(capture.start, 1u);
  EXPECT_EQ(capture.size(), 0u);
  EXPECT_EQ(matcher.str(1), "1");
}

TEST(MatcherTest, ValuesWithoutCaptures)
{
  Pattern pattern("b");
  Matcher matcher(pattern, "abc");
  ASSERT_TRUE(matcher.search().matched);
  std::vector<Capture> values = matcher.result().values();
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(values[0], Capture(1, 2));
  EXPECT_TRUE(Matcher(pattern, "xyz").search().values().empty());
}

TEST(MatcherTest, Balanced)
{
  Pattern pattern("%b()");
  Matcher matcher(pattern, "(a(b)c)");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 0u);
  EXPECT_EQ(matcher.last(), 7u);
  EXPECT_EQ(FindAllText("%b()", "f(x) + g((y), z)"), (std::vector<std::string>{ "(x)", "((y), z)" }));
  Pattern open("x%b()");
  EXPECT_FALSE(Matcher(open, "x(a").search().matched);
  Pattern same("%b''");
  Matcher quoted(same, "say 'hi' now");
  ASSERT_TRUE(quoted.search().matched);
  EXPECT_EQ(quoted.str(), "'hi'");
}

TEST(MatcherTest, Frontier)
{
  Pattern digits("%f[%d]%d+");
  Matcher matcher(digits, "abc123");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 3u);
  EXPECT_EQ(matcher.last(), 6u);

  EXPECT_EQ(FindAllText("%f[%a]%a+", "THE (quick) fox"), (std::vector<std::string>{ "THE", "quick", "fox" }));

  Pattern end("%a+%f[%A]");
  Matcher tail(end, "abc");
  ASSERT_TRUE(tail.search().matched);
  EXPECT_EQ(tail.last(), 3u);
}

TEST(MatcherTest, Backreference)
{
  Pattern pattern("(abc)%1");
  Matcher matcher(pattern, "abcabc");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.first(), 0u);
  EXPECT_EQ(matcher.last(), 6u);
  EXPECT_FALSE(Matcher(pattern, "abcabd").search().matched);

  Pattern quoted("([\"'])(.-)%1");
  Matcher text(quoted, "x = \"it's\"");
  ASSERT_TRUE(text.search().matched);
  EXPECT_EQ(text.str(2), "it's");
}

TEST(MatcherTest, BackreferenceToPositionNeverMatches)
{
  Pattern pattern("()a%1");
  EXPECT_FALSE(Matcher(pattern, "aa").search().matched);
}

TEST(MatcherTest, SetsAndClasses)
{
  EXPECT_EQ(FindAllText("[%a_][%w_]*", "  foo_1 = _bar2"), (std::vector<std::string>{ "foo_1", "_bar2" }));
  EXPECT_EQ(FindAllText("[]]+", "a]]b]"), (std::vector<std::string>{ "]]", "]" }));
  EXPECT_EQ(FindAllText("[^%d]+", "ab12cd"), (std::vector<std::string>{ "ab", "cd" }));
  EXPECT_EQ(FindAllText("[a-]+", "b-a-c"), (std::vector<std::string>{ "-a-" }));
  EXPECT_EQ(FindAllText("%x+", "0xBEEF!"), (std::vector<std::string>{ "0", "BEEF" }));
}

TEST(MatcherTest, BinarySubject)
{
  std::string subject("a\0b\xff", 4);
  Pattern pattern("a.b");
  Matcher matcher(pattern, subject);
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.size(), 3u);
  Pattern cntrl("%c");
  Matcher control(cntrl, subject);
  ASSERT_TRUE(control.search().matched);
  EXPECT_EQ(control.first(), 1u);
  Pattern alpha("%a+");
  Matcher letters(alpha, subject.data(), subject.size());
  EXPECT_EQ(FindAll(letters), (std::vector<Span>{ Span(0, 1), Span(2, 3) }));
}

TEST(MatcherTest, EmptyMatchAdvances)
{
  Pattern pattern("");
  Matcher matcher(pattern, "ab");
  EXPECT_EQ(FindAll(matcher), (std::vector<Span>{ Span(0, 0), Span(1, 1), Span(2, 2) }));
  EXPECT_EQ(matcher.matches_found(), 3u);

  Pattern digits("%d*");
  Matcher mixed(digits, "a12b");
  EXPECT_EQ(FindAll(mixed), (std::vector<Span>{ Span(0, 0), Span(1, 3), Span(3, 3), Span(4, 4) }));
}

TEST(MatcherTest, AnchoredFindYieldsOnce)
{
  Pattern pattern("^a");
  Matcher matcher(pattern, "aaa");
  EXPECT_EQ(FindAll(matcher), (std::vector<Span>{ Span(0, 1) }));
  Matcher other(pattern, "baa");
  EXPECT_TRUE(FindAll(other).empty());
}

TEST(MatcherTest, FindFromOffset)
{
  Pattern pattern("%a");
  Matcher matcher(pattern, "abcd");
  matcher.at(2);
  EXPECT_EQ(FindAll(matcher), (std::vector<Span>{ Span(2, 3), Span(3, 4) }));
  matcher.at(5);
  EXPECT_TRUE(FindAll(matcher).empty());
}

TEST(MatcherTest, MatchLimit)
{
  Pattern pattern("%a");
  Matcher matcher(pattern, "abcd", "M=2");
  EXPECT_EQ(FindAll(matcher), (std::vector<Span>{ Span(0, 1), Span(1, 2) }));
  EXPECT_EQ(matcher.matches_found(), 2u);
  matcher.reset("M=0");
  EXPECT_EQ(FindAll(matcher).size(), 4u);
}

TEST(MatcherTest, MatchAt)
{
  Pattern pattern("b");
  Matcher matcher(pattern, "ab");
  EXPECT_FALSE(matcher.match_at(0));
  EXPECT_TRUE(matcher.match_at(1));
  EXPECT_EQ(matcher.first(), 1u);
  Pattern anchored("^b");
  Matcher other(anchored, "ab");
  EXPECT_TRUE(other.match_at(1));
  EXPECT_FALSE(other.match_at(3));
}

TEST(MatcherTest, DepthLimit)
{
  std::string text;
  for (int i = 0; i < 300; ++i)
    text.append("a?");
  Pattern pattern(text);
  Matcher matcher(pattern, std::string(300, 'a'));
  try
  {
    matcher.search();
    FAIL() << "no match_error";
  }
  catch (const match_error& err)
  {
    EXPECT_EQ(err.code(), pattern_error::too_complex);
    EXPECT_EQ(err.kind(), pattern_error::MATCH);
    EXPECT_EQ(err.message(), "pattern too complex");
  }
  matcher.input("aaa");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.last(), 3u);
}

TEST(MatcherTest, DepthOption)
{
  Pattern pattern("a?a?a?");
  Matcher matcher(pattern, "aaa", "D=2");
  EXPECT_THROW(matcher.search(), match_error);
  matcher.reset("D=10");
  EXPECT_TRUE(matcher.search().matched);
  EXPECT_EQ(Matcher::Const::MAXDEPTH, 200u);
}

TEST(MatcherTest, LiteralQuantifierPatterns)
{
  EXPECT_THROW(Pattern("(%d+)-(%d+)"), lpat::parse_error);
  Pattern pattern("(%d+)-(%d+)", "l");
  Matcher matcher(pattern, "from 10-20");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.str(1), "10");
  EXPECT_EQ(matcher.str(2), "20");
}

TEST(MatcherTest, OwnedPattern)
{
  Matcher matcher("(%d+)", "ab12");
  ASSERT_TRUE(matcher.search().matched);
  EXPECT_EQ(matcher.str(1), "12");
  EXPECT_EQ(matcher.pattern().str(), "(%d+)");
  EXPECT_THROW(Matcher("(", "x"), lpat::parse_error);
}

TEST(MatcherTest, CopyIsIndependent)
{
  Matcher matcher("%a+", "one two");
  ASSERT_TRUE(matcher.find());
  Matcher copy(matcher);
  ASSERT_TRUE(copy.find());
  EXPECT_EQ(copy.str(), "two");
  EXPECT_EQ(matcher.str(), "one");
  Matcher assigned("x", "y");
  assigned = copy;
  EXPECT_EQ(assigned.str(), "two");
  EXPECT_FALSE(assigned.find());
  ASSERT_TRUE(matcher.find());
  EXPECT_EQ(matcher.str(), "two");
}

TEST(MatcherTest, SharedPattern)
{
  Pattern pattern("%d");
  Matcher first(pattern, "a1");
  Matcher second(pattern, "22");
  ASSERT_TRUE(first.search().matched);
  ASSERT_TRUE(second.search().matched);
  EXPECT_EQ(first.first(), 1u);
  EXPECT_EQ(second.first(), 0u);
  EXPECT_EQ(&first.pattern(), &second.pattern());
}

} // namespace
