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
@file      pattern_test.cpp
@brief     lpat pattern parser tests
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <lpat/pattern.h>
#include <cstdio>
#include <string>

#include "gtest/gtest.h"

namespace {

using ::lpat::Pattern;
using ::lpat::parse_error;
using ::lpat::pattern_error;

typedef Pattern::Item Item;

lpat::pattern_error_type ParseErrorCode(const std::string& pattern, const char *options = NULL, size_t *pos = NULL)
{
  try
  {
    Pattern p(pattern, options);
  }
  catch (const parse_error& err)
  {
    EXPECT_EQ(err.kind(), pattern_error::PARSE);
    if (pos != NULL)
      *pos = err.pos();
    return err.code();
  }
  ADD_FAILURE() << "no parse_error for \"" << pattern << "\"";
  return -1;
}

std::string Listing(const Pattern& pattern)
{
  std::string text;
  FILE *file = tmpfile();
  if (file == NULL)
    return text;
  pattern.write(file);
  rewind(file);
  int c;
  while ((c = fgetc(file)) != EOF)
    text.push_back(static_cast<char>(c));
  fclose(file);
  return text;
}

TEST(PatternTest, Empty)
{
  Pattern p("");
  EXPECT_EQ(p.size(), 0u);
  EXPECT_EQ(p.captures(), 0u);
  EXPECT_FALSE(p.anchored_start());
  EXPECT_FALSE(p.anchored_end());
}

TEST(PatternTest, Anchors)
{
  Pattern p("^abc$");
  EXPECT_TRUE(p.anchored_start());
  EXPECT_TRUE(p.anchored_end());
  EXPECT_EQ(p.size(), 3u);
  EXPECT_EQ(p[0].pos, 1u);

  Pattern q("^");
  EXPECT_TRUE(q.anchored_start());
  EXPECT_FALSE(q.anchored_end());
  EXPECT_EQ(q.size(), 0u);

  Pattern r("$");
  EXPECT_FALSE(r.anchored_start());
  EXPECT_TRUE(r.anchored_end());
}

TEST(PatternTest, AnchorsInsideAreLiterals)
{
  Pattern p("a^b$c");
  EXPECT_FALSE(p.anchored_start());
  EXPECT_FALSE(p.anchored_end());
  ASSERT_EQ(p.size(), 5u);
  EXPECT_EQ(p[1].kind, Item::LITERAL);
  EXPECT_EQ(p[1].byte, '^');
  EXPECT_EQ(p[3].kind, Item::LITERAL);
  EXPECT_EQ(p[3].byte, '$');
}

TEST(PatternTest, Quantifiers)
{
  Pattern p("a*%d+[xy]-.?");
  ASSERT_EQ(p.size(), 4u);
  EXPECT_EQ(p[0].quantifier, Item::STAR);
  EXPECT_EQ(p[1].kind, Item::CLASS);
  EXPECT_EQ(p[1].quantifier, Item::PLUS);
  EXPECT_EQ(p[2].kind, Item::SET);
  EXPECT_EQ(p[2].quantifier, Item::MINUS);
  EXPECT_EQ(p[3].kind, Item::ANY);
  EXPECT_EQ(p[3].quantifier, Item::OPTIONAL);
}

TEST(PatternTest, NoPriorElement)
{
  size_t pos = 99;
  EXPECT_EQ(ParseErrorCode("a**", NULL, &pos), pattern_error::no_prior_element);
  EXPECT_EQ(pos, 2u);
  EXPECT_EQ(ParseErrorCode("*a", NULL, &pos), pattern_error::no_prior_element);
  EXPECT_EQ(pos, 0u);
  EXPECT_EQ(ParseErrorCode("(a)*", NULL, &pos), pattern_error::no_prior_element);
  EXPECT_EQ(pos, 3u);
  EXPECT_EQ(ParseErrorCode("%b()+"), pattern_error::no_prior_element);
  EXPECT_EQ(ParseErrorCode("^*"), pattern_error::no_prior_element);
}

TEST(PatternTest, LiteralQuantifiers)
{
  Pattern p("*a", "l");
  ASSERT_EQ(p.size(), 2u);
  EXPECT_EQ(p[0].kind, Item::LITERAL);
  EXPECT_EQ(p[0].byte, '*');
  EXPECT_EQ(p[0].quantifier, Item::NONE);

  Pattern q("a**", "l");
  ASSERT_EQ(q.size(), 2u);
  EXPECT_EQ(q[0].quantifier, Item::STAR);
  EXPECT_EQ(q[1].byte, '*');

  Pattern r("(%d+)-(%d+)", "l");
  ASSERT_EQ(r.size(), 7u);
  EXPECT_EQ(r[3].kind, Item::LITERAL);
  EXPECT_EQ(r[3].byte, '-');
  EXPECT_EQ(r.captures(), 2u);
}

TEST(PatternTest, Captures)
{
  Pattern p("((a)(b))()");
  EXPECT_EQ(p.captures(), 4u);
  ASSERT_EQ(p.size(), 9u);
  EXPECT_EQ(p[0].kind, Item::OPEN);
  EXPECT_EQ(p[0].index, 1u);
  EXPECT_EQ(p[1].index, 2u);
  EXPECT_EQ(p[3].kind, Item::CLOSE);
  EXPECT_EQ(p[3].index, 2u);
  EXPECT_EQ(p[7].kind, Item::CLOSE);
  EXPECT_EQ(p[7].index, 1u);
  EXPECT_EQ(p[8].kind, Item::OPEN);
  EXPECT_TRUE(p[8].position);
  EXPECT_EQ(p[8].index, 4u);
}

TEST(PatternTest, CaptureErrors)
{
  size_t pos = 99;
  EXPECT_EQ(ParseErrorCode("(a", NULL, &pos), pattern_error::unfinished_capture);
  EXPECT_EQ(pos, 0u);
  EXPECT_EQ(ParseErrorCode("a(b(c)", NULL, &pos), pattern_error::unfinished_capture);
  EXPECT_EQ(pos, 1u);
  EXPECT_EQ(ParseErrorCode("a)", NULL, &pos), pattern_error::invalid_capture);
  EXPECT_EQ(pos, 1u);
  EXPECT_EQ(ParseErrorCode(")"), pattern_error::invalid_capture);
}

TEST(PatternTest, MaxCaptures)
{
  std::string max;
  for (Pattern::Index i = 0; i < Pattern::Const::MAXCAPTURES; ++i)
    max.append("()");
  EXPECT_EQ(Pattern(max).captures(), Pattern::Const::MAXCAPTURES);
  size_t pos = 0;
  EXPECT_EQ(ParseErrorCode(max + "(a)", NULL, &pos), pattern_error::too_many_captures);
  EXPECT_EQ(pos, max.size());
}

TEST(PatternTest, Backrefs)
{
  Pattern p("(a)%1()%2");
  ASSERT_EQ(p.size(), 6u);
  EXPECT_EQ(p[3].kind, Item::BACKREF);
  EXPECT_EQ(p[3].index, 1u);
  EXPECT_EQ(p[4].kind, Item::OPEN);
  EXPECT_EQ(p[5].kind, Item::BACKREF);
  EXPECT_EQ(p[5].index, 2u);
  EXPECT_EQ(p.captures(), 2u);
  Pattern q("()%1");
  EXPECT_EQ(q[1].kind, Item::BACKREF);

  size_t pos = 99;
  EXPECT_EQ(ParseErrorCode("%0", NULL, &pos), pattern_error::invalid_capture_index);
  EXPECT_EQ(pos, 0u);
  EXPECT_EQ(ParseErrorCode("(a)%2", NULL, &pos), pattern_error::invalid_capture_index);
  EXPECT_EQ(pos, 3u);
  EXPECT_EQ(ParseErrorCode("(a%1)", NULL, &pos), pattern_error::invalid_capture_index);
  EXPECT_EQ(pos, 2u);
  EXPECT_EQ(ParseErrorCode("%1(a)"), pattern_error::invalid_capture_index);
}

TEST(PatternTest, BackrefErrorNamesIndex)
{
  try
  {
    Pattern p("(a)%2");
    FAIL() << "no parse_error";
  }
  catch (const parse_error& err)
  {
    EXPECT_EQ(err.message(), "invalid capture index %2");
  }
}

TEST(PatternTest, ErrorReport)
{
  try
  {
    Pattern p("(%a+");
    FAIL() << "no parse_error";
  }
  catch (const pattern_error& err)
  {
    EXPECT_EQ(err.code(), pattern_error::unfinished_capture);
    EXPECT_EQ(err.message(), "unfinished capture");
    EXPECT_EQ(std::string(err.what()), "error at position 0\n(%a+\n\\___unfinished capture\n");
  }
  try
  {
    Pattern p("abcdefghijklmnopqrstuvwxyz0123)");
    FAIL() << "no parse_error";
  }
  catch (const pattern_error& err)
  {
    EXPECT_EQ(err.pos(), 30u);
    EXPECT_EQ(std::string(err.what()), "error at position 30\nabcdefghijklmnopqrstuvwxyz0123)\n   invalid pattern capture___/\n");
  }
}

TEST(PatternTest, LexErrorsPassThrough)
{
  EXPECT_THROW(Pattern("%f1"), lpat::lex_error);
  EXPECT_THROW(Pattern("[a"), lpat::lex_error);
  EXPECT_THROW(Pattern("%"), pattern_error);
}

TEST(PatternTest, WriteErrorsToStderr)
{
  testing::internal::CaptureStderr();
  EXPECT_THROW(Pattern("(a", "w"), parse_error);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("unfinished capture"), std::string::npos);
}

TEST(PatternTest, Equality)
{
  EXPECT_EQ(Pattern("a%d+[xy]"), Pattern(std::string("a%d+[xy]")));
  EXPECT_NE(Pattern("a%d+"), Pattern("a%d*"));
  EXPECT_NE(Pattern("^a"), Pattern("a"));
}

TEST(PatternTest, Name)
{
  EXPECT_EQ(Pattern("a").name(), "PATTERN");
  EXPECT_EQ(Pattern("a", "n=word").name(), "word");
  EXPECT_EQ(Pattern("a", std::string("l;n=word")).name(), "word");
}

TEST(PatternTest, Listing)
{
  Pattern p("^(%a+)[0-9]?%b()$", "n=demo");
  EXPECT_EQ(Listing(p),
      "demo \"^(%a+)[0-9]?%b()$\" 5 items 1 captures ^ $\n"
      "   0: OPEN 1\n"
      "   1: CLASS %a +\n"
      "   2: CLOSE 1\n"
      "   3: SET ['0'-'9'] ?\n"
      "   4: BALANCED '(' ')'\n");
}

} // namespace
