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
@file      pattern.cpp
@brief     lpat pattern parser and compiled pattern
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <lpat/pattern.h>
#include <cctype>
#include <cerrno>
#include <iostream>

namespace lpat {

const Pattern::Index Pattern::Const::MAXCAPTURES;

inline int fopen_s(FILE **file, const char *name, const char *mode) { return (*file = ::fopen(name, mode)) ? 0 : errno; }

static void print_char(FILE *file, int c)
{
  if (c >= '\a' && c <= '\r')
    ::fprintf(file, "'\\%c'", "abtnvfr"[c - '\a']);
  else if (c == '\\')
    ::fprintf(file, "'\\\\'");
  else if (c == '\'')
    ::fprintf(file, "'\\''");
  else if (std::isprint(c))
    ::fprintf(file, "'%c'", c);
  else
    ::fprintf(file, "%u", c);
}

// print a set as a list of byte ranges
static void print_chars(FILE *file, const Chars& chars)
{
  ::fputc('[', file);
  for (int lo = 0; lo < 256; ++lo)
  {
    if (!chars.contains(static_cast<uint8_t>(lo)))
      continue;
    int hi = lo;
    while (hi < 255 && chars.contains(static_cast<uint8_t>(hi + 1)))
      ++hi;
    print_char(file, lo);
    if (hi > lo)
    {
      ::fputc('-', file);
      print_char(file, hi);
    }
    lo = hi;
  }
  ::fputc(']', file);
}

bool Pattern::Item::operator==(const Item& item) const
{
  if (kind != item.kind || quantifier != item.quantifier || pos != item.pos)
    return false;
  switch (kind)
  {
    case LITERAL:
      return byte == item.byte;
    case ANY:
      return true;
    case CLASS:
      return cls == item.cls && negate == item.negate;
    case SET:
    case FRONTIER:
      return chars == item.chars;
    case OPEN:
      return index == item.index && position == item.position;
    case CLOSE:
    case BACKREF:
      return index == item.index;
    case BALANCED:
      return byte == item.byte && byte2 == item.byte2;
  }
  return false;
}

void Pattern::error(pattern_error_type code, size_t pos) const
{
  parse_error err(code, pat_, pos);
  if (opt_.w)
    std::cerr << err.what();
  throw err;
}

void Pattern::init(const char *options)
{
  init_options(options);
  ncap_ = 0;
  bob_ = false;
  eob_ = false;
  DBGLOG("BEGIN Pattern::init(\"%s\")", pat_.c_str());
  std::vector<Token> tokens;
  try
  {
    tokens = Lexer(pat_).tokenize();
  }
  catch (const lex_error& err)
  {
    if (opt_.w)
      std::cerr << err.what();
    throw;
  }
  parse(tokens);
  if (!opt_.f.empty())
    export_items();
  DBGLOG("END Pattern::init() %zu items %u captures", items_.size(), ncap_);
}

void Pattern::init_options(const char *options)
{
  opt_.l = false;
  opt_.w = false;
  if (options != NULL)
  {
    for (const char *s = options; *s != '\0'; ++s)
    {
      switch (*s)
      {
        case 'l':
          opt_.l = true;
          break;
        case 'w':
          opt_.w = true;
          break;
        case 'f':
        case 'n':
          for (const char *t = s += (s[1] == '='); *s != ';' && *s != '\0'; ++t)
          {
            if (*t == ',' || *t == ';' || *t == '\0')
            {
              if (t > s + 1)
              {
                std::string name(s + 1, t - s - 1);
                if (name.find('.') == std::string::npos)
                  opt_.n = name;
                else
                  opt_.f.push_back(name);
              }
              s = t;
            }
          }
          --s;
          break;
      }
    }
  }
}

void Pattern::parse(const std::vector<Token>& tokens)
{
  DBGLOG("BEGIN parse()");
  std::vector<Index> open;       // stack of indices of open captures
  std::vector<bool> closed(Const::MAXCAPTURES + 1, false);
  size_t n = tokens.size();
  for (size_t i = 0; i < n; ++i)
  {
    const Token& token = tokens[i];
    Item item(Item::LITERAL, token.pos);
    switch (token.type)
    {
      case Token::LITERAL:
        item.byte = token.byte;
        break;
      case Token::ANY:
        item.kind = Item::ANY;
        break;
      case Token::CLASS:
        item.kind = Item::CLASS;
        item.cls = token.cls;
        item.negate = token.negate;
        break;
      case Token::SET:
        item.kind = Item::SET;
        item.chars = token.chars;
        break;
      case Token::BEGIN:
        if (i == 0)
        {
          bob_ = true;
          continue;
        }
        item.byte = '^';
        break;
      case Token::END:
        if (i + 1 == n)
        {
          eob_ = true;
          continue;
        }
        item.byte = '$';
        break;
      case Token::OPEN:
      case Token::POSITION:
        if (ncap_ >= Const::MAXCAPTURES)
          error(pattern_error::too_many_captures, token.pos);
        item.kind = Item::OPEN;
        item.index = ++ncap_;
        if (token.type == Token::POSITION)
        {
          item.position = true;
          closed[item.index] = true;
        }
        else
        {
          open.push_back(item.index);
        }
        break;
      case Token::CLOSE:
        if (open.empty())
          error(pattern_error::invalid_capture, token.pos);
        item.kind = Item::CLOSE;
        item.index = open.back();
        open.pop_back();
        closed[item.index] = true;
        break;
      case Token::BALANCED:
        item.kind = Item::BALANCED;
        item.byte = token.byte;
        item.byte2 = token.byte2;
        break;
      case Token::FRONTIER:
        item.kind = Item::FRONTIER;
        item.chars = token.chars;
        break;
      case Token::BACKREF:
        if (token.index == 0 || token.index > ncap_ || !closed[token.index])
          error(pattern_error::invalid_capture_index, token.pos);
        item.kind = Item::BACKREF;
        item.index = static_cast<Index>(token.index);
        break;
      case Token::STAR:
      case Token::PLUS:
      case Token::MINUS:
      case Token::OPTIONAL:
        if (!items_.empty() && items_.back().single() && items_.back().quantifier == Item::NONE)
        {
          static const Item::Quantifier quantifiers[] = { Item::STAR, Item::PLUS, Item::MINUS, Item::OPTIONAL };
          items_.back().quantifier = quantifiers[token.type - Token::STAR];
          continue;
        }
        if (!opt_.l)
          error(pattern_error::no_prior_element, token.pos);
        item.byte = "*+-?"[token.type - Token::STAR];
        break;
    }
    items_.push_back(item);
  }
  if (!open.empty())
  {
    for (Items::const_iterator i = items_.begin(); i != items_.end(); ++i)
      if (i->kind == Item::OPEN && i->index == open.back())
        error(pattern_error::unfinished_capture, i->pos);
  }
  DBGLOG("END parse()");
}

void Pattern::write(FILE *file) const
{
  ::fprintf(file, "%s \"%s\" %zu items %u captures%s%s\n", opt_.n.c_str(), pat_.c_str(), items_.size(), ncap_, bob_ ? " ^" : "", eob_ ? " $" : "");
  for (Index i = 0; i < items_.size(); ++i)
  {
    const Item& item = items_[i];
    ::fprintf(file, "%4u: ", i);
    switch (item.kind)
    {
      case Item::LITERAL:
        ::fprintf(file, "LITERAL ");
        print_char(file, item.byte);
        break;
      case Item::ANY:
        ::fprintf(file, "ANY");
        break;
      case Item::CLASS:
        ::fprintf(file, "CLASS %%%c", class_letter(item.cls, item.negate));
        break;
      case Item::SET:
        ::fprintf(file, "SET ");
        print_chars(file, item.chars);
        break;
      case Item::OPEN:
        ::fprintf(file, item.position ? "POSITION %u" : "OPEN %u", item.index);
        break;
      case Item::CLOSE:
        ::fprintf(file, "CLOSE %u", item.index);
        break;
      case Item::BALANCED:
        ::fprintf(file, "BALANCED ");
        print_char(file, item.byte);
        ::fputc(' ', file);
        print_char(file, item.byte2);
        break;
      case Item::FRONTIER:
        ::fprintf(file, "FRONTIER ");
        print_chars(file, item.chars);
        break;
      case Item::BACKREF:
        ::fprintf(file, "BACKREF %u", item.index);
        break;
    }
    if (item.quantifier != Item::NONE)
      ::fprintf(file, " %c", " *+-?"[item.quantifier]);
    ::fputc('\n', file);
  }
}

void Pattern::export_items() const
{
  for (std::vector<std::string>::const_iterator it = opt_.f.begin(); it != opt_.f.end(); ++it)
  {
    const std::string& filename = *it;
    size_t len = filename.length();
    if (len > 4 && filename.compare(len - 4, 4, ".txt") == 0)
    {
      FILE *file = NULL;
      int err = 0;
      if (filename.compare(0, 7, "stdout.") == 0)
        file = stdout;
      else if (filename.at(0) == '+')
        err = lpat::fopen_s(&file, filename.c_str() + 1, "a");
      else
        err = lpat::fopen_s(&file, filename.c_str(), "w");
      if (!err && file)
      {
        write(file);
        if (file != stdout)
          ::fclose(file);
      }
    }
  }
}

} // namespace lpat
