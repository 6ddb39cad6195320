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
@file      debug.h
@brief     lpat debug logs and assertions
@copyright (c) BSD-3 License - see LICENSE.txt

Debug logging is compiled out unless macro DEBUG is defined:

| Source files compiled with	| DBGLOG(...) entry added to	|
| ----------------------------- | ----------------------------- |
| `c++ -DDEBUG`			| `DEBUG.log`			|
| `c++ -DDEBUG=LPAT`		| `LPAT.log`			|
| `c++ -DDEBUG= `		| `stderr`			|

`DBGLOG(format, ...)` creates a timestamped log entry with a printf-formatted
message, `DBGLOGN(format, ...)` creates an indented entry without a timestamp,
and `DBGLOGA(format, ...)` appends to the previous entry.

`DBGCHK(condition)` calls `assert(condition)` when compiled in DEBUG mode.

`DBGSTR(s)` returns string `s` or `"(NULL)"` when `s == NULL`.

Example
-------

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    #include <lpat/debug.h>

    DBGLOG("BEGIN parse(\"%s\")", text);
    for (size_t i = 0; i < items.size(); ++i)
      DBGLOGA(" %u", items[i].kind);
    DBGCHK(stack.empty());
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

An entry records the date and time with microsecond fraction, the source file
name and line number, and the message:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.txt}
    261019/164012.692194     lexer.cpp:52   BEGIN tokenize("(%a+)")
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
*/

#ifndef LPAT_DEBUG_H
#define LPAT_DEBUG_H

#include <cassert>
#include <cstdio>

/// If ASSERT not defined, make ASSERT a no-op
#ifndef ASSERT
#define ASSERT(c)
#endif

#undef DBGLOG
#undef DBGLOGN
#undef DBGLOGA

extern FILE *LPAT_DBGFD_;

extern "C" void LPAT_DBGOUT_(const char *log, const char *file, int line);

#define DBGXIFY(S) DBGIFY_(S)
#define DBGIFY_(S) #S
#if DEBUG + 0
# define DBGFILE "DEBUG.log"
#else
# define DBGFILE DBGXIFY(DEBUG) ".log"
#endif
#define DBGSTR(S) (S?S:"(NULL)")
#define _DBGLOG(...) \
( LPAT_DBGOUT_(DBGFILE, __FILE__, __LINE__), ::fprintf(LPAT_DBGFD_, "" __VA_ARGS__), ::fflush(LPAT_DBGFD_))
#define _DBGLOGN(...) \
( ::fprintf(LPAT_DBGFD_, "\n                                        " __VA_ARGS__), ::fflush(LPAT_DBGFD_) )
#define _DBGLOGA(...) \
( ::fprintf(LPAT_DBGFD_, "" __VA_ARGS__), ::fflush(LPAT_DBGFD_) )

#ifdef DEBUG

#define DBGCHK(c) assert(c)

#define DBGLOG _DBGLOG
#define DBGLOGN _DBGLOGN
#define DBGLOGA _DBGLOGA

#else

#define DBGCHK(c) (void)0

#define DBGLOG(...) (void)0
#define DBGLOGN(...) (void)0
#define DBGLOGA(...) (void)0

#endif

#endif
