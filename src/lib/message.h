// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/message.h:
 *   Logging macros. Debug output is switched on per source file through
 *   the DEBUG environment variable, e.g. DEBUG=flight.cc,checkin_service
 *   or DEBUG=all.
 *
 * Copyright 2021 Florian Suri-Payer <fsp@cs.cornell.edu>
 *                Matthew Burke <matthelb@cs.cornell.edu>
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 **********************************************************************/

#ifndef _LIB_MESSAGE_H_
#define _LIB_MESSAGE_H_

#include <stdbool.h>
#include <stdio.h>

enum Message_Type {
    MSG_PANIC,
    MSG_WARNING,
    MSG_NOTICE,
    MSG_DEBUG,
    MSG_NUM_TYPES
};

#define Panic(...)                                                      \
    _Panic(__FILE__, __LINE__, __func__, __VA_ARGS__)
#define Warning(...)                                                    \
    _Message(MSG_WARNING, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define Notice(...)                                                     \
    _Message(MSG_NOTICE, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define Debug(...)                                                      \
    do {                                                                \
        if (Message_DebugEnabled(__FILE__)) {                           \
            _Message(MSG_DEBUG, __FILE__, __LINE__, __func__,           \
                     __VA_ARGS__);                                      \
        }                                                               \
    } while (0)

#define Message_DebugEnabled(fname) _Message_DebugEnabled(fname)

void _Message(enum Message_Type type,
              const char *fname, int line, const char *func,
              const char *fmt, ...)
    __attribute__((format(printf, 5, 6)));

void _Panic(const char *fname, int line, const char *func,
            const char *fmt, ...)
    __attribute__((format(printf, 4, 5), noreturn));

bool _Message_DebugEnabled(const char *fname);

// Overrides the DEBUG environment variable (tests, CLI flags).
void Message_SetDebugFilter(const char *filter);

#endif  /* _LIB_MESSAGE_H_ */
