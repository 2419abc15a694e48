// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/assert.h:
 *   Assertions that stay enabled in release builds and report through
 *   Panic.
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

#ifndef _LIB_ASSERT_H_
#define _LIB_ASSERT_H_

#include "lib/message.h"

#define UW_ASSERT(expr)                                         \
    if (expr) {                                                 \
    } else {                                                    \
        Panic("Assertion `%s' failed", #expr);                  \
    }

#define UW_ASSERT_OP(a, op, b)                                  \
    if ((a) op (b)) {                                           \
    } else {                                                    \
        Panic("Assertion `%s %s %s' failed", #a, #op, #b);      \
    }

#define UW_ASSERT_EQ(a, b) UW_ASSERT_OP(a, ==, b)
#define UW_ASSERT_NE(a, b) UW_ASSERT_OP(a, !=, b)
#define UW_ASSERT_LT(a, b) UW_ASSERT_OP(a, <, b)
#define UW_ASSERT_LE(a, b) UW_ASSERT_OP(a, <=, b)
#define UW_ASSERT_GT(a, b) UW_ASSERT_OP(a, >, b)
#define UW_ASSERT_GE(a, b) UW_ASSERT_OP(a, >=, b)

#define NOT_REACHABLE() Panic("Unreachable code reached")

#endif  /* _LIB_ASSERT_H_ */
