// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * lib/message.cc:
 *   Timestamped logging to stderr.
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

#include "lib/message.h"

#include <atomic>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>
#include <sys/time.h>
#include <time.h>

namespace {

const char *message_type_names[MSG_NUM_TYPES] = {
    "PANIC", "WARNING", "NOTICE", "DEBUG"
};

std::mutex output_mutex;
std::mutex filter_mutex;
std::vector<std::string> debug_filter;
std::atomic<bool> debug_any(false);
std::once_flag env_once;

void SetFilterLocked(const char *filter)
{
    debug_filter.clear();
    if (filter != nullptr) {
        std::string current;
        for (const char *p = filter; ; ++p) {
            if (*p == ',' || *p == ' ' || *p == '\0') {
                if (!current.empty()) {
                    debug_filter.push_back(current);
                    current.clear();
                }
                if (*p == '\0') {
                    break;
                }
            } else {
                current.push_back(*p);
            }
        }
    }
    debug_any = !debug_filter.empty();
}

void LoadEnvironment()
{
    std::call_once(env_once, []() {
        std::lock_guard<std::mutex> lock(filter_mutex);
        SetFilterLocked(getenv("DEBUG"));
    });
}

const char *Basename(const char *fname)
{
    const char *slash = strrchr(fname, '/');
    return slash == nullptr ? fname : slash + 1;
}

void VMessage(enum Message_Type type, const char *fname, int line,
              const char *func, const char *fmt, va_list ap)
{
    struct timeval now;
    gettimeofday(&now, NULL);
    struct tm local;
    localtime_r(&now.tv_sec, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);

    char body[2048];
    vsnprintf(body, sizeof(body), fmt, ap);

    std::lock_guard<std::mutex> lock(output_mutex);
    fprintf(stderr, "%s.%06ld %-7s %s:%d %s(): %s\n", stamp,
            (long) now.tv_usec, message_type_names[type], Basename(fname),
            line, func, body);
    fflush(stderr);
}

}  // namespace

void
_Message(enum Message_Type type, const char *fname, int line,
         const char *func, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    VMessage(type, fname, line, func, fmt, ap);
    va_end(ap);
}

void
_Panic(const char *fname, int line, const char *func, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    VMessage(MSG_PANIC, fname, line, func, fmt, ap);
    va_end(ap);
    abort();
}

bool
_Message_DebugEnabled(const char *fname)
{
    LoadEnvironment();
    if (!debug_any) {
        return false;
    }

    std::lock_guard<std::mutex> lock(filter_mutex);
    const char *base = Basename(fname);
    for (const std::string &entry : debug_filter) {
        if (entry == "all" || strstr(base, entry.c_str()) != nullptr) {
            return true;
        }
    }
    return false;
}

void
Message_SetDebugFilter(const char *filter)
{
    LoadEnvironment();
    std::lock_guard<std::mutex> lock(filter_mutex);
    SetFilterLocked(filter);
}
