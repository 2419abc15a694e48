/***********************************************************************
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
#ifndef _FAILURES_H_
#define _FAILURES_H_

#include <cstdint>

enum InjectFailureType {
  NETWORK_RELIABLE = 0,
  NETWORK_TRANSIENT_IO = 1
};

// Describes the simulated unreliability of the check-in backend's I/O:
// every attempt waits a uniform latency in [minDelayMs, maxDelayMs] and then
// fails with the given probability.
struct InjectFailure {
  InjectFailure() : type(NETWORK_TRANSIENT_IO), minDelayMs(4), maxDelayMs(12),
      enabled(true), probability(0.06) { }
  InjectFailure(const InjectFailure &failure) : type(failure.type),
      minDelayMs(failure.minDelayMs), maxDelayMs(failure.maxDelayMs),
      enabled(failure.enabled), probability(failure.probability) { }

  InjectFailureType type;
  uint32_t minDelayMs;
  uint32_t maxDelayMs;
  bool enabled;
  double probability;
};

#endif /* _FAILURES_H_ */
