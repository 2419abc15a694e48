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
#ifndef _CHECKIN_RETRY_POLICY_H_
#define _CHECKIN_RETRY_POLICY_H_

#include <cstdint>
#include <functional>
#include <string>

#include "store/checkin/common.h"

namespace checkin {

struct RetryParameters {
  RetryParameters(uint32_t maxAttempts = 5, uint64_t baseBackoffMs = 12,
      uint64_t maxJitterMs = 10, uint64_t maxBackoffMs = 5000,
      bool retryNoSeat = false) : maxAttempts(maxAttempts),
      baseBackoffMs(baseBackoffMs), maxJitterMs(maxJitterMs),
      maxBackoffMs(maxBackoffMs), retryNoSeat(retryNoSeat) {}

  uint32_t maxAttempts;
  uint64_t baseBackoffMs;
  // Jitter is drawn from [0, maxJitterMs).
  uint64_t maxJitterMs;
  uint64_t maxBackoffMs;
  // Treat CHECKIN_NO_SEAT like a transient failure.
  bool retryNoSeat;
};

typedef std::function<checkin_status_t(uint32_t attempt)> attempt_callback;
typedef std::function<void(uint64_t ms)> sleep_callback;

class RetryPolicy {
 public:
  // scb defaults to sleeping the calling thread.
  RetryPolicy(const RetryParameters &params, sleep_callback scb = nullptr);
  virtual ~RetryPolicy();

  // Calls op with attempt numbers 1, 2, ... until it returns a status that
  // is not retried or maxAttempts is reached; returns that last status.
  checkin_status_t Run(const std::string &what, const attempt_callback &op,
      uint32_t *attempts = nullptr) const;

  bool ShouldRetry(checkin_status_t status) const;
  // Backoff before attempt failedAttempts + 1, without jitter.
  uint64_t BackoffMs(uint32_t failedAttempts) const;
  uint64_t Jitter() const;

  inline const RetryParameters &GetParameters() const { return params; }

 private:
  const RetryParameters params;
  sleep_callback scb;
};

} // namespace checkin

#endif /* _CHECKIN_RETRY_POLICY_H_ */
