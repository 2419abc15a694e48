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
#include "store/checkin/retry_policy.h"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

#include "lib/assert.h"
#include "lib/message.h"

namespace checkin {

namespace {

std::mt19937 &ThreadGenerator() {
  thread_local std::mt19937 gen(std::random_device{}());
  return gen;
}

void SleepMs(uint64_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

RetryPolicy::RetryPolicy(const RetryParameters &params, sleep_callback scb)
    : params(params), scb(scb ? std::move(scb) : sleep_callback(SleepMs)) {
  UW_ASSERT_GE(params.maxAttempts, 1U);
}

RetryPolicy::~RetryPolicy() {}

bool RetryPolicy::ShouldRetry(checkin_status_t status) const {
  switch (status) {
    case CHECKIN_TRANSIENT_FAILURE:
      return true;
    case CHECKIN_NO_SEAT:
      return params.retryNoSeat;
    default:
      return false;
  }
}

uint64_t RetryPolicy::BackoffMs(uint32_t failedAttempts) const {
  if (failedAttempts == 0) {
    return 0;
  }
  uint64_t backoff = params.baseBackoffMs;
  for (uint32_t i = 1; i < failedAttempts && backoff < params.maxBackoffMs; ++i) {
    backoff *= 2;
  }
  return std::min(backoff, params.maxBackoffMs);
}

uint64_t RetryPolicy::Jitter() const {
  if (params.maxJitterMs == 0) {
    return 0;
  }
  return std::uniform_int_distribution<uint64_t>(0,
      params.maxJitterMs - 1)(ThreadGenerator());
}

checkin_status_t RetryPolicy::Run(const std::string &what,
    const attempt_callback &op, uint32_t *attempts) const {
  uint32_t attempt = 0;
  checkin_status_t status;
  while (true) {
    attempt++;
    status = op(attempt);
    if (!ShouldRetry(status) || attempt >= params.maxAttempts) {
      break;
    }
    uint64_t sleep_ms = BackoffMs(attempt) + Jitter();
    Debug("%s attempt %u failed with %s, retrying in %lu ms", what.c_str(),
        attempt, StatusToString(status), sleep_ms);
    scb(sleep_ms);
  }

  if (attempts != nullptr) {
    *attempts = attempt;
  }
  if (status != CHECKIN_OK && ShouldRetry(status)) {
    Debug("%s giving up after %u attempts: %s", what.c_str(), attempt,
        StatusToString(status));
  }
  return status;
}

} // namespace checkin
