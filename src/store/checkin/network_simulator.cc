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
#include "store/checkin/network_simulator.h"

#include <chrono>
#include <thread>

#include "lib/assert.h"
#include "lib/message.h"

namespace checkin {

checkin_status_t ReliableNetwork::Transmit(const std::string &op,
    uint32_t attempt) {
  return CHECKIN_OK;
}

UnreliableNetwork::UnreliableNetwork(const InjectFailure &failure)
    : UnreliableNetwork(failure, std::random_device{}()) {}

UnreliableNetwork::UnreliableNetwork(const InjectFailure &failure,
    uint64_t seed) : failure(failure), gen(seed) {
  UW_ASSERT_LE(failure.minDelayMs, failure.maxDelayMs);
  UW_ASSERT(failure.probability >= 0.0 && failure.probability <= 1.0);
}

checkin_status_t UnreliableNetwork::Transmit(const std::string &op,
    uint32_t attempt) {
  if (!failure.enabled) {
    return CHECKIN_OK;
  }

  uint32_t delay_ms;
  bool fail;
  {
    std::lock_guard<std::mutex> lock(gen_mutex);
    delay_ms = std::uniform_int_distribution<uint32_t>(failure.minDelayMs,
        failure.maxDelayMs)(gen);
    fail = failure.type == NETWORK_TRANSIENT_IO &&
        std::uniform_real_distribution<double>(0.0, 1.0)(gen) < failure.probability;
  }

  if (delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
  }
  if (fail) {
    Debug("Injected transient I/O failure for %s (attempt %u)", op.c_str(),
        attempt);
    return CHECKIN_TRANSIENT_FAILURE;
  }
  return CHECKIN_OK;
}

} // namespace checkin
