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
#ifndef _CHECKIN_NETWORK_SIMULATOR_H_
#define _CHECKIN_NETWORK_SIMULATOR_H_

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "store/checkin/common.h"
#include "store/common/failures.h"

namespace checkin {

// Stands in for the unreliable dependency between a kiosk and the backend.
// Consulted once per attempt, before the operation runs.
class NetworkSimulator {
 public:
  NetworkSimulator() {}
  virtual ~NetworkSimulator() {}

  // CHECKIN_OK lets the attempt proceed; CHECKIN_TRANSIENT_FAILURE aborts
  // it. May block to model round-trip latency.
  virtual checkin_status_t Transmit(const std::string &op, uint32_t attempt) = 0;
};

class ReliableNetwork : public NetworkSimulator {
 public:
  ReliableNetwork() {}
  virtual ~ReliableNetwork() {}

  virtual checkin_status_t Transmit(const std::string &op, uint32_t attempt) override;
};

class UnreliableNetwork : public NetworkSimulator {
 public:
  explicit UnreliableNetwork(const InjectFailure &failure);
  UnreliableNetwork(const InjectFailure &failure, uint64_t seed);
  virtual ~UnreliableNetwork() {}

  virtual checkin_status_t Transmit(const std::string &op, uint32_t attempt) override;

  inline const InjectFailure &GetFailure() const { return failure; }

 private:
  const InjectFailure failure;
  std::mutex gen_mutex;
  std::mt19937 gen;
};

} // namespace checkin

#endif /* _CHECKIN_NETWORK_SIMULATOR_H_ */
