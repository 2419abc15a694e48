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
#ifndef CHECKIN_CROWD_CLIENT_H
#define CHECKIN_CROWD_CLIENT_H

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "store/checkin/checkin_service.h"
#include "store/checkin/common.h"

namespace checkin {

struct CrowdStats {
  CrowdStats() : seats_assigned(0), seat_failures(0), bags_accepted(0),
      bags_duplicate(0), bag_failures(0), weight_accepted(0.0) {}

  uint64_t seats_assigned;
  uint64_t seat_failures;
  uint64_t bags_accepted;
  uint64_t bags_duplicate;
  uint64_t bag_failures;
  double weight_accepted;
};

// One simulated passenger: drawn up front on the caller's thread so the
// workers never touch the generator.
struct CrowdPassenger {
  Passenger passenger;
  std::string preferred_seat;
  std::vector<std::pair<std::string, double>> bags;
};

// Fires a crowd of passengers at the service concurrently. Each passenger
// asks for a hot seat and, once seated, checks in up to two bags on the
// same worker.
class CrowdClient {
 public:
  CrowdClient(CheckInService &service, const std::string &flight_no,
      uint32_t seed);
  virtual ~CrowdClient();

  // Blocks until every passenger has finished.
  CrowdStats Run(uint32_t num_passengers);

  CrowdPassenger NextPassenger();

 private:
  CheckInService &service;
  const std::string flight_no;
  std::mt19937 gen;
};

} // namespace checkin

#endif /* CHECKIN_CROWD_CLIENT_H */
