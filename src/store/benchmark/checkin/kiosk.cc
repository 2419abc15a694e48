// -*- mode: c++; c-file-style: "k&r"; c-basic-offset: 4 -*-
/***********************************************************************
 *
 * store/benchmark/checkin/kiosk.cc:
 *   Command-line kiosk for the check-in backend: single seat/bag requests
 *   and crowd simulation against one flight.
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

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <string>

#include <fmt/core.h>
#include <gflags/gflags.h>

#include "lib/message.h"
#include "lib/threadpool.h"
#include "store/benchmark/checkin/checkin_constants.h"
#include "store/benchmark/checkin/crowd_client.h"
#include "store/checkin/checkin_service.h"
#include "store/checkin/flight_registry.h"
#include "store/checkin/network_simulator.h"
#include "store/checkin/retry_policy.h"
#include "store/checkin/validation.h"
#include "store/common/failures.h"

static bool ValidateColumns(const char *flagname, const std::string &value) {
  std::set<char> seen;
  for (char c : value) {
    if (c < 'A' || c > 'Z' || !seen.insert(c).second) {
      std::cerr << "Invalid value for --" << flagname << ": " << value
                << " (distinct upper-case letters expected)" << std::endl;
      return false;
    }
  }
  return !value.empty();
}

static bool ValidatePositive(const char *flagname, uint32_t value) {
  if (value == 0) {
    std::cerr << "Invalid value for --" << flagname << ": must be > 0" << std::endl;
    return false;
  }
  return true;
}

static bool ValidateProbability(const char *flagname, double value) {
  if (!(value >= 0.0 && value <= 1.0)) {
    std::cerr << "Invalid value for --" << flagname << ": " << value
              << " (expected [0, 1])" << std::endl;
    return false;
  }
  return true;
}

/**
 * Flight setup.
 */
DEFINE_string(flight_no, checkin::DEFAULT_FLIGHT_NO.c_str(), "flight number to register");
DEFINE_uint32(rows, checkin::DEFAULT_SEAT_ROWS, "number of seat rows");
DEFINE_validator(rows, &ValidatePositive);
DEFINE_string(columns, checkin::DEFAULT_COLUMNS.c_str(), "ordered seat column letters");
DEFINE_validator(columns, &ValidateColumns);

/**
 * Worker pool and retry policy.
 */
DEFINE_uint32(pool_size, 8, "number of worker threads serving requests");
DEFINE_validator(pool_size, &ValidatePositive);
DEFINE_uint32(max_attempts, 5, "max number of attempts per request");
DEFINE_validator(max_attempts, &ValidatePositive);
DEFINE_uint64(base_backoff_ms, 12, "backoff after the first failed attempt; doubles per attempt");
DEFINE_uint64(max_jitter_ms, 10, "random jitter added to each backoff, drawn from [0, max_jitter_ms)");
DEFINE_uint64(max_backoff_ms, 5000, "max time to sleep between attempts");
DEFINE_bool(retry_no_seat, false, "also retry requests that found no free seat");

/**
 * Failure injection.
 */
DEFINE_bool(inject_failures, true, "simulate latency and transient I/O failures");
DEFINE_double(failure_probability, 0.06, "probability that an attempt fails with a transient I/O error");
DEFINE_validator(failure_probability, &ValidateProbability);
DEFINE_uint32(latency_min_ms, 4, "minimum simulated round trip per attempt");
DEFINE_uint32(latency_max_ms, 12, "maximum simulated round trip per attempt");
DEFINE_uint64(seed, 0, "random seed for failure injection and crowds (0 = random)");

/**
 * Requests.
 */
DEFINE_string(kiosk_id, "CLI", "origin id recorded with each request");
DEFINE_string(name, "", "passenger name for a seat request");
DEFINE_string(booking_ref, "", "passenger booking reference");
DEFINE_string(preferred_seat, "", "preferred seat, e.g. 12C; requests a seat when set");
DEFINE_string(bag_tag, "", "bag tag; checks in a bag when set");
DEFINE_string(bag_weight, "", "bag weight in kg");
DEFINE_uint32(crowd, 0, "number of simulated concurrent passengers");
DEFINE_bool(print_seats, false, "print occupied seats when done");
DEFINE_string(debug, "", "source files to enable Debug output for (overrides $DEBUG)");

static int AssignSeat(checkin::CheckInService &service) {
  checkin::Passenger p(FLAGS_name, FLAGS_booking_ref);
  checkin::SeatResult res = service.SelectSeatAsync(FLAGS_flight_no, p,
      FLAGS_preferred_seat, FLAGS_kiosk_id).get();
  switch (res.status) {
    case checkin::CHECKIN_OK:
      Notice("Seat assigned: %s(%s) -> %s", p.name.c_str(),
          p.booking_ref.c_str(), res.seat_id.c_str());
      return 0;
    case checkin::CHECKIN_INVALID:
      Warning("Passenger check-in details rejected: %s", res.message.c_str());
      return 2;
    default:
      Warning("Seat assignment FAILED after %u attempts: %s", res.attempts,
          res.message.c_str());
      return 1;
  }
}

static int CheckInBag(checkin::CheckInService &service) {
  std::string error;
  double weight = 0.0;
  if (checkin::ParseWeight(FLAGS_bag_weight, &weight, &error) != checkin::CHECKIN_OK) {
    Warning("Baggage check-in details rejected: %s", error.c_str());
    return 2;
  }

  checkin::Passenger p("N/A", FLAGS_booking_ref);
  checkin::BagResult res = service.CheckInBagAsync(FLAGS_flight_no, p,
      FLAGS_bag_tag, weight, FLAGS_kiosk_id).get();
  switch (res.status) {
    case checkin::CHECKIN_OK:
      Notice("Bag accepted: %s (%.2f kg) for %s", FLAGS_bag_tag.c_str(),
          weight, p.booking_ref.c_str());
      return 0;
    case checkin::CHECKIN_DUPLICATE:
      Warning("Duplicate bagTag ignored: %s for %s", FLAGS_bag_tag.c_str(),
          p.booking_ref.c_str());
      return 1;
    case checkin::CHECKIN_INVALID:
      Warning("Baggage check-in details rejected: %s", res.message.c_str());
      return 2;
    default:
      Warning("Baggage check-in FAILED after %u attempts: %s", res.attempts,
          res.message.c_str());
      return 1;
  }
}

static void PrintTotals(const checkin::Flight &flight) {
  uint64_t bags;
  double weight;
  flight.GetBaggage().GetTotals(&bags, &weight);
  std::cout << fmt::format("Seats: {} / {}", flight.OccupiedSeatCount(),
      flight.TotalSeatCount()) << std::endl;
  std::cout << fmt::format("Bags: {}  |  Weight: {:.2f} kg", bags, weight)
      << std::endl;

  if (FLAGS_print_seats) {
    for (const auto &seat : flight.GetSeats()) {
      if (!seat->IsFree()) {
        std::cout << fmt::format("  {:>4} {}", seat->SeatId(), seat->Occupant())
            << std::endl;
      }
    }
  }
}

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
           "runs seat and baggage check-in requests against a simulated\n"
"           unreliable check-in backend.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (!FLAGS_debug.empty()) {
    Message_SetDebugFilter(FLAGS_debug.c_str());
  }
  if (FLAGS_latency_min_ms > FLAGS_latency_max_ms) {
    std::cerr << "--latency_min_ms must not exceed --latency_max_ms." << std::endl;
    return 1;
  }

  uint64_t seed = FLAGS_seed;
  if (seed == 0) {
    seed = std::random_device{}();
  }

  checkin::FlightRegistry registry;
  checkin::Flight *flight = registry.CreateFlight(FLAGS_flight_no, FLAGS_rows,
      FLAGS_columns);
  if (flight == nullptr) {
    std::cerr << "Could not create flight " << FLAGS_flight_no << "." << std::endl;
    return 1;
  }

  InjectFailure failure;
  failure.type = NETWORK_TRANSIENT_IO;
  failure.enabled = FLAGS_inject_failures;
  failure.minDelayMs = FLAGS_latency_min_ms;
  failure.maxDelayMs = FLAGS_latency_max_ms;
  failure.probability = FLAGS_failure_probability;
  checkin::UnreliableNetwork network(failure, seed);

  checkin::RetryParameters params(FLAGS_max_attempts, FLAGS_base_backoff_ms,
      FLAGS_max_jitter_ms, FLAGS_max_backoff_ms, FLAGS_retry_no_seat);

  ThreadPool pool;
  pool.start(FLAGS_pool_size);
  checkin::CheckInService service(registry, network, params, &pool);

  int rc = 0;
  if (!FLAGS_preferred_seat.empty()) {
    rc = std::max(rc, AssignSeat(service));
  }
  if (!FLAGS_bag_tag.empty() || !FLAGS_bag_weight.empty()) {
    rc = std::max(rc, CheckInBag(service));
  }
  if (FLAGS_crowd > 0) {
    Notice("Simulation started: %u concurrent passengers.", FLAGS_crowd);
    checkin::CrowdClient crowd(service, FLAGS_flight_no,
        static_cast<uint32_t>(seed));
    checkin::CrowdStats stats = crowd.Run(FLAGS_crowd);
    Notice("Simulation finished: %lu seated, %lu without seat, %lu bags "
        "accepted, %lu duplicate, %lu failed.", stats.seats_assigned,
        stats.seat_failures, stats.bags_accepted, stats.bags_duplicate,
        stats.bag_failures);
  }

  pool.stop();
  PrintTotals(*flight);
  gflags::ShutDownCommandLineFlags();
  return rc;
}
