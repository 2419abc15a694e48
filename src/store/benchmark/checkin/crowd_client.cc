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
#include "store/benchmark/checkin/crowd_client.h"

#include <condition_variable>
#include <memory>
#include <mutex>

#include <fmt/core.h>

#include "lib/message.h"
#include "store/benchmark/checkin/checkin_constants.h"

namespace checkin {

namespace {

// Shared between the caller and the workers of one Run.
struct CrowdRun {
  explicit CrowdRun(uint32_t outstanding) : outstanding(outstanding) {}

  std::mutex mtx;
  std::condition_variable done;
  uint32_t outstanding;
  CrowdStats stats;
};

}  // namespace

CrowdClient::CrowdClient(CheckInService &service, const std::string &flight_no,
    uint32_t seed) : service(service), flight_no(flight_no), gen(seed) {}

CrowdClient::~CrowdClient() {}

CrowdPassenger CrowdClient::NextPassenger() {
  CrowdPassenger pax;
  uint32_t suffix = std::uniform_int_distribution<uint32_t>(0, 0xFFFFFF)(gen);
  int booking = std::uniform_int_distribution<int>(MIN_BOOKING_NUMBER,
      MAX_BOOKING_NUMBER)(gen);
  pax.passenger = Passenger(fmt::format("PAX{:06x}", suffix),
      fmt::format("BR{}", booking));
  pax.preferred_seat = HOT_SEATS[std::uniform_int_distribution<size_t>(0,
      HOT_SEATS.size() - 1)(gen)];

  int num_bags = std::uniform_int_distribution<int>(0,
      MAX_BAGS_PER_PASSENGER)(gen);
  for (int b = 1; b <= num_bags; b++) {
    double weight = std::uniform_real_distribution<double>(MIN_BAG_WEIGHT_KG,
        MAX_BAG_WEIGHT_KG)(gen);
    pax.bags.emplace_back(fmt::format("{}-B{}", pax.passenger.booking_ref, b),
        weight);
  }
  return pax;
}

CrowdStats CrowdClient::Run(uint32_t num_passengers) {
  auto run = std::make_shared<CrowdRun>(num_passengers);
  if (num_passengers == 0) {
    return run->stats;
  }

  for (uint32_t i = 0; i < num_passengers; i++) {
    CrowdPassenger pax = NextPassenger();
    service.SelectSeatAsync(flight_no, pax.passenger, pax.preferred_seat,
        CROWD_KIOSK_ID, [this, run, pax](const SeatResult &seat) {
      CrowdStats local;
      if (seat.ok()) {
        local.seats_assigned++;
        for (const auto &bag : pax.bags) {
          BagResult res = service.CheckInBag(flight_no, pax.passenger,
              bag.first, bag.second, CROWD_KIOSK_ID);
          if (res.accepted()) {
            local.bags_accepted++;
            local.weight_accepted += bag.second;
          } else if (res.duplicate()) {
            local.bags_duplicate++;
          } else {
            local.bag_failures++;
          }
        }
      } else {
        Debug("Crowd passenger %s got no seat: %s",
            pax.passenger.booking_ref.c_str(), seat.message.c_str());
        local.seat_failures++;
      }

      std::unique_lock<std::mutex> lock(run->mtx);
      run->stats.seats_assigned += local.seats_assigned;
      run->stats.seat_failures += local.seat_failures;
      run->stats.bags_accepted += local.bags_accepted;
      run->stats.bags_duplicate += local.bags_duplicate;
      run->stats.bag_failures += local.bag_failures;
      run->stats.weight_accepted += local.weight_accepted;
      if (--run->outstanding == 0) {
        run->done.notify_all();
      }
    });
  }

  std::unique_lock<std::mutex> lock(run->mtx);
  run->done.wait(lock, [&run] { return run->outstanding == 0; });
  return run->stats;
}

} // namespace checkin
