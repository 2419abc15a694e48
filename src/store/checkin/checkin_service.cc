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
#include "store/checkin/checkin_service.h"

#include <memory>

#include <fmt/core.h>

#include "lib/assert.h"
#include "lib/message.h"
#include "store/checkin/validation.h"

namespace checkin {

static const char TRANSIENT_IO_MESSAGE[] = "Transient I/O failure";

CheckInService::CheckInService(FlightRegistry &registry,
    NetworkSimulator &network, const RetryParameters &params,
    ThreadPool *pool, sleep_callback scb) : registry(registry),
    network(network), retry(params, std::move(scb)), pool(pool) {}

CheckInService::~CheckInService() {}

SeatResult CheckInService::SelectSeat(const std::string &flight_no,
    const Passenger &passenger, const std::string &preferred_seat,
    const std::string &origin_id) {
  SeatResult result;
  std::string seat_id = NormalizeSeatId(preferred_seat);
  result.status = ValidateSeatRequest(flight_no, passenger, seat_id,
      &result.message);
  if (result.status != CHECKIN_OK) {
    return result;
  }

  Flight *flight = registry.Get(flight_no);
  if (flight == nullptr) {
    result.status = CHECKIN_UNKNOWN_FLIGHT;
    result.message = fmt::format("Unknown flight {}", flight_no);
    return result;
  }

  result.status = retry.Run("SeatSelection", [&](uint32_t attempt) {
    checkin_status_t status = network.Transmit("SeatSelection", attempt);
    if (status != CHECKIN_OK) {
      result.message = TRANSIENT_IO_MESSAGE;
      return status;
    }

    Seat *seat = flight->AssignSeatOrNearest(seat_id, passenger.booking_ref);
    if (seat == nullptr) {
      result.message = fmt::format("No seats available near {}", seat_id);
      return CHECKIN_NO_SEAT;
    }
    result.seat_id = seat->SeatId();
    result.message.clear();
    return CHECKIN_OK;
  }, &result.attempts);

  Debug("[%s] SelectSeat %s for %s on %s: %s after %u attempts",
      origin_id.c_str(), seat_id.c_str(), passenger.booking_ref.c_str(),
      flight_no.c_str(), StatusToString(result.status), result.attempts);
  return result;
}

BagResult CheckInService::CheckInBag(const std::string &flight_no,
    const Passenger &passenger, const std::string &bag_tag, double weight_kg,
    const std::string &origin_id) {
  BagResult result;
  std::string tag = Trim(bag_tag);
  result.status = ValidateBagRequest(flight_no, passenger, tag, weight_kg,
      &result.message);
  if (result.status != CHECKIN_OK) {
    return result;
  }

  Flight *flight = registry.Get(flight_no);
  if (flight == nullptr) {
    result.status = CHECKIN_UNKNOWN_FLIGHT;
    result.message = fmt::format("Unknown flight {}", flight_no);
    return result;
  }

  result.status = retry.Run("Baggage", [&](uint32_t attempt) {
    checkin_status_t status = network.Transmit("Baggage", attempt);
    if (status != CHECKIN_OK) {
      result.message = TRANSIENT_IO_MESSAGE;
      return status;
    }

    BaggageRecord record(tag, passenger.booking_ref, weight_kg, origin_id);
    if (!flight->GetBaggage().CheckInBag(record)) {
      result.message = fmt::format("{} is a duplicate tag", tag);
      return CHECKIN_DUPLICATE;
    }
    result.message.clear();
    return CHECKIN_OK;
  }, &result.attempts);

  Debug("[%s] CheckInBag %s (%.2f kg) for %s on %s: %s after %u attempts",
      origin_id.c_str(), tag.c_str(), weight_kg, passenger.booking_ref.c_str(),
      flight_no.c_str(), StatusToString(result.status), result.attempts);
  return result;
}

void CheckInService::Enqueue(std::function<void *()> f) const {
  if (pool == nullptr || !pool->detach(std::move(f))) {
    Panic("Async check-in request without a running thread pool");
  }
}

void CheckInService::Enqueue(std::function<void *()> f,
    std::function<void(void *)> cb) const {
  if (pool == nullptr || !pool->dispatch_local(std::move(f), std::move(cb))) {
    Panic("Async check-in request without a running thread pool");
  }
}

std::future<SeatResult> CheckInService::SelectSeatAsync(
    const std::string &flight_no, const Passenger &passenger,
    const std::string &preferred_seat, const std::string &origin_id) {
  auto promise = std::make_shared<std::promise<SeatResult>>();
  std::future<SeatResult> future = promise->get_future();
  Enqueue([this, promise, flight_no, passenger, preferred_seat,
      origin_id]() {
    promise->set_value(SelectSeat(flight_no, passenger, preferred_seat,
        origin_id));
    return (void *) true;
  });
  return future;
}

std::future<BagResult> CheckInService::CheckInBagAsync(
    const std::string &flight_no, const Passenger &passenger,
    const std::string &bag_tag, double weight_kg,
    const std::string &origin_id) {
  auto promise = std::make_shared<std::promise<BagResult>>();
  std::future<BagResult> future = promise->get_future();
  Enqueue([this, promise, flight_no, passenger, bag_tag, weight_kg,
      origin_id]() {
    promise->set_value(CheckInBag(flight_no, passenger, bag_tag, weight_kg,
        origin_id));
    return (void *) true;
  });
  return future;
}

void CheckInService::SelectSeatAsync(const std::string &flight_no,
    const Passenger &passenger, const std::string &preferred_seat,
    const std::string &origin_id, select_seat_callback scb) {
  auto f = [this, flight_no, passenger, preferred_seat, origin_id]() {
    return (void *) new SeatResult(SelectSeat(flight_no, passenger,
        preferred_seat, origin_id));
  };
  auto cb = [scb](void *r) {
    std::unique_ptr<SeatResult> result(static_cast<SeatResult *>(r));
    scb(*result);
  };
  Enqueue(std::move(f), std::move(cb));
}

void CheckInService::CheckInBagAsync(const std::string &flight_no,
    const Passenger &passenger, const std::string &bag_tag, double weight_kg,
    const std::string &origin_id, check_in_bag_callback bcb) {
  auto f = [this, flight_no, passenger, bag_tag, weight_kg, origin_id]() {
    return (void *) new BagResult(CheckInBag(flight_no, passenger, bag_tag,
        weight_kg, origin_id));
  };
  auto cb = [bcb](void *r) {
    std::unique_ptr<BagResult> result(static_cast<BagResult *>(r));
    bcb(*result);
  };
  Enqueue(std::move(f), std::move(cb));
}

} // namespace checkin
