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
#ifndef _CHECKIN_CHECKIN_SERVICE_H_
#define _CHECKIN_CHECKIN_SERVICE_H_

#include <functional>
#include <future>
#include <string>

#include "lib/threadpool.h"
#include "store/checkin/common.h"
#include "store/checkin/flight_registry.h"
#include "store/checkin/network_simulator.h"
#include "store/checkin/retry_policy.h"

namespace checkin {

typedef std::function<void(const SeatResult &)> select_seat_callback;
typedef std::function<void(const BagResult &)> check_in_bag_callback;

// Entry point for kiosks. Every request is validated, then executed behind
// the network simulator under the retry policy. The synchronous calls run
// on the caller's thread; the Async variants run the same call on the
// thread pool, which must have been started.
class CheckInService {
 public:
  CheckInService(FlightRegistry &registry, NetworkSimulator &network,
      const RetryParameters &params = RetryParameters(),
      ThreadPool *pool = nullptr, sleep_callback scb = nullptr);
  virtual ~CheckInService();

  SeatResult SelectSeat(const std::string &flight_no,
      const Passenger &passenger, const std::string &preferred_seat,
      const std::string &origin_id);

  // CHECKIN_OK when the bag was recorded, CHECKIN_DUPLICATE when its tag
  // already was.
  BagResult CheckInBag(const std::string &flight_no,
      const Passenger &passenger, const std::string &bag_tag,
      double weight_kg, const std::string &origin_id);

  std::future<SeatResult> SelectSeatAsync(const std::string &flight_no,
      const Passenger &passenger, const std::string &preferred_seat,
      const std::string &origin_id);
  std::future<BagResult> CheckInBagAsync(const std::string &flight_no,
      const Passenger &passenger, const std::string &bag_tag,
      double weight_kg, const std::string &origin_id);

  // Callback flavor; scb/bcb run on the worker that executed the request.
  void SelectSeatAsync(const std::string &flight_no,
      const Passenger &passenger, const std::string &preferred_seat,
      const std::string &origin_id, select_seat_callback scb);
  void CheckInBagAsync(const std::string &flight_no,
      const Passenger &passenger, const std::string &bag_tag,
      double weight_kg, const std::string &origin_id,
      check_in_bag_callback bcb);

  inline const FlightRegistry &GetRegistry() const { return registry; }
  inline const RetryPolicy &GetRetryPolicy() const { return retry; }

 private:
  // Panics unless the pool is running and accepts the job.
  void Enqueue(std::function<void *()> f) const;
  void Enqueue(std::function<void *()> f, std::function<void(void *)> cb) const;

  FlightRegistry &registry;
  NetworkSimulator &network;
  const RetryPolicy retry;
  ThreadPool *pool;
};

} // namespace checkin

#endif /* _CHECKIN_CHECKIN_SERVICE_H_ */
