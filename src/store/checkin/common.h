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
#ifndef _CHECKIN_COMMON_H_
#define _CHECKIN_COMMON_H_

#include <cstdint>
#include <string>

namespace checkin {

typedef enum {
  CHECKIN_OK = 0,
  CHECKIN_DUPLICATE,         // bag tag already recorded; idempotent no-op
  CHECKIN_NO_SEAT,           // nothing free at or near the preferred seat
  CHECKIN_TRANSIENT_FAILURE, // simulated I/O fault, safe to retry
  CHECKIN_INVALID,           // malformed caller input
  CHECKIN_UNKNOWN_FLIGHT
} checkin_status_t;

const char *StatusToString(checkin_status_t status);

// Only simulated I/O faults are worth repeating from the client side.
inline bool IsClientRetryable(checkin_status_t status) {
  return status == CHECKIN_TRANSIENT_FAILURE;
}

const std::string DEFAULT_COLUMNS = "ABCDEF";

struct Passenger {
  Passenger() {}
  Passenger(const std::string &name, const std::string &booking_ref)
      : name(name), booking_ref(booking_ref) {}

  std::string name;
  std::string booking_ref;
};

struct SeatResult {
  SeatResult() : status(CHECKIN_OK), attempts(0) {}

  bool ok() const { return status == CHECKIN_OK; }

  checkin_status_t status;
  std::string seat_id;
  std::string message;
  uint32_t attempts;
};

struct BagResult {
  BagResult() : status(CHECKIN_OK), attempts(0) {}

  bool accepted() const { return status == CHECKIN_OK; }
  bool duplicate() const { return status == CHECKIN_DUPLICATE; }

  checkin_status_t status;
  std::string message;
  uint32_t attempts;
};

} // namespace checkin

#endif /* _CHECKIN_COMMON_H_ */
