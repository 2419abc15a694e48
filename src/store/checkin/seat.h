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
#ifndef _CHECKIN_SEAT_H_
#define _CHECKIN_SEAT_H_

#include <atomic>
#include <string>

namespace checkin {

// One occupancy slot. The occupant is published once through a
// compare-and-set on an owning pointer and never cleared afterwards, so
// readers may dereference it without synchronization.
class Seat {
 public:
  explicit Seat(const std::string &seat_id);
  ~Seat();

  Seat(const Seat &) = delete;
  Seat &operator=(const Seat &) = delete;

  // Claims the seat for booking_ref iff it is still free.
  bool TryAssign(const std::string &booking_ref);

  bool IsFree() const;
  // Empty string while free.
  std::string Occupant() const;
  inline const std::string &SeatId() const { return seat_id; }

 private:
  const std::string seat_id;
  std::atomic<const std::string *> occupant;
};

} // namespace checkin

#endif /* _CHECKIN_SEAT_H_ */
