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
#include "store/checkin/seat.h"

namespace checkin {

Seat::Seat(const std::string &seat_id) : seat_id(seat_id), occupant(nullptr) {}

Seat::~Seat() {
  delete occupant.load();
}

bool Seat::TryAssign(const std::string &booking_ref) {
  const std::string *claim = new std::string(booking_ref);
  const std::string *expected = nullptr;
  if (occupant.compare_exchange_strong(expected, claim,
        std::memory_order_acq_rel, std::memory_order_acquire)) {
    return true;
  }
  delete claim;
  return false;
}

bool Seat::IsFree() const {
  return occupant.load(std::memory_order_acquire) == nullptr;
}

std::string Seat::Occupant() const {
  const std::string *current = occupant.load(std::memory_order_acquire);
  return current == nullptr ? std::string() : *current;
}

} // namespace checkin
