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
#ifndef _CHECKIN_FLIGHT_H_
#define _CHECKIN_FLIGHT_H_

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "store/checkin/baggage_ledger.h"
#include "store/checkin/common.h"
#include "store/checkin/seat.h"

namespace checkin {

// Fixed seat map plus the flight's baggage ledger. The seat set is built in
// the constructor and never changes, so lookups need no locking; only the
// individual seats and the ledger synchronize.
class Flight {
 public:
  Flight(const std::string &flight_no, uint32_t rows,
      const std::string &columns = DEFAULT_COLUMNS);
  virtual ~Flight();

  Flight(const Flight &) = delete;
  Flight &operator=(const Flight &) = delete;

  static std::string SeatId(uint32_t row, char col);
  // Splits "12C" into 12 and 'C'. Fails unless the id is one or more
  // digits followed by exactly one column character.
  static bool ParseSeatId(const std::string &seat_id, uint32_t *row,
      char *col);

  // Claims preferred_seat, or else the first free seat in
  // NearestCandidates order. nullptr if nothing could be claimed.
  Seat *AssignSeatOrNearest(const std::string &preferred_seat,
      const std::string &booking_ref);

  // Same row first (column offsets -1,+1,-2,+2,-3,+3), then rows
  // -1,+1,-2,+2, each starting with the preferred column. Ids may lie
  // outside the seat map.
  std::vector<std::string> NearestCandidates(const std::string &preferred_seat) const;

  Seat *GetSeat(const std::string &seat_id) const;
  uint32_t OccupiedSeatCount() const;
  inline uint32_t TotalSeatCount() const { return seats.size(); }
  // Row-major order.
  inline const std::vector<std::unique_ptr<Seat>> &GetSeats() const { return seats; }

  inline const std::string &GetFlightNo() const { return flight_no; }
  inline uint32_t GetRows() const { return rows; }
  inline const std::string &GetColumns() const { return columns; }
  inline BaggageLedger &GetBaggage() { return baggage; }
  inline const BaggageLedger &GetBaggage() const { return baggage; }

 private:
  const std::string flight_no;
  const uint32_t rows;
  const std::string columns;
  std::vector<std::unique_ptr<Seat>> seats;
  std::unordered_map<std::string, Seat *> seats_by_id;
  BaggageLedger baggage;
};

} // namespace checkin

#endif /* _CHECKIN_FLIGHT_H_ */
