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
#include "store/checkin/flight.h"

#include <algorithm>
#include <cctype>

#include "lib/message.h"

namespace checkin {

static const int COLUMN_OFFSETS[] = { -1, +1, -2, +2, -3, +3 };
static const int ROW_OFFSETS[] = { -1, +1, -2, +2 };

// Longest row number ParseSeatId accepts.
static const size_t MAX_ROW_DIGITS = 6;

Flight::Flight(const std::string &flight_no, uint32_t rows,
    const std::string &columns) : flight_no(flight_no), rows(rows),
    columns(columns) {
  seats.reserve(rows * columns.size());
  for (uint32_t r = 1; r <= rows; r++) {
    for (char c : columns) {
      seats.emplace_back(new Seat(SeatId(r, c)));
      seats_by_id[seats.back()->SeatId()] = seats.back().get();
    }
  }
  Debug("Flight %s created with %lu seats", flight_no.c_str(), seats.size());
}

Flight::~Flight() {}

std::string Flight::SeatId(uint32_t row, char col) {
  return std::to_string(row) + col;
}

bool Flight::ParseSeatId(const std::string &seat_id, uint32_t *row, char *col) {
  size_t i = 0;
  while (i < seat_id.size() && std::isdigit(static_cast<unsigned char>(seat_id[i]))) {
    i++;
  }
  if (i == 0 || i > MAX_ROW_DIGITS || i + 1 != seat_id.size()) {
    return false;
  }
  *row = static_cast<uint32_t>(std::stoul(seat_id.substr(0, i)));
  *col = seat_id[i];
  return true;
}

Seat *Flight::AssignSeatOrNearest(const std::string &preferred_seat,
    const std::string &booking_ref) {
  Seat *seat = GetSeat(preferred_seat);
  if (seat != nullptr && seat->TryAssign(booking_ref)) {
    return seat;
  }

  for (const std::string &cand : NearestCandidates(preferred_seat)) {
    Seat *s = GetSeat(cand);
    if (s != nullptr && s->TryAssign(booking_ref)) {
      Debug("%s: %s taken, assigned %s to %s", flight_no.c_str(),
          preferred_seat.c_str(), cand.c_str(), booking_ref.c_str());
      return s;
    }
  }
  return nullptr;
}

std::vector<std::string> Flight::NearestCandidates(
    const std::string &preferred_seat) const {
  std::vector<std::string> list;
  uint32_t parsed_row;
  char col;
  if (!ParseSeatId(preferred_seat, &parsed_row, &col)) {
    return list;
  }
  int64_t row = std::max<int64_t>(1, parsed_row);

  // An unknown column letter sweeps from the first column.
  int64_t col_idx = 0;
  size_t pos = columns.find(col);
  if (pos != std::string::npos) {
    col_idx = pos;
  }
  const int64_t num_cols = columns.size();

  for (int off : COLUMN_OFFSETS) {
    int64_t idx = col_idx + off;
    if (idx >= 0 && idx < num_cols) list.push_back(SeatId(row, columns[idx]));
  }
  for (int ro : ROW_OFFSETS) {
    int64_t rr = row + ro;
    if (rr < 1) continue;
    list.push_back(SeatId(rr, col));
    for (int off : COLUMN_OFFSETS) {
      int64_t idx = col_idx + off;
      if (idx >= 0 && idx < num_cols) list.push_back(SeatId(rr, columns[idx]));
    }
  }
  return list;
}

Seat *Flight::GetSeat(const std::string &seat_id) const {
  auto itr = seats_by_id.find(seat_id);
  return itr == seats_by_id.end() ? nullptr : itr->second;
}

uint32_t Flight::OccupiedSeatCount() const {
  uint32_t filled = 0;
  for (const auto &s : seats) {
    if (!s->IsFree()) filled++;
  }
  return filled;
}

} // namespace checkin
