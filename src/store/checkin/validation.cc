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
#include "store/checkin/validation.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#include <fmt/core.h>

#include "store/checkin/flight.h"

namespace checkin {

static checkin_status_t Reject(std::string *error, const std::string &message) {
  if (error != nullptr) {
    *error = message;
  }
  return CHECKIN_INVALID;
}

std::string Trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(begin, end - begin);
}

std::string NormalizeSeatId(const std::string &seat_id) {
  std::string normalized = Trim(seat_id);
  for (char &c : normalized) {
    c = std::toupper(static_cast<unsigned char>(c));
  }
  return normalized;
}

checkin_status_t ValidateSeatRequest(const std::string &flight_no,
    const Passenger &passenger, const std::string &preferred_seat,
    std::string *error) {
  if (Trim(flight_no).empty()) {
    return Reject(error, "Flight number is required.");
  }
  if (Trim(passenger.name).empty() || Trim(passenger.booking_ref).empty() ||
      Trim(preferred_seat).empty()) {
    return Reject(error, "Please fill Name, Booking Ref, and Preferred Seat.");
  }
  uint32_t row;
  char col;
  if (!Flight::ParseSeatId(preferred_seat, &row, &col) ||
      !std::isalpha(static_cast<unsigned char>(col))) {
    return Reject(error, fmt::format(
        "Preferred seat '{}' must be a row number followed by a column letter, e.g. 12C.",
        preferred_seat));
  }
  return CHECKIN_OK;
}

checkin_status_t ValidateBagRequest(const std::string &flight_no,
    const Passenger &passenger, const std::string &bag_tag, double weight_kg,
    std::string *error) {
  if (Trim(flight_no).empty()) {
    return Reject(error, "Flight number is required.");
  }
  if (Trim(passenger.booking_ref).empty() || Trim(bag_tag).empty()) {
    return Reject(error, "Please fill Booking Ref, Bag Tag, and Weight.");
  }
  if (!std::isfinite(weight_kg) || weight_kg < 0.0) {
    return Reject(error, fmt::format("Weight {} kg is not a valid bag weight.",
        weight_kg));
  }
  return CHECKIN_OK;
}

checkin_status_t ParseWeight(const std::string &text, double *weight_kg,
    std::string *error) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return Reject(error, "Please fill Booking Ref, Bag Tag, and Weight.");
  }
  errno = 0;
  char *end = nullptr;
  double parsed = std::strtod(trimmed.c_str(), &end);
  if (errno != 0 || end != trimmed.c_str() + trimmed.size() ||
      !std::isfinite(parsed)) {
    return Reject(error, "Weight must be a number.");
  }
  *weight_kg = parsed;
  return CHECKIN_OK;
}

} // namespace checkin
