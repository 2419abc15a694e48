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
#include "store/checkin/flight_registry.h"

#include <algorithm>
#include <set>

#include "lib/message.h"

namespace checkin {

FlightRegistry::FlightRegistry() {}

FlightRegistry::~FlightRegistry() {}

Flight *FlightRegistry::CreateFlight(const std::string &flight_no,
    uint32_t rows, const std::string &columns) {
  if (flight_no.empty() || rows == 0 || columns.empty()) {
    Debug("Rejecting flight '%s' with %u rows and columns '%s'",
        flight_no.c_str(), rows, columns.c_str());
    return nullptr;
  }
  std::set<char> distinct;
  for (char c : columns) {
    if (c < 'A' || c > 'Z' || !distinct.insert(c).second) {
      Debug("Rejecting flight %s: column '%c' in '%s' is not a distinct "
          "upper-case letter", flight_no.c_str(), c, columns.c_str());
      return nullptr;
    }
  }

  std::unique_ptr<Flight> flight(new Flight(flight_no, rows, columns));
  auto res = flights.emplace(flight_no, std::move(flight));
  if (!res.second) {
    Debug("Flight %s already registered", flight_no.c_str());
    return nullptr;
  }
  return res.first->second.get();
}

Flight *FlightRegistry::Get(const std::string &flight_no) const {
  auto itr = flights.find(flight_no);
  if (itr == flights.end()) {
    return nullptr;
  }
  return itr->second.get();
}

size_t FlightRegistry::Size() const {
  return flights.size();
}

std::vector<std::string> FlightRegistry::GetFlightNumbers() const {
  std::vector<std::string> numbers;
  for (const auto &entry : flights) {
    numbers.push_back(entry.first);
  }
  std::sort(numbers.begin(), numbers.end());
  return numbers;
}

} // namespace checkin
