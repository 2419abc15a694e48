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
#ifndef _CHECKIN_FLIGHT_REGISTRY_H_
#define _CHECKIN_FLIGHT_REGISTRY_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tbb/concurrent_unordered_map.h"

#include "store/checkin/common.h"
#include "store/checkin/flight.h"

namespace checkin {

// Owns every Flight for the lifetime of the registry. Flights are added at
// startup and never removed, so returned pointers stay valid.
class FlightRegistry {
 public:
  FlightRegistry();
  virtual ~FlightRegistry();

  // Builds rows x |columns| seats eagerly. Returns nullptr and registers
  // nothing if flight_no is empty or taken, rows is 0, or columns is empty
  // or is not a set of distinct upper-case letters.
  Flight *CreateFlight(const std::string &flight_no, uint32_t rows,
      const std::string &columns = DEFAULT_COLUMNS);

  Flight *Get(const std::string &flight_no) const;

  size_t Size() const;
  std::vector<std::string> GetFlightNumbers() const;

 private:
  typedef tbb::concurrent_unordered_map<std::string, std::unique_ptr<Flight>> FlightMap;

  FlightMap flights;
};

} // namespace checkin

#endif /* _CHECKIN_FLIGHT_REGISTRY_H_ */
