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
#ifndef _CHECKIN_BAGGAGE_LEDGER_H_
#define _CHECKIN_BAGGAGE_LEDGER_H_

#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>

#include "tbb/concurrent_hash_map.h"

namespace checkin {

struct BaggageRecord {
  BaggageRecord() : weight_kg(0.0) {}
  BaggageRecord(const std::string &bag_tag, const std::string &booking_ref,
      double weight_kg, const std::string &kiosk_id)
      : bag_tag(bag_tag), booking_ref(booking_ref), weight_kg(weight_kg),
        kiosk_id(kiosk_id), created_at(std::chrono::system_clock::now()) {}

  std::string bag_tag;
  std::string booking_ref;
  double weight_kg;
  std::string kiosk_id;
  std::chrono::system_clock::time_point created_at;
};

// Append-only record of checked-in bags keyed by bag tag, with running
// totals. Insertion and the counter update form one exclusive region, so
// readers of GetTotals never see counters that disagree with the records.
class BaggageLedger {
 public:
  BaggageLedger();
  virtual ~BaggageLedger();

  // true if the record was stored; false if its tag was already present,
  // in which case nothing changes.
  bool CheckInBag(const BaggageRecord &record);

  bool Lookup(const std::string &bag_tag, BaggageRecord *record) const;

  // Each getter reads its own snapshot; two separate calls may straddle a
  // check-in. Use GetTotals() when bags and weight are shown together.
  uint64_t GetTotalBags() const;
  double GetTotalWeight() const;
  void GetTotals(uint64_t *total_bags, double *total_weight) const;

 private:
  typedef tbb::concurrent_hash_map<std::string, BaggageRecord> RecordMap;

  RecordMap by_bag_tag;
  mutable std::shared_mutex ledger_mutex;
  uint64_t total_bags;
  double total_weight;
};

} // namespace checkin

#endif /* _CHECKIN_BAGGAGE_LEDGER_H_ */
