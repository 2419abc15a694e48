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
#include "store/checkin/baggage_ledger.h"

#include <mutex>

#include "lib/message.h"

namespace checkin {

BaggageLedger::BaggageLedger() : total_bags(0), total_weight(0.0) {}

BaggageLedger::~BaggageLedger() {}

bool BaggageLedger::CheckInBag(const BaggageRecord &record) {
  std::unique_lock<std::shared_mutex> lock(ledger_mutex);
  if (!by_bag_tag.insert(RecordMap::value_type(record.bag_tag, record))) {
    Debug("Duplicate bag tag %s ignored", record.bag_tag.c_str());
    return false;
  }
  total_bags++;
  total_weight += record.weight_kg;
  return true;
}

bool BaggageLedger::Lookup(const std::string &bag_tag,
    BaggageRecord *record) const {
  RecordMap::const_accessor acc;
  if (!by_bag_tag.find(acc, bag_tag)) {
    return false;
  }
  if (record != nullptr) {
    *record = acc->second;
  }
  return true;
}

uint64_t BaggageLedger::GetTotalBags() const {
  std::shared_lock<std::shared_mutex> lock(ledger_mutex);
  return total_bags;
}

double BaggageLedger::GetTotalWeight() const {
  std::shared_lock<std::shared_mutex> lock(ledger_mutex);
  return total_weight;
}

void BaggageLedger::GetTotals(uint64_t *bags, double *weight) const {
  std::shared_lock<std::shared_mutex> lock(ledger_mutex);
  *bags = total_bags;
  *weight = total_weight;
}

} // namespace checkin
