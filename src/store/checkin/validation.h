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
#ifndef _CHECKIN_VALIDATION_H_
#define _CHECKIN_VALIDATION_H_

#include <string>

#include "store/checkin/common.h"

namespace checkin {

// Boundary checks applied before a request reaches a flight. Each returns
// CHECKIN_OK or CHECKIN_INVALID and fills *error with a message fit for the
// kiosk user.

std::string Trim(const std::string &s);
// Trims and upper-cases a typed seat id.
std::string NormalizeSeatId(const std::string &seat_id);

checkin_status_t ValidateSeatRequest(const std::string &flight_no,
    const Passenger &passenger, const std::string &preferred_seat,
    std::string *error);

checkin_status_t ValidateBagRequest(const std::string &flight_no,
    const Passenger &passenger, const std::string &bag_tag, double weight_kg,
    std::string *error);

// Strict parse of a weight typed into a form; the whole string must be a
// finite decimal number.
checkin_status_t ParseWeight(const std::string &text, double *weight_kg,
    std::string *error);

} // namespace checkin

#endif /* _CHECKIN_VALIDATION_H_ */
