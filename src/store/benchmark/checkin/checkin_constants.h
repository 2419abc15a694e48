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
#ifndef CHECKIN_CONSTANTS_H
#define CHECKIN_CONSTANTS_H

#include <string>
#include <vector>

namespace checkin {

// ----------------------------------------------------------------
// FLIGHT CONSTANTS
// ----------------------------------------------------------------

const std::string DEFAULT_FLIGHT_NO = "QZ101";
const int DEFAULT_SEAT_ROWS = 30;

// ----------------------------------------------------------------
// CROWD CONSTANTS
// ----------------------------------------------------------------

/** Seats most passengers ask for; crowds pile onto these */
const std::vector<std::string> HOT_SEATS = {"12C", "12D", "13C", "14D", "10A", "10F", "15C"};

/** Bags per passenger are drawn uniformly from [0, MAX_BAGS_PER_PASSENGER] */
const int MAX_BAGS_PER_PASSENGER = 2;

const double MIN_BAG_WEIGHT_KG = 12.0;
const double MAX_BAG_WEIGHT_KG = 28.0;

/** Booking references are "BR" followed by a number in this range */
const int MIN_BOOKING_NUMBER = 100000;
const int MAX_BOOKING_NUMBER = 999999;

const std::string CROWD_KIOSK_ID = "SIM";

}

#endif
