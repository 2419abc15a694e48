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
#include "store/checkin/common.h"

namespace checkin {

const char *StatusToString(checkin_status_t status) {
  switch (status) {
    case CHECKIN_OK:
      return "OK";
    case CHECKIN_DUPLICATE:
      return "DUPLICATE";
    case CHECKIN_NO_SEAT:
      return "NO_SEAT";
    case CHECKIN_TRANSIENT_FAILURE:
      return "TRANSIENT_FAILURE";
    case CHECKIN_INVALID:
      return "INVALID";
    case CHECKIN_UNKNOWN_FLIGHT:
      return "UNKNOWN_FLIGHT";
    default:
      return "UNKNOWN_STATUS";
  }
}

} // namespace checkin
