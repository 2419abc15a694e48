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
#ifndef _CHECKIN_REQUEST_HANDLER_H_
#define _CHECKIN_REQUEST_HANDLER_H_

#include "store/checkin/checkin_service.h"
#include "store/checkin/checkin-proto.pb.h"
#include "store/checkin/common.h"

namespace checkin {

proto::ReplyStatus ToReplyStatus(checkin_status_t status);

// Maps protobuf requests onto the CheckInService so a transport can carry
// them. Replies keep the accepted / duplicate / terminal distinction and
// mark only transient failures as retryable.
class RequestHandler {
 public:
  explicit RequestHandler(CheckInService &service);
  virtual ~RequestHandler();

  void HandleSelectSeat(const proto::SelectSeatRequest &request,
      proto::SelectSeatReply *reply);
  void HandleCheckInBag(const proto::CheckInBagRequest &request,
      proto::CheckInBagReply *reply);
  void HandleFlightStatus(const proto::FlightStatusRequest &request,
      proto::FlightStatusReply *reply) const;

 private:
  CheckInService &service;
};

} // namespace checkin

#endif /* _CHECKIN_REQUEST_HANDLER_H_ */
