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
#include "store/checkin/request_handler.h"

#include "lib/assert.h"
#include "lib/message.h"

namespace checkin {

proto::ReplyStatus ToReplyStatus(checkin_status_t status) {
  switch (status) {
    case CHECKIN_OK:
      return proto::REPLY_OK;
    case CHECKIN_DUPLICATE:
      return proto::REPLY_DUPLICATE;
    case CHECKIN_NO_SEAT:
      return proto::REPLY_NO_SEAT;
    case CHECKIN_TRANSIENT_FAILURE:
      return proto::REPLY_TRANSIENT_FAILURE;
    case CHECKIN_INVALID:
      return proto::REPLY_INVALID;
    case CHECKIN_UNKNOWN_FLIGHT:
      return proto::REPLY_UNKNOWN_FLIGHT;
    default:
      NOT_REACHABLE();
  }
}

RequestHandler::RequestHandler(CheckInService &service) : service(service) {}

RequestHandler::~RequestHandler() {}

void RequestHandler::HandleSelectSeat(const proto::SelectSeatRequest &request,
    proto::SelectSeatReply *reply) {
  Passenger passenger(request.passenger().name(),
      request.passenger().booking_ref());
  SeatResult result = service.SelectSeat(request.flight_no(), passenger,
      request.preferred_seat(), request.origin_id());

  reply->Clear();
  reply->set_req_id(request.req_id());
  reply->set_status(ToReplyStatus(result.status));
  if (result.ok()) {
    reply->set_seat_id(result.seat_id);
  }
  if (!result.message.empty()) {
    reply->set_message(result.message);
  }
  reply->set_retryable(IsClientRetryable(result.status));
  reply->set_attempts(result.attempts);
}

void RequestHandler::HandleCheckInBag(const proto::CheckInBagRequest &request,
    proto::CheckInBagReply *reply) {
  Passenger passenger(request.passenger().name(),
      request.passenger().booking_ref());
  BagResult result = service.CheckInBag(request.flight_no(), passenger,
      request.bag_tag(), request.weight_kg(), request.origin_id());

  reply->Clear();
  reply->set_req_id(request.req_id());
  reply->set_status(ToReplyStatus(result.status));
  if (!result.message.empty()) {
    reply->set_message(result.message);
  }
  reply->set_retryable(IsClientRetryable(result.status));
  reply->set_attempts(result.attempts);
}

void RequestHandler::HandleFlightStatus(
    const proto::FlightStatusRequest &request,
    proto::FlightStatusReply *reply) const {
  reply->Clear();
  reply->set_req_id(request.req_id());

  const Flight *flight = service.GetRegistry().Get(request.flight_no());
  if (flight == nullptr) {
    reply->set_status(proto::REPLY_UNKNOWN_FLIGHT);
    return;
  }

  uint64_t bags;
  double weight;
  flight->GetBaggage().GetTotals(&bags, &weight);

  reply->set_status(proto::REPLY_OK);
  reply->set_total_seats(flight->TotalSeatCount());
  reply->set_total_bags(bags);
  reply->set_total_weight_kg(weight);

  uint32_t occupied = 0;
  for (const auto &seat : flight->GetSeats()) {
    std::string occupant = seat->Occupant();
    if (!occupant.empty()) {
      occupied++;
    }
    if (request.include_seats()) {
      proto::SeatState *state = reply->add_seats();
      state->set_seat_id(seat->SeatId());
      state->set_occupied(!occupant.empty());
      if (!occupant.empty()) {
        state->set_booking_ref(occupant);
      }
    }
  }
  reply->set_occupied_seats(occupied);
  Debug("Flight status %s: %u/%u seats, %lu bags", request.flight_no().c_str(),
      occupied, flight->TotalSeatCount(), bags);
}

} // namespace checkin
