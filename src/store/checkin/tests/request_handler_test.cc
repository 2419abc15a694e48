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
#include <gtest/gtest.h>
#include <google/protobuf/util/message_differencer.h>

#include "store/checkin/checkin_service.h"
#include "store/checkin/flight_registry.h"
#include "store/checkin/network_simulator.h"
#include "store/checkin/request_handler.h"

using google::protobuf::util::MessageDifferencer;

namespace checkin {

// Fails the first `failures` attempts of every request.
class ScriptedNetwork : public NetworkSimulator {
 public:
  explicit ScriptedNetwork(uint32_t failures) : failures(failures) {}

  virtual checkin_status_t Transmit(const std::string &op,
      uint32_t attempt) override {
    return attempt <= failures ? CHECKIN_TRANSIENT_FAILURE : CHECKIN_OK;
  }

 private:
  const uint32_t failures;
};

class RequestHandlerTest : public ::testing::Test {
 protected:
  RequestHandlerTest() {
    registry.CreateFlight("QZ101", 2, "ABC");
  }

  static void NoSleep(uint64_t ms) {}

  static proto::SelectSeatRequest SeatRequest(uint64_t req_id,
      const std::string &booking_ref, const std::string &seat) {
    proto::SelectSeatRequest req;
    req.set_req_id(req_id);
    req.set_flight_no("QZ101");
    req.mutable_passenger()->set_name("Ada");
    req.mutable_passenger()->set_booking_ref(booking_ref);
    req.set_preferred_seat(seat);
    req.set_origin_id("K1");
    return req;
  }

  static proto::CheckInBagRequest BagRequest(uint64_t req_id,
      const std::string &tag, double weight) {
    proto::CheckInBagRequest req;
    req.set_req_id(req_id);
    req.set_flight_no("QZ101");
    req.mutable_passenger()->set_booking_ref("BR1");
    req.set_bag_tag(tag);
    req.set_weight_kg(weight);
    req.set_origin_id("K1");
    return req;
  }

  FlightRegistry registry;
};

TEST_F(RequestHandlerTest, ReplyStatusMapping) {
  EXPECT_EQ(ToReplyStatus(CHECKIN_OK), proto::REPLY_OK);
  EXPECT_EQ(ToReplyStatus(CHECKIN_DUPLICATE), proto::REPLY_DUPLICATE);
  EXPECT_EQ(ToReplyStatus(CHECKIN_NO_SEAT), proto::REPLY_NO_SEAT);
  EXPECT_EQ(ToReplyStatus(CHECKIN_TRANSIENT_FAILURE),
      proto::REPLY_TRANSIENT_FAILURE);
  EXPECT_EQ(ToReplyStatus(CHECKIN_INVALID), proto::REPLY_INVALID);
  EXPECT_EQ(ToReplyStatus(CHECKIN_UNKNOWN_FLIGHT), proto::REPLY_UNKNOWN_FLIGHT);
}

TEST_F(RequestHandlerTest, SelectSeatReply) {
  ScriptedNetwork network(2);
  CheckInService service(registry, network, RetryParameters(), nullptr,
      NoSleep);
  RequestHandler handler(service);

  proto::SelectSeatReply reply;
  handler.HandleSelectSeat(SeatRequest(7, "BR1", "2b"), &reply);

  proto::SelectSeatReply expected;
  expected.set_req_id(7);
  expected.set_status(proto::REPLY_OK);
  expected.set_seat_id("2B");
  expected.set_retryable(false);
  expected.set_attempts(3);
  EXPECT_TRUE(MessageDifferencer::Equals(reply, expected))
      << reply.DebugString();
}

TEST_F(RequestHandlerTest, OnlyTransientFailuresAreRetryable) {
  ScriptedNetwork down(100);
  CheckInService failing(registry, down, RetryParameters(), nullptr, NoSleep);
  RequestHandler failing_handler(failing);

  proto::SelectSeatReply seat_reply;
  failing_handler.HandleSelectSeat(SeatRequest(1, "BR1", "1A"), &seat_reply);
  EXPECT_EQ(seat_reply.status(), proto::REPLY_TRANSIENT_FAILURE);
  EXPECT_TRUE(seat_reply.retryable());
  EXPECT_EQ(seat_reply.attempts(), 5U);
  EXPECT_FALSE(seat_reply.has_seat_id());

  proto::CheckInBagReply bag_reply;
  failing_handler.HandleCheckInBag(BagRequest(2, "T1", 10.0), &bag_reply);
  EXPECT_EQ(bag_reply.status(), proto::REPLY_TRANSIENT_FAILURE);
  EXPECT_TRUE(bag_reply.retryable());

  proto::SelectSeatRequest lost = SeatRequest(8, "BR1", "1A");
  lost.set_flight_no("XX1");
  failing_handler.HandleSelectSeat(lost, &seat_reply);
  EXPECT_EQ(seat_reply.status(), proto::REPLY_UNKNOWN_FLIGHT);
  EXPECT_FALSE(seat_reply.retryable());
  EXPECT_EQ(seat_reply.attempts(), 0U);

  ScriptedNetwork up(0);
  CheckInService working(registry, up, RetryParameters(), nullptr, NoSleep);
  RequestHandler handler(working);

  proto::SelectSeatReply invalid;
  handler.HandleSelectSeat(SeatRequest(3, "", "1A"), &invalid);
  EXPECT_EQ(invalid.status(), proto::REPLY_INVALID);
  EXPECT_FALSE(invalid.retryable());
  EXPECT_TRUE(invalid.has_message());

  proto::SelectSeatRequest unknown = SeatRequest(4, "BR1", "1A");
  unknown.set_flight_no("XX1");
  proto::SelectSeatReply unknown_reply;
  handler.HandleSelectSeat(unknown, &unknown_reply);
  EXPECT_EQ(unknown_reply.status(), proto::REPLY_UNKNOWN_FLIGHT);
  EXPECT_FALSE(unknown_reply.retryable());

  proto::CheckInBagReply accepted;
  handler.HandleCheckInBag(BagRequest(5, "T1", 10.0), &accepted);
  EXPECT_EQ(accepted.status(), proto::REPLY_OK);
  EXPECT_FALSE(accepted.has_message());

  proto::CheckInBagReply duplicate;
  handler.HandleCheckInBag(BagRequest(6, "T1", 30.0), &duplicate);
  EXPECT_EQ(duplicate.req_id(), 6U);
  EXPECT_EQ(duplicate.status(), proto::REPLY_DUPLICATE);
  EXPECT_FALSE(duplicate.retryable());
  EXPECT_EQ(duplicate.attempts(), 1U);
}

TEST_F(RequestHandlerTest, NoSeatReplyIsTerminal) {
  ScriptedNetwork network(0);
  CheckInService service(registry, network, RetryParameters(), nullptr,
      NoSleep);
  RequestHandler handler(service);

  proto::SelectSeatReply reply;
  for (int i = 0; i < 6; i++) {
    handler.HandleSelectSeat(SeatRequest(i, "BR" + std::to_string(i), "1A"),
        &reply);
    EXPECT_EQ(reply.status(), proto::REPLY_OK);
  }
  handler.HandleSelectSeat(SeatRequest(6, "BR6", "1A"), &reply);
  EXPECT_EQ(reply.status(), proto::REPLY_NO_SEAT);
  EXPECT_FALSE(reply.retryable());
  EXPECT_EQ(reply.attempts(), 1U);
  EXPECT_EQ(reply.message(), "No seats available near 1A");
}

TEST_F(RequestHandlerTest, FlightStatus) {
  ScriptedNetwork network(0);
  CheckInService service(registry, network, RetryParameters(), nullptr,
      NoSleep);
  RequestHandler handler(service);

  proto::SelectSeatReply seat_reply;
  handler.HandleSelectSeat(SeatRequest(1, "BR1", "1B"), &seat_reply);
  proto::CheckInBagReply bag_reply;
  handler.HandleCheckInBag(BagRequest(2, "T1", 12.5), &bag_reply);
  handler.HandleCheckInBag(BagRequest(3, "T2", 20.0), &bag_reply);

  proto::FlightStatusRequest req;
  req.set_req_id(9);
  req.set_flight_no("QZ101");
  proto::FlightStatusReply reply;
  handler.HandleFlightStatus(req, &reply);

  proto::FlightStatusReply expected;
  expected.set_req_id(9);
  expected.set_status(proto::REPLY_OK);
  expected.set_occupied_seats(1);
  expected.set_total_seats(6);
  expected.set_total_bags(2);
  expected.set_total_weight_kg(32.5);
  EXPECT_TRUE(MessageDifferencer::Equals(reply, expected))
      << reply.DebugString();

  req.set_include_seats(true);
  handler.HandleFlightStatus(req, &reply);
  ASSERT_EQ(reply.seats_size(), 6);
  EXPECT_EQ(reply.seats(0).seat_id(), "1A");
  EXPECT_FALSE(reply.seats(0).occupied());
  EXPECT_FALSE(reply.seats(0).has_booking_ref());
  EXPECT_EQ(reply.seats(1).seat_id(), "1B");
  EXPECT_TRUE(reply.seats(1).occupied());
  EXPECT_EQ(reply.seats(1).booking_ref(), "BR1");

  req.set_flight_no("XX1");
  handler.HandleFlightStatus(req, &reply);
  EXPECT_EQ(reply.status(), proto::REPLY_UNKNOWN_FLIGHT);
  EXPECT_EQ(reply.seats_size(), 0);
}

}  // namespace checkin
