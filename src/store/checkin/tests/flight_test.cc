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
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "store/checkin/flight.h"

using ::testing::ElementsAre;

namespace checkin {

TEST(FlightTest, BuildsSeatMapRowMajor) {
  Flight flight("QZ101", 2, "ABC");
  EXPECT_EQ(flight.TotalSeatCount(), 6U);
  EXPECT_EQ(flight.OccupiedSeatCount(), 0U);

  std::vector<std::string> ids;
  for (const auto &seat : flight.GetSeats()) {
    ids.push_back(seat->SeatId());
  }
  EXPECT_THAT(ids, ElementsAre("1A", "1B", "1C", "2A", "2B", "2C"));
  EXPECT_NE(flight.GetSeat("2B"), nullptr);
  EXPECT_EQ(flight.GetSeat("3A"), nullptr);
  EXPECT_EQ(flight.GetSeat("1D"), nullptr);
}

TEST(FlightTest, ParseSeatId) {
  uint32_t row;
  char col;
  ASSERT_TRUE(Flight::ParseSeatId("12C", &row, &col));
  EXPECT_EQ(row, 12U);
  EXPECT_EQ(col, 'C');

  EXPECT_FALSE(Flight::ParseSeatId("", &row, &col));
  EXPECT_FALSE(Flight::ParseSeatId("C12", &row, &col));
  EXPECT_FALSE(Flight::ParseSeatId("12", &row, &col));
  EXPECT_FALSE(Flight::ParseSeatId("12CD", &row, &col));
  EXPECT_FALSE(Flight::ParseSeatId("1234567A", &row, &col));
}

TEST(FlightTest, PreferredSeatWhenFree) {
  Flight flight("QZ101", 2);
  Seat *seat = flight.AssignSeatOrNearest("1C", "P1");
  ASSERT_NE(seat, nullptr);
  EXPECT_EQ(seat->SeatId(), "1C");
  EXPECT_EQ(seat->Occupant(), "P1");
  EXPECT_EQ(flight.OccupiedSeatCount(), 1U);
}

TEST(FlightTest, FallsBackToLeftNeighbour) {
  Flight flight("QZ101", 2);
  ASSERT_NE(flight.AssignSeatOrNearest("1C", "P1"), nullptr);

  Seat *seat = flight.AssignSeatOrNearest("1C", "P2");
  ASSERT_NE(seat, nullptr);
  EXPECT_EQ(seat->SeatId(), "1B");
  EXPECT_EQ(seat->Occupant(), "P2");
}

TEST(FlightTest, FallbackWalksCandidateOrder) {
  Flight flight("QZ101", 2);
  std::vector<std::string> got;
  for (int i = 0; i < 12; i++) {
    Seat *seat = flight.AssignSeatOrNearest("1C", "P" + std::to_string(i));
    ASSERT_NE(seat, nullptr);
    got.push_back(seat->SeatId());
  }
  EXPECT_THAT(got, ElementsAre("1C", "1B", "1D", "1A", "1E", "1F",
      "2C", "2B", "2D", "2A", "2E", "2F"));
  EXPECT_EQ(flight.AssignSeatOrNearest("1C", "P12"), nullptr);
  EXPECT_EQ(flight.OccupiedSeatCount(), 12U);
}

TEST(FlightTest, SingleSeatExhausted) {
  Flight flight("QZ1", 1, "A");
  ASSERT_NE(flight.AssignSeatOrNearest("1A", "P1"), nullptr);
  EXPECT_EQ(flight.AssignSeatOrNearest("1A", "P2"), nullptr);
  EXPECT_EQ(flight.GetSeat("1A")->Occupant(), "P1");
}

TEST(FlightTest, NearestCandidatesOrder) {
  Flight flight("QZ101", 30);
  EXPECT_THAT(flight.NearestCandidates("12C"), ElementsAre(
      "12B", "12D", "12A", "12E", "12F",
      "11C", "11B", "11D", "11A", "11E", "11F",
      "13C", "13B", "13D", "13A", "13E", "13F",
      "10C", "10B", "10D", "10A", "10E", "10F",
      "14C", "14B", "14D", "14A", "14E", "14F"));
}

TEST(FlightTest, NearestCandidatesSkipRowsBeforeFirst) {
  Flight flight("QZ101", 30);
  EXPECT_THAT(flight.NearestCandidates("1A"), ElementsAre(
      "1B", "1C", "1D",
      "2A", "2B", "2C", "2D",
      "3A", "3B", "3C", "3D"));
}

TEST(FlightTest, RowZeroIsClamped) {
  Flight flight("QZ101", 3);
  std::vector<std::string> cands = flight.NearestCandidates("0C");
  ASSERT_FALSE(cands.empty());
  EXPECT_EQ(cands.front(), "1B");

  Seat *seat = flight.AssignSeatOrNearest("0C", "P1");
  ASSERT_NE(seat, nullptr);
  EXPECT_EQ(seat->SeatId(), "1B");
}

TEST(FlightTest, UnknownColumnSweepsFromFirst) {
  Flight flight("QZ101", 2);
  std::vector<std::string> cands = flight.NearestCandidates("1Z");
  EXPECT_THAT(cands, ElementsAre("1B", "1C", "1D",
      "2Z", "2B", "2C", "2D",
      "3Z", "3B", "3C", "3D"));

  Seat *seat = flight.AssignSeatOrNearest("1Z", "P1");
  ASSERT_NE(seat, nullptr);
  EXPECT_EQ(seat->SeatId(), "1B");
}

TEST(FlightTest, UnparseableSeatHasNoCandidates) {
  Flight flight("QZ101", 2);
  EXPECT_TRUE(flight.NearestCandidates("C").empty());
  EXPECT_TRUE(flight.NearestCandidates("12").empty());
  EXPECT_EQ(flight.AssignSeatOrNearest("XX", "P1"), nullptr);
  EXPECT_EQ(flight.OccupiedSeatCount(), 0U);
}

}  // namespace checkin
