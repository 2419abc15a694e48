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
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "store/checkin/retry_policy.h"

using ::testing::ElementsAre;

namespace checkin {

class RetryPolicyTest : public ::testing::Test {
 protected:
  sleep_callback Recorder() {
    return [this](uint64_t ms) { sleeps.push_back(ms); };
  }

  std::vector<uint64_t> sleeps;
};

TEST_F(RetryPolicyTest, BackoffDoublesFromBase) {
  RetryPolicy policy(RetryParameters(), Recorder());
  EXPECT_EQ(policy.BackoffMs(0), 0U);
  EXPECT_EQ(policy.BackoffMs(1), 12U);
  EXPECT_EQ(policy.BackoffMs(2), 24U);
  EXPECT_EQ(policy.BackoffMs(3), 48U);
  EXPECT_EQ(policy.BackoffMs(4), 96U);
}

TEST_F(RetryPolicyTest, BackoffIsCapped) {
  RetryPolicy policy(RetryParameters(40, 12, 0, 100), Recorder());
  EXPECT_EQ(policy.BackoffMs(4), 96U);
  EXPECT_EQ(policy.BackoffMs(5), 100U);
  EXPECT_EQ(policy.BackoffMs(40), 100U);
}

TEST_F(RetryPolicyTest, JitterStaysBelowMax) {
  RetryPolicy policy(RetryParameters(5, 12, 10), Recorder());
  for (int i = 0; i < 1000; i++) {
    EXPECT_LT(policy.Jitter(), 10U);
  }
  RetryPolicy none(RetryParameters(5, 12, 0), Recorder());
  EXPECT_EQ(none.Jitter(), 0U);
}

TEST_F(RetryPolicyTest, SucceedsOnLastAttempt) {
  RetryPolicy policy(RetryParameters(5, 12, 0), Recorder());
  std::vector<uint32_t> seen;
  uint32_t attempts = 0;
  checkin_status_t status = policy.Run("op", [&seen](uint32_t attempt) {
    seen.push_back(attempt);
    return attempt < 5 ? CHECKIN_TRANSIENT_FAILURE : CHECKIN_OK;
  }, &attempts);

  EXPECT_EQ(status, CHECKIN_OK);
  EXPECT_EQ(attempts, 5U);
  EXPECT_THAT(seen, ElementsAre(1U, 2U, 3U, 4U, 5U));
  EXPECT_THAT(sleeps, ElementsAre(12U, 24U, 48U, 96U));
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxAttempts) {
  RetryPolicy policy(RetryParameters(5, 12, 0), Recorder());
  int calls = 0;
  uint32_t attempts = 0;
  checkin_status_t status = policy.Run("op", [&calls](uint32_t attempt) {
    calls++;
    return CHECKIN_TRANSIENT_FAILURE;
  }, &attempts);

  EXPECT_EQ(status, CHECKIN_TRANSIENT_FAILURE);
  EXPECT_EQ(calls, 5);
  EXPECT_EQ(attempts, 5U);
  EXPECT_EQ(sleeps.size(), 4U);
}

TEST_F(RetryPolicyTest, SleepsIncludeJitter) {
  RetryPolicy policy(RetryParameters(3, 12, 10), Recorder());
  policy.Run("op", [](uint32_t attempt) {
    return CHECKIN_TRANSIENT_FAILURE;
  });
  ASSERT_EQ(sleeps.size(), 2U);
  EXPECT_GE(sleeps[0], 12U);
  EXPECT_LT(sleeps[0], 22U);
  EXPECT_GE(sleeps[1], 24U);
  EXPECT_LT(sleeps[1], 34U);
}

TEST_F(RetryPolicyTest, NoSeatIsTerminalByDefault) {
  RetryPolicy policy(RetryParameters(), Recorder());
  EXPECT_FALSE(policy.ShouldRetry(CHECKIN_NO_SEAT));
  int calls = 0;
  uint32_t attempts = 0;
  checkin_status_t status = policy.Run("op", [&calls](uint32_t attempt) {
    calls++;
    return CHECKIN_NO_SEAT;
  }, &attempts);
  EXPECT_EQ(status, CHECKIN_NO_SEAT);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(attempts, 1U);
  EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryPolicyTest, NoSeatRetriedWhenConfigured) {
  RetryPolicy policy(RetryParameters(5, 12, 0, 5000, true), Recorder());
  EXPECT_TRUE(policy.ShouldRetry(CHECKIN_NO_SEAT));
  int calls = 0;
  uint32_t attempts = 0;
  checkin_status_t status = policy.Run("op", [&calls](uint32_t attempt) {
    calls++;
    return CHECKIN_NO_SEAT;
  }, &attempts);
  EXPECT_EQ(status, CHECKIN_NO_SEAT);
  EXPECT_EQ(calls, 5);
  EXPECT_EQ(attempts, 5U);
}

TEST_F(RetryPolicyTest, TerminalStatusesNotRetried) {
  RetryPolicy policy(RetryParameters(), Recorder());
  for (checkin_status_t s : {CHECKIN_OK, CHECKIN_DUPLICATE, CHECKIN_INVALID,
        CHECKIN_UNKNOWN_FLIGHT}) {
    EXPECT_FALSE(policy.ShouldRetry(s)) << StatusToString(s);
    uint32_t attempts = 0;
    EXPECT_EQ(policy.Run("op", [s](uint32_t attempt) { return s; }, &attempts), s);
    EXPECT_EQ(attempts, 1U);
  }
  EXPECT_TRUE(policy.ShouldRetry(CHECKIN_TRANSIENT_FAILURE));
  EXPECT_TRUE(sleeps.empty());
}

}  // namespace checkin
