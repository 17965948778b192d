/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/messages.hpp"

#include <gtest/gtest.h>

#include "clock/clock.hpp"
#include "dispatch/dispatch_error.hpp"
#include "testutil/outcome.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using dispatch::DispatchError;
using dispatch::QueueEntry;
using primitives::TaskKind;
using primitives::TaskResult;
using primitives::TaskStatus;

/**
 * @given queue entry of a synthetic task
 * @when encode it
 * @then it is a flat JSON object readable back
 */
TEST(MessagesTest, QueueEntry) {
  QueueEntry entry{.task_id = "5f0c",
                   .task_type = "proteus-text-to-image",
                   .kind = TaskKind::Synthetic,
                   .deadline = clock::fromMillis(1'700'000'030'000)};
  auto message = dispatch::encodeQueueEntry(entry);
  EXPECT_EQ(message,
            R"({"task_id":"5f0c","task_type":"proteus-text-to-image",)"
            R"("kind":"synthetic","deadline_ms":1700000030000})");
  EXPECT_OUTCOME_TRUE(decoded, dispatch::decodeQueueEntry(message));
  EXPECT_EQ(decoded, entry);
}

TEST(MessagesTest, MalformedQueueEntry) {
  EXPECT_EC(dispatch::decodeQueueEntry("not json"),
            DispatchError::MALFORMED_MESSAGE);
  EXPECT_EC(dispatch::decodeQueueEntry("[1,2]"),
            DispatchError::MALFORMED_MESSAGE);
  EXPECT_EC(dispatch::decodeQueueEntry(
                R"({"task_id":"","task_type":"t","kind":"organic"})"),
            DispatchError::MALFORMED_MESSAGE);
  EXPECT_EC(dispatch::decodeQueueEntry(
                R"({"task_id":"a","task_type":"t","kind":"bogus"})"),
            DispatchError::MALFORMED_MESSAGE);
  EXPECT_EC(dispatch::decodeQueueEntry(
                R"({"task_id":"a","task_type":"t","kind":"organic"})"),
            DispatchError::MALFORMED_MESSAGE);
}

/**
 * @given result of a completed task with quotes in the response
 * @when encode and decode it
 * @then every field survives
 */
TEST(MessagesTest, TaskResult) {
  TaskResult result{.task_id = "t1",
                    .status = TaskStatus::Completed,
                    .participant = "hk",
                    .latency = 1234ms,
                    .quality = 0.75,
                    .response = R"({"text":"say \"hi\""})"};
  EXPECT_OUTCOME_TRUE(decoded,
                      dispatch::decodeTaskResult(
                          dispatch::encodeTaskResult(result)));
  EXPECT_EQ(decoded, result);
}

TEST(MessagesTest, TaskResultWithoutParticipant) {
  EXPECT_OUTCOME_TRUE(
      decoded,
      dispatch::decodeTaskResult(R"({"task_id":"t2","status":"expired"})"));
  EXPECT_EQ(decoded.status, TaskStatus::Expired);
  EXPECT_FALSE(decoded.participant.has_value());
  EXPECT_EQ(decoded.latency, 0ms);
  EXPECT_EC(dispatch::decodeTaskResult(R"({"task_id":"t2","status":"done"})"),
            DispatchError::MALFORMED_MESSAGE);
}
