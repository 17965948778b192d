/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "dispatch/impl/http_worker_client.hpp"

#include <gtest/gtest.h>

#include "dispatch/dispatch_error.hpp"
#include "http/http_error.hpp"
#include "mock/core/http/http_client_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace std::chrono_literals;
using namespace nineteen;  // NOLINT
using dispatch::DispatchError;
using dispatch::HttpWorkerClient;
using http::HttpRequest;
using http::HttpResponse;
using testing::_;
using testing::Eq;
using testing::Return;
using testing::SaveArg;

class HttpWorkerClientTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    worker.hotkey = "hk";
    worker.ip = "10.1.2.3";
    worker.port = 8091;
    task.id = "t1";
    task.task_type = "chat-llama-3-2-3b";
    task.payload = R"({"messages":[{"role":"user","content":"hi"}]})";
  }

  std::shared_ptr<http::HttpClientMock> http_client =
      std::make_shared<http::HttpClientMock>();
  HttpWorkerClient client{http_client};
  primitives::Participant worker;
  primitives::Task task;
};

TEST_F(HttpWorkerClientTest, EndpointOf) {
  EXPECT_EQ(HttpWorkerClient::endpointOf(worker, "chat"),
            "http://10.1.2.3:8091/chat");
  worker.ip = "2001:db8::1";
  EXPECT_EQ(HttpWorkerClient::endpointOf(worker, "chat"),
            "http://[2001:db8::1]:8091/chat");
}

/**
 * @given worker answering 200
 * @when perform a task
 * @then the payload is posted to the task type path and the body returned
 */
TEST_F(HttpWorkerClientTest, Success) {
  HttpRequest request;
  EXPECT_CALL(*http_client, send(_, Eq(5000ms)))
      .WillOnce(testing::DoAll(SaveArg<0>(&request),
                               Return(HttpResponse{200, "answer"})));

  EXPECT_OUTCOME_TRUE(body, client.perform(worker, task, 5000ms));
  EXPECT_EQ(body, "answer");
  EXPECT_EQ(request.method, http::HttpMethod::Post);
  EXPECT_EQ(request.url, "http://10.1.2.3:8091/chat-llama-3-2-3b");
  EXPECT_EQ(request.body, task.payload);
}

/**
 * @given worker timing out or answering with an error status
 * @when perform a task
 * @then both are reported as worker failures
 */
TEST_F(HttpWorkerClientTest, Failures) {
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(Return(outcome::failure(http::HttpError::TIMEOUT)))
      .WillOnce(Return(HttpResponse{500, "boom"}));
  EXPECT_EC(client.perform(worker, task, 1s), DispatchError::WORKER_FAILED);
  EXPECT_EC(client.perform(worker, task, 1s), DispatchError::WORKER_FAILED);
}
