/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/jrpc_chain_client.hpp"

#include <gtest/gtest.h>

#include "chain/chain_error.hpp"
#include "http/http_error.hpp"
#include "mock/core/http/http_client_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace nineteen;  // NOLINT
using chain::ChainError;
using chain::JrpcChainClient;
using http::HttpClientMock;
using http::HttpRequest;
using http::HttpResponse;
using testing::_;
using testing::HasSubstr;
using testing::Return;
using testing::SaveArg;

class JrpcChainClientTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::shared_ptr<HttpClientMock> http_client =
      std::make_shared<HttpClientMock>();
  JrpcChainClient client{
      chain::ChainConfig{.endpoint = "http://chain:9944", .netuid = 19},
      http_client};
};

/**
 * @given chain proxy returning two participants
 * @when fetch participants
 * @then chain fields are decoded and eligibility is left to the caller
 */
TEST_F(JrpcChainClientTest, FetchParticipants) {
  HttpRequest request;
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(testing::DoAll(
          SaveArg<0>(&request),
          Return(HttpResponse{
              200,
              R"({"jsonrpc":"2.0","id":1,"result":[)"
              R"({"hotkey":"hk0","coldkey":"ck0","node_id":0,"netuid":19,)"
              R"("stake":1500.5,"incentive":0.1,"trust":0.2,"vtrust":0.3,)"
              R"("last_updated":1234,"ip":"10.0.0.1","ip_type":4,)"
              R"("port":8091,"protocol":4},)"
              R"({"hotkey":"hk1","node_id":1}]})"})));

  EXPECT_OUTCOME_TRUE(participants, client.fetchParticipants());

  EXPECT_EQ(request.url, "http://chain:9944");
  EXPECT_THAT(request.body, HasSubstr(R"("method":"participants_get")"));
  EXPECT_THAT(request.body, HasSubstr(R"("netuid":19)"));

  ASSERT_EQ(participants.size(), 2u);
  auto &first = participants[0];
  EXPECT_EQ(first.hotkey, "hk0");
  EXPECT_EQ(first.coldkey, "ck0");
  EXPECT_DOUBLE_EQ(first.stake, 1500.5);
  EXPECT_EQ(first.registration_block, 1234u);
  EXPECT_EQ(first.ip, "10.0.0.1");
  EXPECT_EQ(first.port, 8091);
  EXPECT_FALSE(first.eligible);
  EXPECT_EQ(participants[1].node_id, 1);
  EXPECT_EQ(participants[1].ip, "0.0.0.0");
}

/**
 * @given participant entry without hotkey
 * @when fetch participants
 * @then the whole response is rejected
 */
TEST_F(JrpcChainClientTest, MalformedParticipant) {
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(Return(HttpResponse{
          200, R"({"jsonrpc":"2.0","id":1,"result":[{"node_id":0}]})"}));
  EXPECT_EC(client.fetchParticipants(), ChainError::BAD_RESPONSE);
}

TEST_F(JrpcChainClientTest, TransportAndProtocolFailures) {
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(Return(outcome::failure(http::HttpError::TIMEOUT)))
      .WillOnce(Return(HttpResponse{502, "bad gateway"}))
      .WillOnce(Return(HttpResponse{200, "not json"}))
      .WillOnce(Return(HttpResponse{
          200,
          R"({"jsonrpc":"2.0","id":4,)"
          R"("error":{"code":-32603,"message":"internal"}})"}));

  EXPECT_EC(client.fetchParticipants(), http::HttpError::TIMEOUT);
  EXPECT_EC(client.fetchParticipants(), ChainError::BAD_RESPONSE);
  EXPECT_EC(client.fetchParticipants(), ChainError::BAD_RESPONSE);
  EXPECT_EC(client.fetchParticipants(), ChainError::RPC_ERROR);
}

/**
 * @given weight vector for an epoch
 * @when submit it
 * @then uids and weights are sent in order and the tx reference is returned
 */
TEST_F(JrpcChainClientTest, SubmitWeights) {
  HttpRequest request;
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(testing::DoAll(
          SaveArg<0>(&request),
          Return(HttpResponse{200,
                              R"({"jsonrpc":"2.0","id":1,"result":"0xfeed"})"})));

  EXPECT_OUTCOME_TRUE(
      tx_ref,
      client.submitWeights(
          42, {{.node_id = 3, .hotkey = "a", .weight = 0.25},
               {.node_id = 5, .hotkey = "b", .weight = 0.75}}));
  EXPECT_EQ(tx_ref, "0xfeed");
  EXPECT_THAT(request.body, HasSubstr(R"("method":"weights_set")"));
  EXPECT_THAT(request.body, HasSubstr(R"("epoch":42)"));
  EXPECT_THAT(request.body, HasSubstr(R"("uids":[3,5])"));
  EXPECT_THAT(request.body, HasSubstr(R"("weights":[0.25,0.75])"));
}

/**
 * @given chain refusing the call with an application error
 * @when submit weights
 * @then the refusal is not reported as transient
 */
TEST_F(JrpcChainClientTest, SubmitRejected) {
  EXPECT_CALL(*http_client, send(_, _))
      .WillOnce(Return(HttpResponse{
          200,
          R"({"jsonrpc":"2.0","id":1,)"
          R"("error":{"code":1,"message":"weights rate limited"}})"}));
  EXPECT_EC(client.submitWeights(1, {}), ChainError::REJECTED);
}
