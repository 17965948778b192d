/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/jrpc_chain_client.hpp"

#include <limits>

#include "chain/chain_error.hpp"
#include "common/json.hpp"

namespace nineteen::chain {

  namespace {
    outcome::result<primitives::Participant> decodeParticipant(
        const rapidjson::Value &item) {
      primitives::Participant p;
      auto hotkey = common::getString(item, "hotkey");
      auto node_id = common::getInt64(item, "node_id");
      if (not hotkey or hotkey->empty() or not node_id or *node_id < 0
          or *node_id > std::numeric_limits<primitives::NodeId>::max()) {
        return ChainError::BAD_RESPONSE;
      }
      p.hotkey = std::move(*hotkey);
      p.node_id = static_cast<primitives::NodeId>(*node_id);
      p.coldkey = common::getString(item, "coldkey").value_or("");
      p.netuid =
          static_cast<uint16_t>(common::getInt64(item, "netuid").value_or(0));
      p.stake = common::getDouble(item, "stake").value_or(0.);
      p.incentive = common::getDouble(item, "incentive").value_or(0.);
      p.trust = common::getDouble(item, "trust").value_or(0.);
      p.vtrust = common::getDouble(item, "vtrust").value_or(0.);
      p.registration_block = static_cast<uint64_t>(
          common::getInt64(item, "last_updated").value_or(0));
      p.ip = common::getString(item, "ip").value_or("0.0.0.0");
      p.ip_type =
          static_cast<uint8_t>(common::getInt64(item, "ip_type").value_or(4));
      p.port = static_cast<uint16_t>(common::getInt64(item, "port").value_or(0));
      p.protocol =
          static_cast<uint8_t>(common::getInt64(item, "protocol").value_or(4));
      return p;
    }
  }  // namespace

  JrpcChainClient::JrpcChainClient(
      ChainConfig config, std::shared_ptr<http::HttpClient> http_client)
      : config_{std::move(config)},
        http_client_{std::move(http_client)},
        logger_{log::createLogger("ChainClient", "chain")} {
    BOOST_ASSERT(http_client_ != nullptr);
  }

  outcome::result<rapidjson::Document> JrpcChainClient::call(
      std::string_view method, rapidjson::Document params) {
    auto id = next_id_.fetch_add(1);

    rapidjson::Document request;
    request.SetObject();
    auto &allocator = request.GetAllocator();
    request.AddMember("jsonrpc", "2.0", allocator);
    request.AddMember("id", id, allocator);
    request.AddMember(
        "method", common::jsonString(method, allocator), allocator);
    rapidjson::Value params_value;
    params_value.CopyFrom(params, allocator);
    request.AddMember("params", params_value, allocator);

    OUTCOME_TRY(response,
                http_client_->send({.method = http::HttpMethod::Post,
                                    .url = config_.endpoint,
                                    .body = common::json2string(request)},
                                   config_.timeout));
    if (not response.isSuccess()) {
      SL_WARN(logger_, "{} answered with HTTP {}", method, response.status);
      return ChainError::BAD_RESPONSE;
    }

    rapidjson::Document document;
    document.Parse(response.body.data(), response.body.size());
    if (document.HasParseError() or not document.IsObject()) {
      SL_WARN(logger_, "{} answered with malformed JSON", method);
      return ChainError::BAD_RESPONSE;
    }
    if (auto error = document.FindMember("error");
        error != document.MemberEnd() and not error->value.IsNull()) {
      SL_WARN(logger_,
              "{} failed: {}",
              method,
              common::getString(error->value, "message").value_or("unknown"));
      auto code = common::getInt64(error->value, "code");
      // Application level refusal, as opposed to a transport problem
      if (code and *code > -32000) {
        return ChainError::REJECTED;
      }
      return ChainError::RPC_ERROR;
    }
    auto result = document.FindMember("result");
    if (result == document.MemberEnd()) {
      return ChainError::BAD_RESPONSE;
    }
    rapidjson::Document out;
    out.CopyFrom(result->value, out.GetAllocator());
    return out;
  }

  outcome::result<std::vector<primitives::Participant>>
  JrpcChainClient::fetchParticipants() {
    rapidjson::Document params;
    params.SetObject();
    params.AddMember("netuid", config_.netuid, params.GetAllocator());
    OUTCOME_TRY(result, call("participants_get", std::move(params)));
    if (not result.IsArray()) {
      return ChainError::BAD_RESPONSE;
    }
    std::vector<primitives::Participant> participants;
    participants.reserve(result.Size());
    for (auto &item : result.GetArray()) {
      OUTCOME_TRY(participant, decodeParticipant(item));
      participants.emplace_back(std::move(participant));
    }
    SL_DEBUG(logger_, "Fetched {} participants", participants.size());
    return participants;
  }

  outcome::result<std::string> JrpcChainClient::submitWeights(
      primitives::Epoch epoch,
      const std::vector<primitives::WeightEntry> &weights) {
    rapidjson::Document params;
    params.SetObject();
    auto &allocator = params.GetAllocator();
    params.AddMember("netuid", config_.netuid, allocator);
    params.AddMember("epoch", epoch, allocator);
    rapidjson::Value uids(rapidjson::kArrayType);
    rapidjson::Value values(rapidjson::kArrayType);
    for (auto &entry : weights) {
      uids.PushBack(static_cast<unsigned>(entry.node_id), allocator);
      values.PushBack(entry.weight, allocator);
    }
    params.AddMember("uids", uids, allocator);
    params.AddMember("weights", values, allocator);

    OUTCOME_TRY(result, call("weights_set", std::move(params)));
    if (not result.IsString()) {
      return ChainError::BAD_RESPONSE;
    }
    return std::string{result.GetString(), result.GetStringLength()};
  }

}  // namespace nineteen::chain
