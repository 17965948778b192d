/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gateway/impl/gateway_http_handler.hpp"

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "common/json.hpp"
#include "gateway/gateway_error.hpp"

namespace nineteen::gateway {

  namespace bhttp = boost::beast::http;

  namespace {
    constexpr std::string_view kJson = "application/json";

    http::Session::Response errorResponse(const http::Session::Request &request,
                                          bhttp::status status,
                                          std::string_view error) {
      rapidjson::Document body(rapidjson::kObjectType);
      body.AddMember(
          "error", common::jsonString(error, body.GetAllocator()),
          body.GetAllocator());
      return http::makeResponse(
          request, status, common::json2string(body), kJson);
    }

    http::Session::Response errorResponse(const http::Session::Request &request,
                                          const std::error_code &ec) {
      if (ec == GatewayError::REJECTED) {
        return errorResponse(request, bhttp::status::bad_request, "rejected");
      }
      if (ec == GatewayError::UNAUTHORIZED) {
        return errorResponse(request, bhttp::status::unauthorized, "rejected");
      }
      if (ec == GatewayError::RATE_LIMITED) {
        return errorResponse(
            request, bhttp::status::too_many_requests, "overloaded");
      }
      if (ec == GatewayError::TIMEOUT) {
        return errorResponse(request, bhttp::status::gateway_timeout, "timeout");
      }
      return errorResponse(
          request, bhttp::status::service_unavailable, "overloaded");
    }

    std::optional<SubmitRequest> parseSubmit(
        const http::Session::Request &request, std::string_view task_type) {
      rapidjson::Document body;
      body.Parse(request.body().data(), request.body().size());
      if (body.HasParseError() or not body.IsObject()) {
        return std::nullopt;
      }
      auto payload = common::getString(body, "payload");
      if (not payload) {
        return std::nullopt;
      }
      SubmitRequest submit{
          .task_type = std::string{task_type},
          .payload = std::move(*payload),
          .wait = common::getBool(body, "wait").value_or(true),
      };
      if (body.HasMember("timeout_ms")) {
        auto timeout = common::getInt64(body, "timeout_ms");
        if (not timeout) {
          return std::nullopt;
        }
        submit.timeout = std::chrono::milliseconds{*timeout};
      }
      constexpr auto header = GatewayHttpHandler::kApiKeyHeader;
      if (auto it = request.find(
              boost::beast::string_view{header.data(), header.size()});
          it != request.end()) {
        submit.api_key.assign(it->value().data(), it->value().size());
      }
      return submit;
    }

    http::Session::Response resultResponse(
        const http::Session::Request &request, const SubmitResponse &response) {
      rapidjson::Document body(rapidjson::kObjectType);
      auto &a = body.GetAllocator();
      body.AddMember("task_id", common::jsonString(response.task_id, a), a);
      if (not response.result) {
        body.AddMember("status", "accepted", a);
        return http::makeResponse(
            request, bhttp::status::accepted, common::json2string(body), kJson);
      }

      auto &result = *response.result;
      body.AddMember(
          "status", common::jsonString(primitives::toString(result.status), a),
          a);
      if (result.status != primitives::TaskStatus::Completed) {
        return http::makeResponse(request,
                                  bhttp::status::bad_gateway,
                                  common::json2string(body),
                                  kJson);
      }
      if (result.participant) {
        body.AddMember(
            "participant", common::jsonString(*result.participant, a), a);
      }
      body.AddMember(
          "latency_ms", static_cast<int64_t>(result.latency.count()), a);
      body.AddMember("quality", result.quality, a);
      body.AddMember("response", common::jsonString(result.response, a), a);
      return http::makeResponse(
          request, bhttp::status::ok, common::json2string(body), kJson);
    }
  }  // namespace

  GatewayHttpHandler::GatewayHttpHandler(std::shared_ptr<IntakeGateway> gateway,
                                         size_t threads)
      : gateway_{std::move(gateway)},
        thread_pool_{"gateway", threads},
        logger_{log::createLogger("GatewayHttp", "gateway")} {
    BOOST_ASSERT(gateway_ != nullptr);
  }

  void GatewayHttpHandler::onSessionRequest(
      http::Session::Request request, std::shared_ptr<http::Session> session) {
    // Waiting for a result blocks, so it never happens on the network thread
    boost::asio::post(
        *thread_pool_.io_context(),
        [this, request{std::move(request)}, session{std::move(session)}] {
          session->respond(handle(request));
        });
  }

  http::Session::Response GatewayHttpHandler::handle(
      const http::Session::Request &request) {
    std::string_view target{request.target().data(), request.target().size()};

    if (target == kHealthPath) {
      if (request.method() != bhttp::verb::get) {
        return errorResponse(
            request, bhttp::status::method_not_allowed, "method not allowed");
      }
      return http::makeResponse(
          request, bhttp::status::ok, R"({"status":"ok"})", kJson);
    }

    if (not target.starts_with(kTasksPath)) {
      return errorResponse(request, bhttp::status::not_found, "not found");
    }
    if (request.method() != bhttp::verb::post) {
      return errorResponse(
          request, bhttp::status::method_not_allowed, "method not allowed");
    }
    auto task_type = target.substr(kTasksPath.size());
    if (task_type.empty() or task_type.find('/') != std::string_view::npos) {
      return errorResponse(request, bhttp::status::not_found, "not found");
    }

    auto submit = parseSubmit(request, task_type);
    if (not submit) {
      return errorResponse(request, bhttp::status::bad_request, "rejected");
    }

    auto response = gateway_->submit(*submit);
    if (response.has_error()) {
      SL_DEBUG(logger_,
               "Request for {} refused: {}",
               task_type,
               response.error().message());
      return errorResponse(request, response.error());
    }
    return resultResponse(request, response.value());
  }

}  // namespace nineteen::gateway
