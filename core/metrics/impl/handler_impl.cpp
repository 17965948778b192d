/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/handler_impl.hpp"

#include <prometheus/text_serializer.h>

#include "metrics/impl/prometheus/registry_impl.hpp"

namespace nineteen::metrics {

  namespace {
    const std::string kScrapesName = "nineteen_metrics_scrapes_total";
    const std::string kBytesName = "nineteen_metrics_transferred_bytes_total";
  }  // namespace

  HandlerImpl::HandlerImpl()
      : logger_{log::createLogger("MetricsHandler", "metrics")},
        registry_{createRegistry()} {
    registry_->registerCounterFamily(kScrapesName,
                                     "Number of times metrics were scraped");
    num_scrapes_ = registry_->registerCounterMetric(kScrapesName);
    registry_->registerCounterFamily(kBytesName,
                                     "Transferred bytes to metrics services");
    bytes_transferred_ = registry_->registerCounterMetric(kBytesName);
  }

  std::string HandlerImpl::collect() const {
    const prometheus::TextSerializer serializer;
    return serializer.Serialize(collectableRegistry()->Collect());
  }

  void HandlerImpl::onSessionRequest(http::Session::Request request,
                                     std::shared_ptr<http::Session> session) {
    namespace bhttp = boost::beast::http;
    if (request.method() != bhttp::verb::get
        or (request.target() != "/metrics" and request.target() != "/")) {
      session->respond(http::makeResponse(
          request, bhttp::status::not_found, "not found\n", "text/plain"));
      return;
    }

    auto body = collect();
    num_scrapes_->inc();
    bytes_transferred_->inc(static_cast<double>(body.size()));
    SL_TRACE(logger_, "Serving {} bytes of metrics", body.size());
    session->respond(http::makeResponse(request,
                                        bhttp::status::ok,
                                        std::move(body),
                                        "text/plain; version=0.0.4"));
  }

}  // namespace nineteen::metrics
