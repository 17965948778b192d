/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <boost/assert.hpp>

namespace nineteen::metrics {

  std::shared_ptr<prometheus::Registry> collectableRegistry() {
    static auto registry = std::make_shared<prometheus::Registry>();
    return registry;
  }

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  PrometheusRegistry::PrometheusRegistry()
      : registry_{collectableRegistry()} {}

  void PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    auto &family = prometheus::BuildCounter()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    std::lock_guard lock{mutex_};
    counters_.emplace(name, &family);
  }

  void PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    auto &family = prometheus::BuildGauge()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    std::lock_guard lock{mutex_};
    gauges_.emplace(name, &family);
  }

  void PrometheusRegistry::registerHistogramFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    auto &family = prometheus::BuildHistogram()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    std::lock_guard lock{mutex_};
    histograms_.emplace(name, &family);
  }

  Counter *PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = counter_metrics_[{name, labels}];
    if (not metric) {
      auto it = counters_.find(name);
      BOOST_ASSERT(it != counters_.end());
      metric = std::make_unique<PrometheusCounter>(it->second->Add(labels));
    }
    return metric.get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = gauge_metrics_[{name, labels}];
    if (not metric) {
      auto it = gauges_.find(name);
      BOOST_ASSERT(it != gauges_.end());
      metric = std::make_unique<PrometheusGauge>(it->second->Add(labels));
    }
    return metric.get();
  }

  Histogram *PrometheusRegistry::registerHistogramMetric(
      const std::string &name,
      const std::vector<double> &bucket_boundaries,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    auto &metric = histogram_metrics_[{name, labels}];
    if (not metric) {
      auto it = histograms_.find(name);
      BOOST_ASSERT(it != histograms_.end());
      metric = std::make_unique<PrometheusHistogram>(
          it->second->Add(labels, bucket_boundaries));
    }
    return metric.get();
  }

}  // namespace nineteen::metrics
