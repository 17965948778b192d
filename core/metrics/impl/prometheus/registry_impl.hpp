/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metrics/metrics.hpp"

namespace nineteen::metrics {

  /// Process wide collection every PrometheusRegistry writes to
  std::shared_ptr<prometheus::Registry> collectableRegistry();

  class PrometheusCounter : public Counter {
   public:
    explicit PrometheusCounter(prometheus::Counter &m) : m_{m} {}

    void inc() override {
      m_.Increment();
    }

    void inc(double val) override {
      m_.Increment(val);
    }

   private:
    prometheus::Counter &m_;
  };

  class PrometheusGauge : public Gauge {
   public:
    explicit PrometheusGauge(prometheus::Gauge &m) : m_{m} {}

    void set(double val) override {
      m_.Set(val);
    }

   private:
    prometheus::Gauge &m_;
  };

  class PrometheusHistogram : public Histogram {
   public:
    explicit PrometheusHistogram(prometheus::Histogram &m) : m_{m} {}

    void observe(const double value) override {
      m_.Observe(value);
    }

   private:
    prometheus::Histogram &m_;
  };

  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry();

    void registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerHistogramFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const std::map<std::string, std::string> &labels) override;

   private:
    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex mutex_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Counter> *>
        counters_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Gauge> *>
        gauges_;
    std::unordered_map<std::string,
                       prometheus::Family<prometheus::Histogram> *>
        histograms_;
    // Same name and labels give the same metric
    using MetricKey =
        std::pair<std::string, std::map<std::string, std::string>>;
    std::map<MetricKey, std::unique_ptr<Counter>> counter_metrics_;
    std::map<MetricKey, std::unique_ptr<Gauge>> gauge_metrics_;
    std::map<MetricKey, std::unique_ptr<Histogram>> histogram_metrics_;
  };

}  // namespace nineteen::metrics
