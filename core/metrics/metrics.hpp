/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include "metrics/registry.hpp"

namespace nineteen::metrics {
  using RegistryPtr = std::unique_ptr<Registry>;

  /// Registry writing to the process wide collection scraped by the
  /// OpenMetrics listener
  RegistryPtr createRegistry();

  /// Monotonic total, e.g. tasks completed
  class Counter {
   public:
    virtual ~Counter() = default;

    virtual void inc() = 0;

    /// Negative \param val is ignored
    virtual void inc(double val) = 0;
  };

  /// Current value, e.g. queue length or remaining synthetic budget
  class Gauge {
   public:
    virtual ~Gauge() = default;

    virtual void set(double val) = 0;
  };

  /// Distribution of observed values, e.g. worker latency in seconds
  class Histogram {
   public:
    virtual ~Histogram() = default;

    virtual void observe(double value) = 0;
  };

  /// \param count bucket bounds starting at \param start, each \param factor
  /// times the previous one
  inline std::vector<double> exponentialBuckets(double start,
                                                double factor,
                                                size_t count) {
    std::vector<double> buckets;
    buckets.reserve(count);
    for (auto bound = start; buckets.size() < count; bound *= factor) {
      buckets.emplace_back(bound);
    }
    return buckets;
  }
}  // namespace nineteen::metrics
