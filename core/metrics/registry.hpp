/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace nineteen::metrics {

  class Counter;
  class Gauge;
  class Histogram;

  using Labels = std::map<std::string, std::string>;

  /**
   * Families are registered once by name, then metrics of a family are
   * looked up by labels. Registering a metric of an unknown family is a
   * programming error. The same name and labels always give the same metric,
   * so a component may ask for it whenever it updates it.
   */
  class Registry {
   public:
    virtual ~Registry() = default;

    virtual void registerCounterFamily(const std::string &name,
                                       const std::string &help = "",
                                       const Labels &labels = {}) = 0;

    virtual void registerGaugeFamily(const std::string &name,
                                     const std::string &help = "",
                                     const Labels &labels = {}) = 0;

    virtual void registerHistogramFamily(const std::string &name,
                                         const std::string &help = "",
                                         const Labels &labels = {}) = 0;

    /// @return metric owned by the registry
    virtual Counter *registerCounterMetric(const std::string &name,
                                           const Labels &labels = {}) = 0;

    /// @return metric owned by the registry
    virtual Gauge *registerGaugeMetric(const std::string &name,
                                       const Labels &labels = {}) = 0;

    /**
     * @param bucket_boundaries increasing upper bounds, used only when the
     * metric is created
     * @return metric owned by the registry
     */
    virtual Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const Labels &labels = {}) = 0;
  };

}  // namespace nineteen::metrics
