/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/di/extension/scopes/shared.hpp>

namespace nineteen::injector {

  /**
   * Scope of a component built by a factory from the node configuration.
   * The factory runs on the first request and every later request of the
   * same injector gets the same instance. Plain `di::bind<T>.to(factory)`
   * would call the factory on each request and can't take `.in(scope)`.
   */
  struct SharedFactoryScope {
    template <typename Factory, typename Provider>
    struct CallFactory {
      auto get() const {
        return factory(provider.super());
      }
      Factory &factory;
      const Provider &provider;
    };

    template <typename T, typename Factory>
    struct scope {
      explicit scope(const Factory &factory) : factory_{factory} {}

      template <typename, typename>
      using is_referable = std::true_type;

      template <typename, typename, typename Provider>
      static boost::di::wrappers::shared<boost::di::extension::detail::shared,
                                         T>
      try_create(const Provider &provider);

      template <typename, typename, typename Provider>
      auto create(const Provider &provider) & {
        return instance_.template create<void, void>(
            CallFactory<Factory, Provider>{factory_, provider});
      }

      template <typename, typename, typename Provider>
      auto create(const Provider &provider) && {
        return std::move(instance_).template create<void, void>(
            CallFactory<Factory, Provider>{factory_, provider});
      }

      boost::di::extension::detail::shared::scope<void, T> instance_;
      Factory factory_;
    };
  };

  /// Binds \tparam T to the result of \param factory, one per injector
  template <typename T, typename Factory>
  auto bindShared(const Factory &factory) {
    return boost::di::core::dependency<SharedFactoryScope, T, Factory>{
        factory};
  }

}  // namespace nineteen::injector
