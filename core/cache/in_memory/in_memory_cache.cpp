/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cache/in_memory/in_memory_cache.hpp"

#include <algorithm>
#include <charconv>

#include <boost/assert.hpp>

#include "cache/cache_error.hpp"

namespace nineteen::cache {

  InMemoryCache::InMemoryCache(std::shared_ptr<clock::SteadyClock> clock)
      : clock_{std::move(clock)} {
    BOOST_ASSERT(clock_ != nullptr);
  }

  InMemoryCache::Entry *InMemoryCache::findLive(std::string_view key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return nullptr;
    }
    if (it->second.expires_at and *it->second.expires_at <= clock_->now()) {
      values_.erase(it);
      return nullptr;
    }
    return &it->second;
  }

  std::optional<clock::SteadyClock::TimePoint> InMemoryCache::expiry(
      Ttl ttl) const {
    if (not ttl) {
      return std::nullopt;
    }
    return clock_->now() + *ttl;
  }

  outcome::result<std::optional<std::string>> InMemoryCache::get(
      std::string_view key) {
    std::lock_guard lock{mutex_};
    if (auto entry = findLive(key)) {
      return std::make_optional(entry->value);
    }
    return std::optional<std::string>{};
  }

  outcome::result<void> InMemoryCache::set(std::string_view key,
                                           std::string_view value,
                                           Ttl ttl) {
    std::lock_guard lock{mutex_};
    values_.insert_or_assign(std::string{key},
                             Entry{std::string{value}, expiry(ttl)});
    return outcome::success();
  }

  outcome::result<bool> InMemoryCache::setIfAbsent(std::string_view key,
                                                   std::string_view value,
                                                   Ttl ttl) {
    std::lock_guard lock{mutex_};
    if (findLive(key) != nullptr) {
      return false;
    }
    values_.emplace(std::string{key}, Entry{std::string{value}, expiry(ttl)});
    return true;
  }

  outcome::result<bool> InMemoryCache::compareAndDelete(
      std::string_view key, std::string_view expected) {
    std::lock_guard lock{mutex_};
    auto entry = findLive(key);
    if (entry == nullptr or entry->value != expected) {
      return false;
    }
    values_.erase(values_.find(key));
    return true;
  }

  outcome::result<bool> InMemoryCache::extendIfEquals(
      std::string_view key,
      std::string_view expected,
      std::chrono::milliseconds ttl) {
    std::lock_guard lock{mutex_};
    auto entry = findLive(key);
    if (entry == nullptr or entry->value != expected) {
      return false;
    }
    entry->expires_at = clock_->now() + ttl;
    return true;
  }

  outcome::result<void> InMemoryCache::remove(std::string_view key) {
    std::lock_guard lock{mutex_};
    if (auto it = values_.find(key); it != values_.end()) {
      values_.erase(it);
    }
    if (auto it = lists_.find(key); it != lists_.end()) {
      lists_.erase(it);
    }
    return outcome::success();
  }

  outcome::result<int64_t> InMemoryCache::incrementBy(std::string_view key,
                                                      int64_t delta,
                                                      Ttl ttl) {
    std::lock_guard lock{mutex_};
    auto entry = findLive(key);
    if (entry == nullptr) {
      values_.insert_or_assign(std::string{key},
                               Entry{std::to_string(delta), expiry(ttl)});
      return delta;
    }
    int64_t current = 0;
    auto &str = entry->value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), current);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return CacheError::SERVER_ERROR;
    }
    current += delta;
    entry->value = std::to_string(current);
    return current;
  }

  outcome::result<size_t> InMemoryCache::pushBackBounded(
      std::string_view list, std::string_view value, size_t capacity) {
    size_t size = 0;
    {
      std::lock_guard lock{mutex_};
      auto &items = lists_[std::string{list}];
      if (items.size() >= capacity) {
        return CacheError::LIST_FULL;
      }
      items.emplace_back(value);
      size = items.size();
    }
    list_cv_.notify_one();
    return size;
  }

  outcome::result<size_t> InMemoryCache::pushBack(std::string_view list,
                                                  std::string_view value) {
    size_t size = 0;
    {
      std::lock_guard lock{mutex_};
      auto &items = lists_[std::string{list}];
      items.emplace_back(value);
      size = items.size();
    }
    list_cv_.notify_one();
    return size;
  }

  outcome::result<std::optional<std::string>> InMemoryCache::popFront(
      std::string_view list, std::chrono::milliseconds timeout) {
    std::unique_lock lock{mutex_};
    auto available = [&] {
      auto it = lists_.find(list);
      return it != lists_.end() and not it->second.empty();
    };
    if (not list_cv_.wait_for(lock, timeout, available)) {
      return std::optional<std::string>{};
    }
    auto &items = lists_.find(list)->second;
    auto value = std::move(items.front());
    items.pop_front();
    return std::make_optional(std::move(value));
  }

  outcome::result<size_t> InMemoryCache::length(std::string_view list) {
    std::lock_guard lock{mutex_};
    auto it = lists_.find(list);
    return it == lists_.end() ? size_t{0} : it->second.size();
  }

  outcome::result<std::vector<std::string>> InMemoryCache::listRange(
      std::string_view list) {
    std::lock_guard lock{mutex_};
    auto it = lists_.find(list);
    if (it == lists_.end()) {
      return std::vector<std::string>{};
    }
    return std::vector<std::string>{it->second.begin(), it->second.end()};
  }

  outcome::result<size_t> InMemoryCache::removeFromList(
      std::string_view list, std::string_view value) {
    std::lock_guard lock{mutex_};
    auto it = lists_.find(list);
    if (it == lists_.end()) {
      return size_t{0};
    }
    auto &items = it->second;
    auto size_before = items.size();
    items.erase(std::remove(items.begin(), items.end(), value), items.end());
    return size_before - items.size();
  }

  outcome::result<void> InMemoryCache::publish(std::string_view channel,
                                               std::string_view message) {
    std::vector<MessageHandler> handlers;
    {
      std::lock_guard lock{mutex_};
      if (auto it = subscribers_.find(channel); it != subscribers_.end()) {
        handlers = it->second;
      }
    }
    std::string msg{message};
    for (auto &handler : handlers) {
      handler(msg);
    }
    return outcome::success();
  }

  outcome::result<void> InMemoryCache::subscribe(std::string_view channel,
                                                 MessageHandler handler) {
    std::lock_guard lock{mutex_};
    subscribers_[std::string{channel}].emplace_back(std::move(handler));
    return outcome::success();
  }

  void InMemoryCache::clear() {
    std::lock_guard lock{mutex_};
    values_.clear();
    lists_.clear();
  }

}  // namespace nineteen::cache
