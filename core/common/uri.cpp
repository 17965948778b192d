/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

OUTCOME_CPP_DEFINE_CATEGORY(nineteen::common, UriError, e) {
  using E = nineteen::common::UriError;
  switch (e) {
    case E::EMPTY:
      return "Empty url";
    case E::INVALID_SCHEME:
      return "Invalid scheme";
    case E::INVALID_HOST:
      return "Invalid host";
    case E::INVALID_PORT:
      return "Invalid port";
  }
  return "Unknown url error";
}

namespace nineteen::common {

  namespace {
    template <typename Pred>
    bool consistsOf(std::string_view s, Pred pred) {
      return not s.empty()
         and std::all_of(s.begin(), s.end(), [&](unsigned char ch) {
               return pred(ch);
             });
    }

    /// Cuts the leading part of \param rest up to any of \param stops
    std::string_view take(std::string_view &rest, std::string_view stops) {
      auto end = std::min(rest.find_first_of(stops), rest.size());
      auto part = rest.substr(0, end);
      rest.remove_prefix(end);
      return part;
    }
  }  // namespace

  outcome::result<Uri> Uri::parse(std::string_view url) {
    if (url.empty()) {
      return UriError::EMPTY;
    }
    Uri uri;
    auto rest = url;

    if (auto pos = rest.find("://"); pos != std::string_view::npos) {
      auto scheme = rest.substr(0, pos);
      if (not consistsOf(scheme, [](unsigned char ch) {
            return std::isalpha(ch);
          })) {
        return UriError::INVALID_SCHEME;
      }
      uri.scheme.assign(scheme);
      rest.remove_prefix(pos + 3);
    }

    if (rest.starts_with('[')) {
      auto close = rest.find(']');
      if (close == std::string_view::npos) {
        return UriError::INVALID_HOST;
      }
      auto host = rest.substr(1, close - 1);
      if (not consistsOf(host, [](unsigned char ch) {
            return std::isxdigit(ch) or ch == ':' or ch == '.';
          })) {
        return UriError::INVALID_HOST;
      }
      uri.host.assign(host);
      rest.remove_prefix(close + 1);
    } else {
      auto host = take(rest, ":/?");
      if (not consistsOf(host, [](unsigned char ch) {
            return std::isalnum(ch) or ch == '.' or ch == '-' or ch == '_';
          })) {
        return UriError::INVALID_HOST;
      }
      uri.host.assign(host);
    }

    if (rest.starts_with(':')) {
      rest.remove_prefix(1);
      auto port = take(rest, "/?");
      uint16_t value = 0;
      auto [end, ec] =
          std::from_chars(port.data(), port.data() + port.size(), value);
      if (port.empty() or ec != std::errc{} or end != port.data() + port.size()
          or value == 0) {
        return UriError::INVALID_PORT;
      }
      uri.port = value;
    }

    uri.path.assign(take(rest, "?"));
    if (rest.starts_with('?')) {
      uri.query.assign(rest.substr(1));
    }
    return uri;
  }

  std::string Uri::target() const {
    auto result = path.empty() ? std::string{"/"} : path;
    if (not query.empty()) {
      result += '?';
      result += query;
    }
    return result;
  }

}  // namespace nineteen::common
