/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace nineteen::common {

  inline std::string json2string(const rapidjson::Value &value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return {buffer.GetString(), buffer.GetSize()};
  }

  /// Copies \param str into the document's allocator
  inline rapidjson::Value jsonString(std::string_view str,
                                     rapidjson::Document::AllocatorType &a) {
    rapidjson::Value value;
    value.SetString(
        str.data(), static_cast<rapidjson::SizeType>(str.size()), a);
    return value;
  }

  inline std::optional<std::string> getString(const rapidjson::Value &object,
                                              const char *name) {
    if (not object.IsObject()) {
      return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() or not it->value.IsString()) {
      return std::nullopt;
    }
    return std::string{it->value.GetString(), it->value.GetStringLength()};
  }

  inline std::optional<int64_t> getInt64(const rapidjson::Value &object,
                                         const char *name) {
    if (not object.IsObject()) {
      return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() or not it->value.IsInt64()) {
      return std::nullopt;
    }
    return it->value.GetInt64();
  }

  inline std::optional<double> getDouble(const rapidjson::Value &object,
                                         const char *name) {
    if (not object.IsObject()) {
      return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() or not it->value.IsNumber()) {
      return std::nullopt;
    }
    return it->value.GetDouble();
  }

  inline std::optional<bool> getBool(const rapidjson::Value &object,
                                     const char *name) {
    if (not object.IsObject()) {
      return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() or not it->value.IsBool()) {
      return std::nullopt;
    }
    return it->value.GetBool();
  }

}  // namespace nineteen::common
