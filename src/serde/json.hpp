/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "serde/json_fwd.hpp"

#define JSON_ASSERT(c) \
  if (not(c)) throw std::runtime_error{"json"}

namespace blskey::json {
  struct Json {
    const rapidjson::Value &v;
  };

  using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

  // -- decode --

  void decode(auto &v, std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    JSON_ASSERT(not document.HasParseError());
    decode(v, Json{document});
  }

  inline std::string_view decodeStr(Json json) {
    JSON_ASSERT(json.v.IsString());
    return {json.v.GetString(), json.v.GetStringLength()};
  }

  inline void decode(std::string &v, Json json) {
    v = decodeStr(json);
  }

  inline void decode(bool &v, Json json) {
    JSON_ASSERT(json.v.IsBool());
    v = json.v.GetBool();
  }

  template <typename T>
  void decode(std::optional<T> &v, Json json) {
    v.reset();
    if (not json.v.IsNull()) {
      T value;
      decode(value, json);
      v.emplace(std::move(value));
    }
  }

  template <size_t I, typename T>
  void decodeFields(const T &fields, const auto &field_names, Json json) {
    JSON_ASSERT(json.v.IsObject());
    auto &field = std::get<I>(fields);
    auto &field_name = field_names.at(I);
    auto it = json.v.FindMember(field_name.c_str());
    static const rapidjson::Value json_null;
    decode(field, Json{it != json.v.MemberEnd() ? it->value : json_null});
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      decodeFields<I + 1>(fields, field_names, json);
    }
  }

  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json) {
    auto fields = v.fields();
    auto &field_names = v.fieldNames();
    decodeFields<0>(fields, field_names, json);
  }

  // -- encode --

  inline void encode(const std::string &v, Writer &writer) {
    writer.String(v.data(), v.size());
  }

  inline void encode(bool v, Writer &writer) {
    writer.Bool(v);
  }

  template <typename T>
  void encode(const std::optional<T> &v, Writer &writer) {
    if (v.has_value()) {
      encode(*v, writer);
    } else {
      writer.Null();
    }
  }

  template <typename T>
  constexpr bool isOptional = false;
  template <typename T>
  constexpr bool isOptional<std::optional<T>> = true;

  /// Absent optional fields are omitted
  template <size_t I, typename T>
  void encodeFields(const T &fields, const auto &field_names, Writer &writer) {
    auto &field = std::get<I>(fields);
    auto &field_name = field_names.at(I);
    using F = std::remove_cvref_t<decltype(field)>;
    bool skip = false;
    if constexpr (isOptional<F>) {
      skip = not field.has_value();
    }
    if (not skip) {
      writer.Key(field_name.data(), field_name.size());
      encode(field, writer);
    }
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      encodeFields<I + 1>(fields, field_names, writer);
    }
  }

  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(const T &v, Writer &writer) {
    writer.StartObject();
    encodeFields<0>(v.fields(), v.fieldNames(), writer);
    writer.EndObject();
  }

  std::string encode(const auto &v) {
    rapidjson::StringBuffer buffer;
    Writer writer{buffer};
    encode(v, writer);
    return {buffer.GetString(), buffer.GetSize()};
  }
}  // namespace blskey::json
