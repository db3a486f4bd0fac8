/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The Spanline Authors.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <spanline/tracing/recording.hxx>

#include <fmt/core.h>
#include <tao/json/forward.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace spanline::core::tracing
{
inline auto
id_to_json(std::uint64_t id) -> std::string
{
  return fmt::format("{:x}", id);
}

inline auto
id_from_json(std::string_view input) -> std::uint64_t
{
  std::uint64_t id{ 0 };
  const auto* end = input.data() + input.size();
  if (auto [ptr, ec] = std::from_chars(input.data(), end, id, 16); input.empty() || ec != std::errc{} || ptr != end) {
    throw std::invalid_argument(fmt::format(R"(invalid span identifier "{}")", input));
  }
  return id;
}
} // namespace spanline::core::tracing

namespace tao::json
{
template<>
struct traits<spanline::tracing::log_record> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const spanline::tracing::log_record& entry)
  {
    tao::json::basic_value<Traits> fields = tao::json::empty_array;
    for (const auto& field : entry.fields) {
      fields.emplace_back(tao::json::basic_value<Traits>{ { "key", field.key }, { "value", field.value } });
    }
    v = {
      { "time_ns", std::chrono::duration_cast<std::chrono::nanoseconds>(entry.time.time_since_epoch()).count() },
      { "fields", std::move(fields) },
    };
  }

  template<template<typename...> class Traits>
  static spanline::tracing::log_record as(const tao::json::basic_value<Traits>& v)
  {
    spanline::tracing::log_record result{};
    result.time = std::chrono::system_clock::time_point{ std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::nanoseconds{ v.at("time_ns").template as<std::int64_t>() }) };
    for (const auto& field : v.at("fields").get_array()) {
      result.fields.push_back({ field.at("key").get_string(), field.at("value").get_string() });
    }
    return result;
  }
};

template<>
struct traits<spanline::tracing::recorded_span> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const spanline::tracing::recorded_span& span)
  {
    tao::json::basic_value<Traits> tags = tao::json::empty_object;
    for (const auto& [key, value] : span.tags) {
      tags[key] = value;
    }
    tao::json::basic_value<Traits> baggage = tao::json::empty_object;
    for (const auto& [key, value] : span.baggage) {
      baggage[key] = value;
    }
    tao::json::basic_value<Traits> logs = tao::json::empty_array;
    for (const auto& entry : span.logs) {
      logs.emplace_back(entry);
    }
    v = {
      { "trace_id", spanline::core::tracing::id_to_json(span.trace_id) },
      { "span_id", spanline::core::tracing::id_to_json(span.span_id) },
      { "parent_span_id", spanline::core::tracing::id_to_json(span.parent_span_id) },
      { "operation", span.operation },
      { "task_id", span.task_id },
      { "start_time_ns", std::chrono::duration_cast<std::chrono::nanoseconds>(span.start_time.time_since_epoch()).count() },
      { "duration_ns", span.duration.count() },
      { "verbose", span.verbose },
      { "tags", std::move(tags) },
      { "baggage", std::move(baggage) },
      { "logs", std::move(logs) },
    };
  }

  template<template<typename...> class Traits>
  static spanline::tracing::recorded_span as(const tao::json::basic_value<Traits>& v)
  {
    spanline::tracing::recorded_span result{};
    result.trace_id = spanline::core::tracing::id_from_json(v.at("trace_id").get_string());
    result.span_id = spanline::core::tracing::id_from_json(v.at("span_id").get_string());
    result.parent_span_id = spanline::core::tracing::id_from_json(v.at("parent_span_id").get_string());
    result.operation = v.at("operation").get_string();
    result.task_id = v.at("task_id").template as<std::uint64_t>();
    result.start_time = std::chrono::system_clock::time_point{ std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::nanoseconds{ v.at("start_time_ns").template as<std::int64_t>() }) };
    result.duration = std::chrono::nanoseconds{ v.at("duration_ns").template as<std::int64_t>() };
    result.verbose = v.at("verbose").get_boolean();
    if (const auto* tags = v.find("tags"); tags != nullptr) {
      for (const auto& [key, value] : tags->get_object()) {
        result.tags[key] = value.get_string();
      }
    }
    if (const auto* baggage = v.find("baggage"); baggage != nullptr) {
      for (const auto& [key, value] : baggage->get_object()) {
        result.baggage[key] = value.get_string();
      }
    }
    if (const auto* logs = v.find("logs"); logs != nullptr) {
      for (const auto& entry : logs->get_array()) {
        result.logs.emplace_back(entry.template as<spanline::tracing::log_record>());
      }
    }
    return result;
  }
};
} // namespace tao::json
