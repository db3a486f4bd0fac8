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

#include <spanline/tracing/log_tags.hxx>
#include <spanline/tracing/recording.hxx>
#include <spanline/tracing/recording_type.hxx>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spanline::core::tracing
{
/**
 * Identity of a span record, fixed at creation.
 */
struct span_identity {
  std::uint64_t trace_id{ 0 };
  std::uint64_t span_id{ 0 };
  std::uint64_t parent_span_id{ 0 };
  std::uint64_t task_id{ 0 };
  std::chrono::system_clock::time_point start_time{};
};

/**
 * The state backing a real span. Everything mutable lives behind a single mutex, and no method
 * calls out of this class while holding it.
 */
class span_record
{
public:
  span_record(span_identity identity,
              std::string operation,
              std::shared_ptr<const spanline::tracing::log_tags> log_tags,
              std::size_t max_logs,
              std::size_t max_children);

  [[nodiscard]] auto trace_id() const -> std::uint64_t
  {
    return identity_.trace_id;
  }

  [[nodiscard]] auto span_id() const -> std::uint64_t
  {
    return identity_.span_id;
  }

  [[nodiscard]] auto parent_span_id() const -> std::uint64_t
  {
    return identity_.parent_span_id;
  }

  [[nodiscard]] auto start_time() const -> std::chrono::system_clock::time_point
  {
    return identity_.start_time;
  }

  [[nodiscard]] auto log_tags() const -> const std::shared_ptr<const spanline::tracing::log_tags>&
  {
    return log_tags_;
  }

  [[nodiscard]] auto operation_name() const -> std::string;
  void set_operation_name(std::string name);

  /**
   * Switching to verbose sets the verbose baggage item, switching off removes it.
   */
  void set_recording_type(spanline::tracing::recording_type type);
  [[nodiscard]] auto recording_type() const -> spanline::tracing::recording_type;

  void set_tag(const std::string& name, std::string value);

  void set_baggage_item(const std::string& name, std::string value);
  [[nodiscard]] auto baggage_item(const std::string& name) const -> std::optional<std::string>;
  [[nodiscard]] auto baggage() const -> std::map<std::string, std::string>;

  /**
   * Stores the entry if the record is verbose, dropping the oldest entry when full.
   */
  void record(spanline::tracing::log_record entry);

  /**
   * Sets the duration if the record is not finished yet.
   *
   * @return true on the first call
   */
  auto finish(std::chrono::system_clock::time_point finish_time) -> bool;
  [[nodiscard]] auto duration() const -> std::chrono::nanoseconds;

  /**
   * Links a finished direct child, unless the child cap is reached. The link stays live, so
   * descendants the child collects later still show up in this record's recording.
   */
  void add_child(std::shared_ptr<span_record> child);

  /**
   * Keeps at most as many imported spans as the child cap allows.
   */
  void import_remote_spans(const spanline::tracing::recording& remote);

  [[nodiscard]] auto get_recording() const -> spanline::tracing::recording;

private:
  const span_identity identity_;
  const std::shared_ptr<const spanline::tracing::log_tags> log_tags_;
  const std::size_t max_logs_;
  const std::size_t max_children_;

  mutable std::mutex mutex_{};
  std::string operation_;
  std::chrono::nanoseconds duration_{ -1 };
  spanline::tracing::recording_type recording_type_{ spanline::tracing::recording_type::off };
  std::map<std::string, std::string> tags_{};
  std::map<std::string, std::string> baggage_{};
  std::deque<spanline::tracing::log_record> logs_{};
  std::vector<std::shared_ptr<span_record>> children_{};
  spanline::tracing::recording remote_spans_{};
};
} // namespace spanline::core::tracing
