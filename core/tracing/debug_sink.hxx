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

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spanline::core::tracing
{
struct debug_event {
  std::chrono::system_clock::time_point time;
  std::string message;
};

class debug_sink;

/**
 * One request as shown on the debug page: a title, a stream of events and the elapsed time once
 * finished. Events beyond the limit are counted but not kept.
 */
class debug_trace : public std::enable_shared_from_this<debug_trace>
{
public:
  debug_trace(std::weak_ptr<debug_sink> sink, std::string family, std::string title, std::size_t max_events);

  [[nodiscard]] auto family() const -> const std::string&
  {
    return family_;
  }

  [[nodiscard]] auto title() const -> const std::string&
  {
    return title_;
  }

  [[nodiscard]] auto start_time() const -> std::chrono::system_clock::time_point
  {
    return start_time_;
  }

  void event(std::string message);

  [[nodiscard]] auto events() const -> std::vector<debug_event>;
  [[nodiscard]] auto dropped_events() const -> std::size_t;

  /**
   * Negative until finish() was called.
   */
  [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds;

  /**
   * Only the first call hands the trace over to the sink.
   */
  void finish();

private:
  const std::weak_ptr<debug_sink> sink_;
  const std::string family_;
  const std::string title_;
  const std::size_t max_events_;
  const std::chrono::system_clock::time_point start_time_{ std::chrono::system_clock::now() };

  mutable std::mutex mutex_{};
  std::vector<debug_event> events_{};
  std::size_t dropped_events_{ 0 };
  std::chrono::nanoseconds elapsed_{ -1 };
};

/**
 * In-memory store backing a "recent requests" page.
 */
class debug_sink : public std::enable_shared_from_this<debug_sink>
{
public:
  [[nodiscard]] static auto create(std::size_t capacity, std::size_t max_events_per_trace) -> std::shared_ptr<debug_sink>;

  auto start_trace(std::string family, std::string title) -> std::shared_ptr<debug_trace>;

  /**
   * @return finished traces, most recent first
   */
  [[nodiscard]] auto recent() const -> std::vector<std::shared_ptr<debug_trace>>;

  /**
   * @return number of traces started but not finished yet
   */
  [[nodiscard]] auto active_count() const -> std::size_t;

private:
  friend class debug_trace;

  debug_sink(std::size_t capacity, std::size_t max_events_per_trace);

  void on_finished(std::shared_ptr<debug_trace> trace);

  const std::size_t capacity_;
  const std::size_t max_events_per_trace_;

  mutable std::mutex mutex_{};
  std::size_t active_{ 0 };
  std::deque<std::shared_ptr<debug_trace>> recent_{};
};
} // namespace spanline::core::tracing
