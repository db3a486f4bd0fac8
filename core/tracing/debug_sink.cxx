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

#include "debug_sink.hxx"

#include <utility>

namespace spanline::core::tracing
{
debug_trace::debug_trace(std::weak_ptr<debug_sink> sink, std::string family, std::string title, std::size_t max_events)
  : sink_{ std::move(sink) }
  , family_{ std::move(family) }
  , title_{ std::move(title) }
  , max_events_{ max_events }
{
}

void
debug_trace::event(std::string message)
{
  const std::scoped_lock lock(mutex_);
  if (events_.size() >= max_events_) {
    ++dropped_events_;
    return;
  }
  events_.push_back({ std::chrono::system_clock::now(), std::move(message) });
}

auto
debug_trace::events() const -> std::vector<debug_event>
{
  const std::scoped_lock lock(mutex_);
  return events_;
}

auto
debug_trace::dropped_events() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return dropped_events_;
}

auto
debug_trace::elapsed() const -> std::chrono::nanoseconds
{
  const std::scoped_lock lock(mutex_);
  return elapsed_;
}

void
debug_trace::finish()
{
  {
    const std::scoped_lock lock(mutex_);
    if (elapsed_.count() >= 0) {
      return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now() - start_time_);
    elapsed_ = elapsed.count() < 0 ? std::chrono::nanoseconds::zero() : elapsed;
  }
  if (auto sink = sink_.lock(); sink) {
    sink->on_finished(shared_from_this());
  }
}

debug_sink::debug_sink(std::size_t capacity, std::size_t max_events_per_trace)
  : capacity_{ capacity }
  , max_events_per_trace_{ max_events_per_trace }
{
}

auto
debug_sink::create(std::size_t capacity, std::size_t max_events_per_trace) -> std::shared_ptr<debug_sink>
{
  return std::shared_ptr<debug_sink>(new debug_sink(capacity, max_events_per_trace));
}

auto
debug_sink::start_trace(std::string family, std::string title) -> std::shared_ptr<debug_trace>
{
  {
    const std::scoped_lock lock(mutex_);
    ++active_;
  }
  return std::make_shared<debug_trace>(weak_from_this(), std::move(family), std::move(title), max_events_per_trace_);
}

auto
debug_sink::recent() const -> std::vector<std::shared_ptr<debug_trace>>
{
  const std::scoped_lock lock(mutex_);
  return { recent_.begin(), recent_.end() };
}

auto
debug_sink::active_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return active_;
}

void
debug_sink::on_finished(std::shared_ptr<debug_trace> trace)
{
  const std::scoped_lock lock(mutex_);
  if (active_ > 0) {
    --active_;
  }
  if (capacity_ == 0) {
    return;
  }
  recent_.push_front(std::move(trace));
  while (recent_.size() > capacity_) {
    recent_.pop_back();
  }
}
} // namespace spanline::core::tracing
