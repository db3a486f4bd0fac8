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

#include "span_record.hxx"

#include "constants.hxx"

#include <iterator>
#include <utility>
#include <vector>

namespace spanline::core::tracing
{
span_record::span_record(span_identity identity,
                         std::string operation,
                         std::shared_ptr<const spanline::tracing::log_tags> log_tags,
                         std::size_t max_logs,
                         std::size_t max_children)
  : identity_{ identity }
  , log_tags_{ std::move(log_tags) }
  , max_logs_{ max_logs }
  , max_children_{ max_children }
  , operation_{ std::move(operation) }
{
}

auto
span_record::operation_name() const -> std::string
{
  const std::scoped_lock lock(mutex_);
  return operation_;
}

void
span_record::set_operation_name(std::string name)
{
  const std::scoped_lock lock(mutex_);
  operation_ = std::move(name);
}

void
span_record::set_recording_type(spanline::tracing::recording_type type)
{
  const std::scoped_lock lock(mutex_);
  recording_type_ = type;
  if (type == spanline::tracing::recording_type::verbose) {
    baggage_[verbose_tracing_baggage_key] = "1";
  } else {
    baggage_.erase(verbose_tracing_baggage_key);
  }
}

auto
span_record::recording_type() const -> spanline::tracing::recording_type
{
  const std::scoped_lock lock(mutex_);
  return recording_type_;
}

void
span_record::set_tag(const std::string& name, std::string value)
{
  const std::scoped_lock lock(mutex_);
  tags_[name] = std::move(value);
}

void
span_record::set_baggage_item(const std::string& name, std::string value)
{
  const std::scoped_lock lock(mutex_);
  baggage_[name] = std::move(value);
}

auto
span_record::baggage_item(const std::string& name) const -> std::optional<std::string>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = baggage_.find(name); it != baggage_.end()) {
    return it->second;
  }
  return {};
}

auto
span_record::baggage() const -> std::map<std::string, std::string>
{
  const std::scoped_lock lock(mutex_);
  return baggage_;
}

void
span_record::record(spanline::tracing::log_record entry)
{
  const std::scoped_lock lock(mutex_);
  if (recording_type_ != spanline::tracing::recording_type::verbose || max_logs_ == 0) {
    return;
  }
  if (logs_.size() >= max_logs_) {
    logs_.pop_front();
  }
  logs_.emplace_back(std::move(entry));
}

auto
span_record::finish(std::chrono::system_clock::time_point finish_time) -> bool
{
  const std::scoped_lock lock(mutex_);
  if (duration_.count() >= 0) {
    return false;
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(finish_time - identity_.start_time);
  // the wall clock may step backwards between start and finish
  duration_ = elapsed.count() < 0 ? std::chrono::nanoseconds::zero() : elapsed;
  return true;
}

auto
span_record::duration() const -> std::chrono::nanoseconds
{
  const std::scoped_lock lock(mutex_);
  return duration_;
}

void
span_record::add_child(std::shared_ptr<span_record> child)
{
  const std::scoped_lock lock(mutex_);
  if (children_.size() >= max_children_) {
    return;
  }
  children_.emplace_back(std::move(child));
}

void
span_record::import_remote_spans(const spanline::tracing::recording& remote)
{
  const std::scoped_lock lock(mutex_);
  for (const auto& span : remote) {
    if (remote_spans_.size() >= max_children_) {
      break;
    }
    remote_spans_.push_back(span);
  }
}

auto
span_record::get_recording() const -> spanline::tracing::recording
{
  spanline::tracing::recorded_span self{};
  self.trace_id = identity_.trace_id;
  self.span_id = identity_.span_id;
  self.parent_span_id = identity_.parent_span_id;
  self.task_id = identity_.task_id;
  self.start_time = identity_.start_time;

  std::vector<std::shared_ptr<span_record>> children{};
  spanline::tracing::recording remote_spans{};
  {
    const std::scoped_lock lock(mutex_);
    self.operation = operation_;
    self.duration = duration_;
    self.verbose = recording_type_ == spanline::tracing::recording_type::verbose;
    if (log_tags_) {
      for (const auto& tag : log_tags_->current_tags()) {
        self.tags[tag.key] = tag.value;
      }
    }
    for (const auto& [key, value] : tags_) {
      self.tags[key] = value;
    }
    if (self.verbose) {
      self.tags[attributes::verbose] = "1";
    }
    self.baggage = baggage_;
    self.logs.assign(logs_.begin(), logs_.end());
    children = children_;
    remote_spans = remote_spans_;
  }

  // walked without our lock held
  spanline::tracing::recording result;
  result.emplace_back(std::move(self));
  for (const auto& child : children) {
    auto child_recording = child->get_recording();
    result.insert(result.end(), std::make_move_iterator(child_recording.begin()), std::make_move_iterator(child_recording.end()));
  }
  result.insert(result.end(), std::make_move_iterator(remote_spans.begin()), std::make_move_iterator(remote_spans.end()));
  return result;
}
} // namespace spanline::core::tracing
