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

#include <spanline/tracing/span.hxx>
#include <spanline/tracing/tracer.hxx>

#include "constants.hxx"
#include "debug_sink.hxx"
#include "shadow_tracer.hxx"
#include "span_record.hxx"

#include <fmt/core.h>

#include <chrono>
#include <utility>

namespace spanline::tracing
{
span::span(std::weak_ptr<tracing::tracer> tracer)
  : tracer_{ std::move(tracer) }
{
}

span::span(std::weak_ptr<tracing::tracer> tracer,
           std::shared_ptr<core::tracing::span_record> record,
           std::weak_ptr<core::tracing::span_record> collector,
           std::unique_ptr<core::tracing::shadow_span> shadow,
           std::shared_ptr<core::tracing::debug_trace> debug)
  : tracer_{ std::move(tracer) }
  , record_{ std::move(record) }
  , collector_{ std::move(collector) }
  , shadow_{ std::move(shadow) }
  , debug_{ std::move(debug) }
{
}

span::~span() = default;

auto
span::tracer() const -> std::shared_ptr<tracing::tracer>
{
  return tracer_.lock();
}

auto
span::trace_id() const -> std::uint64_t
{
  if (is_noop()) {
    return 0;
  }
  return record_->trace_id();
}

auto
span::span_id() const -> std::uint64_t
{
  if (is_noop()) {
    return 0;
  }
  return record_->span_id();
}

auto
span::operation_name() const -> std::string
{
  if (is_noop()) {
    return {};
  }
  return record_->operation_name();
}

void
span::set_operation_name(const std::string& name)
{
  if (is_noop()) {
    return;
  }
  record_->set_operation_name(name);
}

void
span::set_tag(const std::string& name, const std::string& value)
{
  if (is_noop()) {
    return;
  }
  record_->set_tag(name, value);
  if (shadow_) {
    shadow_->span->set_tag(name, value);
  }
  if (debug_) {
    debug_->event(fmt::format("{}:{}", name, value));
  }
}

void
span::set_tag(const std::string& name, std::uint64_t value)
{
  if (is_noop()) {
    return;
  }
  record_->set_tag(name, std::to_string(value));
  if (shadow_) {
    shadow_->span->set_tag(name, value);
  }
  if (debug_) {
    debug_->event(fmt::format("{}:{}", name, value));
  }
}

void
span::set_baggage_item(const std::string& name, const std::string& value)
{
  if (is_noop()) {
    return;
  }
  record_->set_baggage_item(name, value);
  if (shadow_) {
    shadow_->span->set_baggage_item(name, value);
  }
  if (debug_) {
    debug_->event(fmt::format("baggage {}:{}", name, value));
  }
}

auto
span::baggage_item(const std::string& name) const -> std::optional<std::string>
{
  if (is_noop()) {
    return {};
  }
  return record_->baggage_item(name);
}

void
span::set_verbose(bool verbose)
{
  if (is_noop()) {
    return;
  }
  record_->set_recording_type(verbose ? tracing::recording_type::verbose : tracing::recording_type::off);
}

auto
span::is_recording() const -> bool
{
  return recording_type() != tracing::recording_type::off;
}

auto
span::recording_type() const -> tracing::recording_type
{
  if (is_noop()) {
    return tracing::recording_type::off;
  }
  return record_->recording_type();
}

void
span::record(const std::string& message)
{
  if (is_noop()) {
    return;
  }
  log_fields({ { core::tracing::attributes::event, message } });
}

void
span::log_fields(std::vector<log_field> fields)
{
  if (is_noop()) {
    return;
  }
  log_record entry{ std::chrono::system_clock::now(), std::move(fields) };
  if (shadow_ || debug_) {
    auto message = entry.message();
    if (shadow_) {
      shadow_->span->log(message);
    }
    if (debug_) {
      debug_->event(std::move(message));
    }
  }
  record_->record(std::move(entry));
}

void
span::finish()
{
  if (is_noop()) {
    return;
  }
  if (!record_->finish(std::chrono::system_clock::now())) {
    return;
  }
  if (shadow_) {
    shadow_->span->finish();
  }
  if (debug_) {
    debug_->finish();
  }
  if (registered_) {
    if (auto owner = tracer_.lock(); owner) {
      owner->unregister_span(this);
    }
  }
  if (auto parent = collector_.lock(); parent) {
    parent->add_child(record_);
  }
}

auto
span::meta() const -> span_meta
{
  if (is_noop()) {
    return {};
  }
  span_meta result{};
  result.trace_id = record_->trace_id();
  result.span_id = record_->span_id();
  result.baggage = record_->baggage();
  result.recording_type = record_->recording_type();
  if (shadow_) {
    result.backend_type = shadow_->tracer->type();
    result.backend_context = shadow_->span->context();
  }
  return result;
}

auto
span::get_recording() const -> recording
{
  if (is_noop()) {
    return {};
  }
  return record_->get_recording();
}

void
span::import_remote_spans(const recording& remote)
{
  if (is_noop()) {
    return;
  }
  record_->import_remote_spans(remote);
}
} // namespace spanline::tracing
