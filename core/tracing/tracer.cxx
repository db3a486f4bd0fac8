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

#include <spanline/tracing/tracer.hxx>

#include "constants.hxx"
#include "core/logger/logger.hxx"
#include "core/platform/random.hxx"
#include "debug_sink.hxx"
#include "shadow_tracer.hxx"
#include "span_record.hxx"
#include "wire_codec.hxx"

#include <spanline/error_codes.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <utility>
#include <vector>

namespace spanline::tracing
{
tracer::tracer(tracer_options options)
  : options_{ options }
  , debug_sink_{ core::tracing::debug_sink::create(options_.debug_sink_capacity, options_.debug_sink_max_events) }
{
}

auto
tracer::create(tracer_options options) -> std::shared_ptr<tracer>
{
  auto instance = std::shared_ptr<tracer>(new tracer(options));
  instance->noop_span_ = std::make_shared<span>(instance->weak_from_this());
  return instance;
}

tracer::~tracer()
{
  if (auto shadow = std::atomic_exchange(&shadow_tracer_, std::shared_ptr<core::tracing::shadow_tracer>{}); shadow) {
    shadow->close();
  }
}

void
tracer::configure(const tracer_configuration& configuration)
{
  std::vector<std::function<void(std::function<void()>)>> subscriptions{};
  {
    const std::scoped_lock lock(configuration_mutex_);
    configuration_ = configuration;
    selected_backend_index_.reset();
    selected_backend_value_.clear();

    subscribed_settings_.erase(std::remove_if(subscribed_settings_.begin(),
                                              subscribed_settings_.end(),
                                              [](const std::weak_ptr<const void>& subscribed) {
                                                return subscribed.expired();
                                              }),
                               subscribed_settings_.end());
    auto subscribe = [this, &subscriptions](const auto& followed) {
      if (!followed) {
        return;
      }
      const std::shared_ptr<const void> candidate = followed;
      for (const auto& subscribed : subscribed_settings_) {
        if (subscribed.lock() == candidate) {
          return;
        }
      }
      subscribed_settings_.emplace_back(candidate);
      subscriptions.emplace_back([followed](std::function<void()> cb) {
        followed->on_change(std::move(cb));
      });
    };
    subscribe(configuration.mode);
    subscribe(configuration.debug_sink_enabled);
    for (const auto& selector : configuration.backends) {
      subscribe(selector.selection);
    }
  }

  // registered outside the lock, a setting may notify from within on_change()
  for (const auto& subscription : subscriptions) {
    subscription([self = weak_from_this()]() {
      if (auto owner = self.lock(); owner) {
        owner->apply_configuration();
      }
    });
  }

  apply_configuration();
}

void
tracer::apply_configuration()
{
  const std::scoped_lock lock(configuration_mutex_);
  if (!configuration_) {
    return;
  }
  const auto& config = configuration_.value();

  auto mode = config.mode ? config.mode->current_value() : tracing_mode::legacy;
  if (mode_.exchange(mode) != mode) {
    SL_LOG_INFO("tracing mode changed to {}", to_string(mode));
  }

  auto debug_enabled = config.debug_sink_enabled ? config.debug_sink_enabled->current_value() : false;
  if (debug_sink_enabled_.exchange(debug_enabled) != debug_enabled) {
    SL_LOG_INFO("tracing debug sink {}", debug_enabled ? "enabled" : "disabled");
  }

  std::optional<std::size_t> index{};
  std::string value{};
  for (std::size_t i = 0; i < config.backends.size(); ++i) {
    if (!config.backends[i].selection) {
      continue;
    }
    if (auto candidate = config.backends[i].selection->current_value(); !candidate.empty()) {
      index = i;
      value = std::move(candidate);
      break;
    }
  }

  if (index == selected_backend_index_ && value == selected_backend_value_) {
    SL_LOG_DEBUG("external tracing backend selection unchanged");
    return;
  }
  selected_backend_index_ = index;
  selected_backend_value_ = value;

  if (!index) {
    if (get_shadow_tracer() != nullptr) {
      SL_LOG_INFO("detaching external tracing backend");
    }
    set_shadow_tracer(nullptr);
    return;
  }

  std::shared_ptr<external_backend> backend{};
  if (const auto& factory = config.backends[index.value()].factory; factory) {
    backend = factory(value);
  }
  if (backend == nullptr) {
    SL_LOG_WARNING("unable to create external tracing backend #{}, running without one", index.value());
    set_shadow_tracer(nullptr);
    return;
  }
  SL_LOG_INFO("attaching external tracing backend, type=\"{}\"", backend->type());
  set_shadow_tracer(std::make_shared<core::tracing::shadow_tracer>(std::move(backend)));
}

void
tracer::close()
{
  {
    const std::scoped_lock lock(configuration_mutex_);
    configuration_.reset();
    selected_backend_index_.reset();
    selected_backend_value_.clear();
  }
  set_shadow_tracer(nullptr);
}

void
tracer::set_shadow_tracer(std::shared_ptr<core::tracing::shadow_tracer> shadow)
{
  // spans created from now on can't observe the old instance, so it is safe to close it
  if (auto old = std::atomic_exchange(&shadow_tracer_, std::move(shadow)); old) {
    old->close();
  }
}

auto
tracer::get_shadow_tracer() const -> std::shared_ptr<core::tracing::shadow_tracer>
{
  return std::atomic_load(&shadow_tracer_);
}

auto
tracer::always_trace() const -> bool
{
  return mode_ == tracing_mode::background || debug_sink_enabled_ || get_shadow_tracer() != nullptr;
}

auto
tracer::mode() const -> tracing_mode
{
  return mode_;
}

auto
tracer::debug_sink_enabled() const -> bool
{
  return debug_sink_enabled_;
}

auto
tracer::backend_type() const -> std::string
{
  if (auto shadow = get_shadow_tracer(); shadow) {
    return shadow->type();
  }
  return {};
}

auto
tracer::start_span(const std::string& operation_name, const span_options& options) -> std::shared_ptr<span>
{
  return start_span_ctx(trace_context{}, operation_name, options).second;
}

auto
tracer::start_span_ctx(const trace_context& ctx, const std::string& operation_name, const span_options& options)
  -> std::pair<trace_context, std::shared_ptr<span>>
{
  const auto opts = options.build();
  const bool local_parent = opts.parent != nullptr && !opts.parent->is_noop();
  const auto& remote_parent = opts.remote_parent;

  auto requested = opts.recording;
  if (!requested) {
    if (local_parent) {
      requested = opts.parent->recording_type();
    } else if (remote_parent) {
      requested = remote_parent->recording_type;
    }
  }
  const auto effective_recording = requested.value_or(tracing::recording_type::off);

  auto shadow = get_shadow_tracer();
  const bool debug_enabled = debug_sink_enabled_;
  if (!opts.force_real_span && mode_ != tracing_mode::background && shadow == nullptr && !debug_enabled &&
      effective_recording == tracing::recording_type::off) {
    return { ctx, noop_span_ };
  }

  std::shared_ptr<const tracing::log_tags> tags{};
  if (opts.log_tags) {
    tags = std::make_shared<const tracing::log_tags>(opts.log_tags.value());
  } else if (!ctx.log_tags().empty()) {
    tags = std::make_shared<const tracing::log_tags>(ctx.log_tags());
  } else if (local_parent) {
    tags = opts.parent->record_->log_tags();
  }

  core::tracing::span_identity identity{};
  if (local_parent) {
    identity.trace_id = opts.parent->trace_id();
    identity.parent_span_id = opts.parent->span_id();
  } else if (remote_parent) {
    identity.trace_id = remote_parent->trace_id;
    identity.parent_span_id = remote_parent->span_id;
  }
  if (identity.trace_id == 0) {
    identity.trace_id = core::platform::random_id();
  }
  identity.span_id = core::platform::random_id();
  identity.task_id = core::platform::current_task_id();
  identity.start_time = std::chrono::system_clock::now();

  std::unique_ptr<core::tracing::shadow_span> shadow_sub{};
  if (shadow) {
    std::string parent_type{};
    std::shared_ptr<external_span_context> parent_context{};
    if (local_parent) {
      if (const auto& parent_shadow = opts.parent->shadow_; parent_shadow) {
        parent_type = parent_shadow->tracer->type();
        parent_context = parent_shadow->span->context();
      }
    } else if (remote_parent) {
      parent_type = remote_parent->backend_type;
      parent_context = remote_parent->backend_context;
    }
    // never derive a span of the current backend from a span of another one
    if (parent_type.empty() || parent_type == shadow->type()) {
      auto external =
        shadow->backend()->start_span(parent_context, opts.reference, operation_name, identity.start_time);
      if (external) {
        if (tags) {
          for (const auto& tag : tags->current_tags()) {
            external->set_tag(tag.key, tag.value);
          }
        }
        shadow_sub = std::make_unique<core::tracing::shadow_span>(core::tracing::shadow_span{ shadow, std::move(external) });
      }
    }
  }

  std::shared_ptr<core::tracing::debug_trace> debug{};
  if (debug_enabled) {
    debug = debug_sink_->start_trace(core::tracing::debug::family, operation_name);
    if (tags) {
      for (const auto& tag : tags->current_tags()) {
        debug->event(fmt::format("{}:{}", tag.key, tag.value));
      }
    }
  }

  auto record = std::make_shared<core::tracing::span_record>(
    identity, operation_name, std::move(tags), options_.max_logs_per_span, options_.max_children_per_span);
  std::weak_ptr<core::tracing::span_record> collector{};
  if (local_parent) {
    collector = opts.parent->record_;
  }
  auto sp = std::make_shared<span>(weak_from_this(), record, std::move(collector), std::move(shadow_sub), std::move(debug));

  if (opts.reference == reference_kind::follows_from) {
    sp->set_tag(core::tracing::attributes::reference, core::tracing::attributes::follows_from);
  }
  for (const auto& [key, value] : opts.tags) {
    sp->set_tag(key, value);
  }
  if (local_parent) {
    for (const auto& [key, value] : opts.parent->record_->baggage()) {
      sp->set_baggage_item(key, value);
    }
  } else if (remote_parent) {
    for (const auto& [key, value] : remote_parent->baggage) {
      sp->set_baggage_item(key, value);
    }
  }
  // after the baggage copy, so that an explicit "off" drops the inherited verbose item
  record->set_recording_type(effective_recording);

  // a span given the noop span as parent is not a local root
  if (opts.parent == nullptr && !opts.bypass_registry) {
    sp->registered_ = true;
    register_span(sp);
  }

  return { ctx.with_span(sp), sp };
}

auto
tracer::inject_meta_into(const span_meta& meta, carrier& destination) const -> std::error_code
{
  return core::tracing::inject_meta(meta, destination, get_shadow_tracer());
}

auto
tracer::extract_meta_from(const carrier& source) const -> tl::expected<span_meta, std::error_code>
{
  return core::tracing::extract_meta(source, get_shadow_tracer());
}

void
tracer::register_span(const std::shared_ptr<span>& sp)
{
  const std::scoped_lock lock(active_spans_mutex_);
  active_spans_.emplace(sp.get(), sp);
}

void
tracer::unregister_span(const span* sp)
{
  const std::scoped_lock lock(active_spans_mutex_);
  active_spans_.erase(sp);
}

auto
tracer::active_span_count() const -> std::size_t
{
  const std::scoped_lock lock(active_spans_mutex_);
  return active_spans_.size();
}

auto
tracer::visit_spans(const span_visitor& visitor) const -> std::error_code
{
  std::vector<std::shared_ptr<span>> snapshot{};
  {
    const std::scoped_lock lock(active_spans_mutex_);
    snapshot.reserve(active_spans_.size());
    for (const auto& [key, sp] : active_spans_) {
      snapshot.emplace_back(sp);
    }
  }
  for (const auto& sp : snapshot) {
    if (auto ec = visitor(sp); ec) {
      if (ec == errc::tracing::stop_iteration) {
        return {};
      }
      return ec;
    }
  }
  return {};
}
} // namespace spanline::tracing
