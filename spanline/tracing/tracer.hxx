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

#include <spanline/tracing/carrier.hxx>
#include <spanline/tracing/span.hxx>
#include <spanline/tracing/span_meta.hxx>
#include <spanline/tracing/span_options.hxx>
#include <spanline/tracing/trace_context.hxx>
#include <spanline/tracing/tracer_configuration.hxx>
#include <spanline/tracing/tracer_options.hxx>
#include <spanline/tracing/tracing_mode.hxx>

#include <tl/expected.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spanline::core::tracing
{
class shadow_tracer;
class debug_sink;
} // namespace spanline::core::tracing

namespace spanline::tracing
{
/**
 * Creates spans, decides whether a call gets a real span or the shared noop span, follows its
 * configuration, and keeps track of the local root spans that are still running.
 *
 * Usually one instance per process, created through tracer::create().
 */
class tracer : public std::enable_shared_from_this<tracer>
{
  public:
    using span_visitor = std::function<std::error_code(const std::shared_ptr<span>&)>;

    /**
     * The new tracer runs in legacy mode without a backend or debug sink, i.e. it only creates
     * real spans when asked to. Use configure() to change that.
     */
    [[nodiscard]] static auto create(tracer_options options = {}) -> std::shared_ptr<tracer>;

    tracer(const tracer& other) = delete;
    tracer(tracer&& other) = delete;
    tracer& operator=(const tracer& other) = delete;
    tracer& operator=(tracer&& other) = delete;
    ~tracer();

    /**
     * Applies the current value of every setting and re-applies them whenever one of them changes.
     * Calling configure() again replaces the previous configuration. A setting object is
     * subscribed to only once per tracer, however often it is passed in.
     */
    void configure(const tracer_configuration& configuration);

    /**
     * Detaches and closes the external backend, if any, and stops following the settings passed
     * to configure(). Safe to call more than once.
     */
    void close();

    auto start_span(const std::string& operation_name, const span_options& options = {}) -> std::shared_ptr<span>;

    /**
     * Starts a span and returns it together with a context carrying it. Log tags of the given
     * context are propagated into the span unless the options set their own.
     *
     * When no real span is needed, the tracer's noop span is returned along with the unchanged
     * context.
     *
     * @exception std::invalid_argument if the options are inconsistent (see span_options#build())
     */
    auto start_span_ctx(const trace_context& ctx, const std::string& operation_name, const span_options& options = {})
      -> std::pair<trace_context, std::shared_ptr<span>>;

    /**
     * Serializes span metadata into the carrier. Writes nothing for a meta that denotes "no tracing".
     */
    auto inject_meta_into(const span_meta& meta, carrier& destination) const -> std::error_code;

    /**
     * Deserializes span metadata from the carrier. A carrier without identifiers yields the
     * "no tracing" meta.
     */
    auto extract_meta_from(const carrier& source) const -> tl::expected<span_meta, std::error_code>;

    /**
     * Invokes the visitor for every active local root span. The visitor runs without any tracer
     * lock held and may return errc::tracing::stop_iteration to end the walk.
     */
    auto visit_spans(const span_visitor& visitor) const -> std::error_code;

    /**
     * @return true if every operation gets a real span regardless of the options
     */
    [[nodiscard]] auto always_trace() const -> bool;

    [[nodiscard]] auto mode() const -> tracing_mode;
    [[nodiscard]] auto debug_sink_enabled() const -> bool;

    /**
     * @return type of the attached external backend, empty if none
     */
    [[nodiscard]] auto backend_type() const -> std::string;

    [[nodiscard]] auto noop_span() const -> const std::shared_ptr<span>&
    {
        return noop_span_;
    }

    [[nodiscard]] auto debug_sink() const -> std::shared_ptr<core::tracing::debug_sink>
    {
        return debug_sink_;
    }

    [[nodiscard]] auto active_span_count() const -> std::size_t;

    [[nodiscard]] auto options() const -> const tracer_options&
    {
        return options_;
    }

  private:
    friend class span;

    explicit tracer(tracer_options options);

    void apply_configuration();
    void set_shadow_tracer(std::shared_ptr<core::tracing::shadow_tracer> shadow);
    [[nodiscard]] auto get_shadow_tracer() const -> std::shared_ptr<core::tracing::shadow_tracer>;

    void register_span(const std::shared_ptr<span>& sp);
    void unregister_span(const span* sp);

    tracer_options options_;
    std::shared_ptr<span> noop_span_{};
    std::shared_ptr<core::tracing::debug_sink> debug_sink_;

    std::atomic<tracing_mode> mode_{ tracing_mode::legacy };
    std::atomic_bool debug_sink_enabled_{ false };
    // accessed through std::atomic_load/std::atomic_exchange only
    std::shared_ptr<core::tracing::shadow_tracer> shadow_tracer_{};

    // serializes configure(), close() and the change notifications
    std::mutex configuration_mutex_{};
    std::optional<tracer_configuration> configuration_{};
    // settings holding one of our change callbacks, each subscribed at most once
    std::vector<std::weak_ptr<const void>> subscribed_settings_{};
    std::optional<std::size_t> selected_backend_index_{};
    std::string selected_backend_value_{};

    mutable std::mutex active_spans_mutex_{};
    std::unordered_map<const span*, std::shared_ptr<span>> active_spans_{};
};
} // namespace spanline::tracing
