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
#include <spanline/tracing/recording_type.hxx>
#include <spanline/tracing/span_meta.hxx>

#include <fmt/core.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spanline::core::tracing
{
class span_record;
class debug_trace;
struct shadow_span;
} // namespace spanline::core::tracing

namespace spanline::tracing
{
class tracer;

/**
 * Handle to one traced unit of work.
 *
 * A real span owns a span record, and optionally mirrors everything into a span of the external
 * backend and into a debug trace. The tracer's noop span owns nothing and ignores every mutation,
 * so callers never need to check which one they hold.
 *
 * All methods are safe to call concurrently.
 */
class span
{
  public:
    /**
     * Creates a noop span.
     */
    explicit span(std::weak_ptr<tracing::tracer> tracer);

    span(std::weak_ptr<tracing::tracer> tracer,
         std::shared_ptr<core::tracing::span_record> record,
         std::weak_ptr<core::tracing::span_record> collector,
         std::unique_ptr<core::tracing::shadow_span> shadow,
         std::shared_ptr<core::tracing::debug_trace> debug);

    span(const span& other) = delete;
    span(span&& other) = delete;
    span& operator=(const span& other) = delete;
    span& operator=(span&& other) = delete;
    ~span();

    [[nodiscard]] auto is_noop() const noexcept -> bool
    {
        return record_ == nullptr;
    }

    /**
     * @return the tracer that created this span, or nullptr if it no longer exists
     */
    [[nodiscard]] auto tracer() const -> std::shared_ptr<tracing::tracer>;

    [[nodiscard]] auto trace_id() const -> std::uint64_t;
    [[nodiscard]] auto span_id() const -> std::uint64_t;

    [[nodiscard]] auto operation_name() const -> std::string;
    void set_operation_name(const std::string& name);

    void set_tag(const std::string& name, const std::string& value);
    void set_tag(const std::string& name, std::uint64_t value);

    void set_baggage_item(const std::string& name, const std::string& value);
    [[nodiscard]] auto baggage_item(const std::string& name) const -> std::optional<std::string>;

    /**
     * Starts or stops verbose recording. Verbose spans keep their log entries and ask remote
     * children (through baggage) to record as well.
     */
    void set_verbose(bool verbose);
    [[nodiscard]] auto is_recording() const -> bool;
    [[nodiscard]] auto recording_type() const -> tracing::recording_type;

    /**
     * Appends a log entry with a single "event" field.
     */
    void record(const std::string& message);

    template<typename... Args>
    void recordf(fmt::format_string<Args...> format, Args&&... args)
    {
        if (is_noop()) {
            return;
        }
        record(fmt::format(format, std::forward<Args>(args)...));
    }

    void log_fields(std::vector<log_field> fields);

    /**
     * Freezes the duration. Only the first call has an effect.
     */
    void finish();

    [[nodiscard]] auto meta() const -> span_meta;

    /**
     * Snapshot of this span and everything folded into it so far. Can be called before and after
     * finish().
     */
    [[nodiscard]] auto get_recording() const -> recording;

    /**
     * Adds spans collected from a remote (or manually collected) child to this span's recording.
     */
    void import_remote_spans(const recording& remote);

  private:
    friend class tracing::tracer;

    std::weak_ptr<tracing::tracer> tracer_;
    std::shared_ptr<core::tracing::span_record> record_{};
    std::weak_ptr<core::tracing::span_record> collector_{};
    std::unique_ptr<core::tracing::shadow_span> shadow_{};
    std::shared_ptr<core::tracing::debug_trace> debug_{};
    bool registered_{ false };
};
} // namespace spanline::tracing
