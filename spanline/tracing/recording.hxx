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

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spanline::tracing
{
struct log_field {
    std::string key;
    std::string value;

    auto operator==(const log_field& other) const -> bool
    {
        return key == other.key && value == other.value;
    }
};

/**
 * One structured log entry recorded by a verbose span.
 */
struct log_record {
    std::chrono::system_clock::time_point time{};
    std::vector<log_field> fields{};

    /**
     * @return the fields rendered as "key:value" pairs separated by spaces
     */
    [[nodiscard]] auto message() const -> std::string;
};

/**
 * Immutable copy of a span's state, taken when the recording was requested.
 */
struct recorded_span {
    std::uint64_t trace_id{ 0 };
    std::uint64_t span_id{ 0 };
    std::uint64_t parent_span_id{ 0 };
    std::string operation{};
    std::uint64_t task_id{ 0 };
    std::chrono::system_clock::time_point start_time{};
    /**
     * Negative while the span is unfinished.
     */
    std::chrono::nanoseconds duration{ -1 };
    bool verbose{ false };
    std::map<std::string, std::string> tags{};
    std::map<std::string, std::string> baggage{};
    std::vector<log_record> logs{};

    [[nodiscard]] auto finished() const -> bool
    {
        return duration.count() >= 0;
    }
};

/**
 * Snapshot of a span followed by everything folded into it. The first element is always the span
 * the recording was taken from.
 */
using recording = std::vector<recorded_span>;

/**
 * Renders the recording as indented text, one block per span, log entries timestamped relative to
 * the start of the first span.
 */
std::string
to_string(const recording& rec);

/**
 * Renders the recording as a JSON array.
 */
std::string
to_json(const recording& rec);

/**
 * Parses a recording rendered by to_json(), e.g. one shipped back by a remote child.
 *
 * @return the recording, or errc::tracing::recording_corrupted
 */
tl::expected<recording, std::error_code>
recording_from_json(std::string_view input);

/**
 * @return the first log entry (in recording order) whose message contains the needle, if any
 */
std::optional<log_record>
find_log_message(const recording& rec, std::string_view needle);

/**
 * @return the span with the given operation name, if any
 */
std::optional<recorded_span>
find_span(const recording& rec, std::string_view operation);
} // namespace spanline::tracing
