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

#include <spanline/tracing/recording.hxx>

#include <spanline/error_codes.hxx>

#include "core/logger/logger.hxx"
#include "core/tracing/recording_json.hxx"
#include "core/utils/json.hxx"

#include <fmt/core.h>
#include <gsl/util>
#include <tao/json.hpp>

#include <map>
#include <stdexcept>

namespace spanline::tracing
{
namespace
{
auto
offset_ms(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to) -> double
{
    auto delta = std::chrono::duration_cast<std::chrono::microseconds>(to - from);
    return gsl::narrow_cast<double>(delta.count()) / 1000.0;
}
} // namespace

auto
log_record::message() const -> std::string
{
    std::string result;
    for (const auto& field : fields) {
        if (!result.empty()) {
            result += ' ';
        }
        result += fmt::format("{}:{}", field.key, field.value);
    }
    return result;
}

std::string
to_string(const recording& rec)
{
    if (rec.empty()) {
        return {};
    }
    const auto trace_start = rec.front().start_time;

    std::map<std::uint64_t, std::size_t> depth_of{};
    std::string out;
    for (const auto& span : rec) {
        std::size_t depth = 0;
        if (auto parent = depth_of.find(span.parent_span_id); parent != depth_of.end()) {
            depth = parent->second + 1;
        }
        depth_of[span.span_id] = depth;
        const std::string indent(depth * 4, ' ');

        std::string header = fmt::format("=== operation:{}", span.operation);
        for (const auto& [key, value] : span.tags) {
            header += fmt::format(" {}:{}", key, value);
        }
        if (!span.finished()) {
            header += " <unfinished>";
        }
        out += fmt::format("{:>10.3f}ms {:>10.3f}ms {}{}\n", offset_ms(trace_start, span.start_time), 0.0, indent, header);

        auto previous = span.start_time;
        for (const auto& entry : span.logs) {
            out += fmt::format("{:>10.3f}ms {:>10.3f}ms {}{}\n",
                               offset_ms(trace_start, entry.time),
                               offset_ms(previous, entry.time),
                               indent,
                               entry.message());
            previous = entry.time;
        }
    }
    return out;
}

std::string
to_json(const recording& rec)
{
    tao::json::value spans = tao::json::empty_array;
    for (const auto& span : rec) {
        spans.emplace_back(span);
    }
    return core::utils::json::generate(spans);
}

tl::expected<recording, std::error_code>
recording_from_json(std::string_view input)
{
    try {
        auto parsed = core::utils::json::parse(input);
        recording result;
        for (const auto& entry : parsed.get_array()) {
            result.emplace_back(entry.as<recorded_span>());
        }
        return result;
    } catch (const tao::pegtl::parse_error& e) {
        SL_LOG_DEBUG("unable to parse recording: {}", e.what());
    } catch (const std::logic_error& e) {
        SL_LOG_DEBUG("unexpected recording layout: {}", e.what());
    } catch (const std::runtime_error& e) {
        SL_LOG_DEBUG("rejected recording: {}", e.what());
    }
    return tl::unexpected(make_error_code(errc::tracing::recording_corrupted));
}

std::optional<log_record>
find_log_message(const recording& rec, std::string_view needle)
{
    for (const auto& span : rec) {
        for (const auto& entry : span.logs) {
            if (entry.message().find(needle) != std::string::npos) {
                return entry;
            }
        }
    }
    return {};
}

std::optional<recorded_span>
find_span(const recording& rec, std::string_view operation)
{
    for (const auto& span : rec) {
        if (span.operation == operation) {
            return span;
        }
    }
    return {};
}
} // namespace spanline::tracing
