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

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>

namespace spanline::core::logger
{
struct configuration;

/**
 * Severity of a log message. Ordered like spdlog's levels.
 */
enum class level { trace, debug, info, warn, err, critical, off };

/**
 * Accepts the names spanline reads from its environment: trace, debug, info, warn (or warning), err (or error),
 * critical and off. Anything else yields an empty optional.
 */
auto
level_from_str(std::string_view name) -> std::optional<level>;

/**
 * Replaces the current logger. Returns a description of the failure if the sinks could not be set up, in which
 * case the current logger stays in place.
 */
auto
create_logger(const configuration& settings) -> std::optional<std::string>;

/**
 * Installs a logger that discards everything.
 */
void
create_blackhole_logger();

/**
 * Removes the current logger. Logging becomes a no-op until a new one is created.
 */
void
reset();

void
set_log_levels(level lvl);

auto
should_log(level lvl) -> bool;

void
flush();

auto
is_initialized() -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail
} // namespace spanline::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define SPANLINE_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define SPANLINE_LOGGER_FUNCTION __FUNCTION__
#endif

// arguments are formatted only when the message passes the level check
#define SPANLINE_LOG(severity, ...)                                                                                                        \
    do {                                                                                                                                   \
        if (spanline::core::logger::should_log(severity)) {                                                                                \
            spanline::core::logger::detail::log(__FILE__, __LINE__, SPANLINE_LOGGER_FUNCTION, severity, fmt::format(__VA_ARGS__));         \
        }                                                                                                                                  \
    } while (false)

#define SL_LOG_TRACE(...) SPANLINE_LOG(spanline::core::logger::level::trace, __VA_ARGS__)
#define SL_LOG_DEBUG(...) SPANLINE_LOG(spanline::core::logger::level::debug, __VA_ARGS__)
#define SL_LOG_INFO(...) SPANLINE_LOG(spanline::core::logger::level::info, __VA_ARGS__)
#define SL_LOG_WARNING(...) SPANLINE_LOG(spanline::core::logger::level::warn, __VA_ARGS__)
#define SL_LOG_ERROR(...) SPANLINE_LOG(spanline::core::logger::level::err, __VA_ARGS__)
#define SL_LOG_CRITICAL(...) SPANLINE_LOG(spanline::core::logger::level::critical, __VA_ARGS__)
