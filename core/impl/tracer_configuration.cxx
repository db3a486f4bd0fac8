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

#include <spanline/tracing/tracer_configuration.hxx>

#include "core/logger/logger.hxx"

#include <spdlog/details/os.h>

#include <algorithm>
#include <cctype>

namespace spanline::tracing
{
auto
tracer_configuration::from_environment() -> tracer_configuration
{
    auto mode = tracing_mode::legacy;
    if (auto value = spdlog::details::os::getenv("SPANLINE_TRACE_MODE"); !value.empty()) {
        if (auto parsed = tracing_mode_from_string(value); parsed) {
            mode = parsed.value();
        } else {
            SL_LOG_WARNING(R"(unexpected value of SPANLINE_TRACE_MODE "{}", using "{}")", value, to_string(mode));
        }
    }

    bool debug_sink_enabled = false;
    if (auto value = spdlog::details::os::getenv("SPANLINE_TRACE_DEBUG"); !value.empty()) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        debug_sink_enabled = value == "1" || value == "true" || value == "yes" || value == "on";
    }

    tracer_configuration configuration{};
    configuration.mode = std::make_shared<mutable_setting<tracing_mode>>(mode);
    configuration.debug_sink_enabled = std::make_shared<mutable_setting<bool>>(debug_sink_enabled);
    return configuration;
}
} // namespace spanline::tracing
