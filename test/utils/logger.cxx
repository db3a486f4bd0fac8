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

#include "logger.hxx"

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/details/os.h>

#include <stdexcept>

namespace test::utils
{
void
init_logger()
{
    if (spanline::core::logger::is_initialized()) {
        return;
    }
    spanline::core::logger::configuration settings{};
    settings.console_log_level = spanline::core::logger::level::trace;
    if (auto env_val = spdlog::details::os::getenv("TEST_LOG_LEVEL"); !env_val.empty()) {
        if (auto lvl = spanline::core::logger::level_from_str(env_val); lvl) {
            settings.log_level = lvl.value();
        }
    }
    if (auto env_val = spdlog::details::os::getenv("TEST_LOG_INCLUDE_LOCATION"); !env_val.empty()) {
        settings.pattern = "[%Y-%m-%d %T.%e] [%P,%t] [%^%l%$] %oms, %v at %@ %!";
    }
    if (auto error = spanline::core::logger::create_logger(settings); error) {
        throw std::runtime_error(error.value());
    }
}
} // namespace test::utils
