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

#include "logger.hxx"

#include <spdlog/common.h>

#include <memory>
#include <string>

namespace spanline::core::logger
{
struct configuration {
    /**
     * Messages below this level are dropped before reaching any sink
     */
    level log_level{ level::info };

    /**
     * Write messages to stderr
     */
    bool console{ true };

    /**
     * Messages below this level never reach stderr, even if the logger lets them through
     */
    level console_log_level{ level::warn };

    /**
     * Additional sink, for example a stream captured by a test
     */
    std::shared_ptr<spdlog::sinks::sink> sink{ nullptr };

    /**
     * spdlog pattern applied to every sink, the default one when empty
     */
    std::string pattern{};
};
} // namespace spanline::core::logger
