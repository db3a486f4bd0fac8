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

#include <optional>
#include <string>
#include <string_view>

namespace spanline::tracing
{
enum class tracing_mode {
    /**
     * Real spans are created only when requested (forced or recording), or when an external
     * backend or the debug sink is active.
     */
    legacy,
    /**
     * Real spans are created for all operations.
     */
    background,
};

auto
to_string(tracing_mode mode) -> std::string;

/**
 * Parses "legacy" or "background" (case-insensitive).
 */
auto
tracing_mode_from_string(std::string_view input) -> std::optional<tracing_mode>;
} // namespace spanline::tracing
