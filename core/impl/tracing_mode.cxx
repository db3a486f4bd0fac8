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

#include <spanline/tracing/tracing_mode.hxx>

#include <algorithm>
#include <cctype>

namespace spanline::tracing
{
auto
to_string(tracing_mode mode) -> std::string
{
    switch (mode) {
        case tracing_mode::legacy:
            return "legacy";
        case tracing_mode::background:
            return "background";
    }
    return "unknown";
}

auto
tracing_mode_from_string(std::string_view input) -> std::optional<tracing_mode>
{
    std::string normalized{ input };
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (normalized == "legacy") {
        return tracing_mode::legacy;
    }
    if (normalized == "background") {
        return tracing_mode::background;
    }
    return {};
}
} // namespace spanline::tracing
