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

#include <spanline/tracing/carrier.hxx>

#include <algorithm>
#include <cctype>
#include <utility>

namespace spanline::tracing
{
namespace
{
std::string
lower_case(std::string_view input)
{
    std::string result{ input };
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}
} // namespace

void
map_carrier::set(std::string_view key, std::string_view value)
{
    map_.insert_or_assign(std::string{ key }, std::string{ value });
}

std::error_code
map_carrier::for_each(const visitor& fn) const
{
    for (const auto& [key, value] : map_) {
        if (auto ec = fn(key, value); ec) {
            return ec;
        }
    }
    return {};
}

metadata_carrier::metadata_carrier(std::multimap<std::string, std::string> metadata)
{
    for (auto& [key, value] : metadata) {
        metadata_.emplace(lower_case(key), std::move(value));
    }
}

void
metadata_carrier::set(std::string_view key, std::string_view value)
{
    metadata_.emplace(lower_case(key), std::string{ value });
}

std::error_code
metadata_carrier::for_each(const visitor& fn) const
{
    for (const auto& [key, value] : metadata_) {
        if (auto ec = fn(key, value); ec) {
            return ec;
        }
    }
    return {};
}
} // namespace spanline::tracing
