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

#include <spanline/tracing/log_tags.hxx>

#include <algorithm>
#include <utility>

namespace spanline::tracing
{
log_tags::log_tags(std::vector<log_tag> tags)
  : tags_{ std::move(tags) }
{
}

auto
log_tags::add(const std::string& key, const std::string& value) const -> log_tags
{
    log_tags result{ *this };
    auto it = std::find_if(result.tags_.begin(), result.tags_.end(), [&key](const log_tag& tag) {
        return tag.key == key;
    });
    if (it != result.tags_.end()) {
        it->value = value;
    } else {
        result.tags_.push_back({ key, value });
    }
    return result;
}

auto
log_tags::to_string() const -> std::string
{
    std::string out;
    for (const auto& tag : tags_) {
        if (!out.empty()) {
            out += ',';
        }
        out += tag.key;
        if (tag.value.empty()) {
            continue;
        }
        if (tag.key.size() > 1) {
            out += '=';
        }
        out += tag.value;
    }
    return out;
}
} // namespace spanline::tracing
