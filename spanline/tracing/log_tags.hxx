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

#include <string>
#include <vector>

namespace spanline::tracing
{
struct log_tag {
    std::string key;
    std::string value;
};

/**
 * Ordered set of request-scoped tags (node, store, range and the like) that spans pick up from
 * the context they are created in.
 */
class log_tags
{
  public:
    log_tags() = default;

    explicit log_tags(std::vector<log_tag> tags);

    /**
     * @return a copy with the tag appended, or with the value replaced in place if the key exists
     */
    [[nodiscard]] auto add(const std::string& key, const std::string& value) const -> log_tags;

    [[nodiscard]] auto current_tags() const -> const std::vector<log_tag>&
    {
        return tags_;
    }

    [[nodiscard]] auto empty() const -> bool
    {
        return tags_.empty();
    }

    /**
     * Formats the tags as "key1value1,key2=value2": single-character keys are glued to their
     * value, longer keys use '=', tags without a value print the key only.
     */
    [[nodiscard]] auto to_string() const -> std::string;

  private:
    std::vector<log_tag> tags_{};
};
} // namespace spanline::tracing
