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

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace spanline::tracing
{
/**
 * Physical encodings the tracer knows how to write span metadata into.
 */
enum class carrier_kind {
    unknown,
    /**
     * Plain string map, keys stored as given.
     */
    map,
    /**
     * RPC metadata headers: keys are lower-cased and may repeat.
     */
    metadata,
};

/**
 * Key/value transport used to move serialized span metadata across a process boundary.
 *
 * The tracer only encodes into carriers whose kind() it recognizes, see tracer::inject_meta_into().
 */
class carrier
{
  public:
    using visitor = std::function<std::error_code(std::string_view key, std::string_view value)>;

    carrier() = default;
    carrier(const carrier& other) = default;
    carrier(carrier&& other) = default;
    carrier& operator=(const carrier& other) = default;
    carrier& operator=(carrier&& other) = default;
    virtual ~carrier() = default;

    [[nodiscard]] virtual carrier_kind kind() const
    {
        return carrier_kind::unknown;
    }

    virtual void set(std::string_view key, std::string_view value) = 0;

    /**
     * Invokes the visitor for every entry, stopping at (and returning) the first error.
     */
    virtual std::error_code for_each(const visitor& fn) const = 0;
};

class map_carrier : public carrier
{
  public:
    map_carrier() = default;

    explicit map_carrier(std::map<std::string, std::string> entries)
      : map_{ std::move(entries) }
    {
    }

    [[nodiscard]] carrier_kind kind() const override
    {
        return carrier_kind::map;
    }

    void set(std::string_view key, std::string_view value) override;

    std::error_code for_each(const visitor& fn) const override;

    [[nodiscard]] const std::map<std::string, std::string>& map() const
    {
        return map_;
    }

  private:
    std::map<std::string, std::string> map_{};
};

class metadata_carrier : public carrier
{
  public:
    metadata_carrier() = default;

    explicit metadata_carrier(std::multimap<std::string, std::string> metadata);

    [[nodiscard]] carrier_kind kind() const override
    {
        return carrier_kind::metadata;
    }

    void set(std::string_view key, std::string_view value) override;

    std::error_code for_each(const visitor& fn) const override;

    [[nodiscard]] const std::multimap<std::string, std::string>& metadata() const
    {
        return metadata_;
    }

  private:
    std::multimap<std::string, std::string> metadata_{};
};
} // namespace spanline::tracing
