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

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace spanline::tracing
{
/**
 * Relationship between a span and the span it was derived from.
 */
enum class reference_kind {
    /**
     * The parent waits for the child to complete.
     */
    child_of,
    /**
     * The child may outlive the parent (asynchronous work).
     */
    follows_from,
};

/**
 * Format of the text map handed to the backend during inject/extract. Derived from the carrier kind.
 */
enum class serialization_format {
    text_map,
    http_headers,
};

/**
 * Opaque propagation state of a span in an external backend.
 */
class external_span_context
{
  public:
    external_span_context() = default;
    external_span_context(const external_span_context& other) = default;
    external_span_context(external_span_context&& other) = default;
    external_span_context& operator=(const external_span_context& other) = default;
    external_span_context& operator=(external_span_context&& other) = default;
    virtual ~external_span_context() = default;
};

/**
 * A span living in an external backend, mirrored alongside a spanline span.
 */
class external_span
{
  public:
    external_span() = default;
    external_span(const external_span& other) = default;
    external_span(external_span&& other) = default;
    external_span& operator=(const external_span& other) = default;
    external_span& operator=(external_span&& other) = default;
    virtual ~external_span() = default;

    virtual void set_tag(const std::string& name, const std::string& value) = 0;
    virtual void set_tag(const std::string& name, std::uint64_t value) = 0;
    virtual void set_baggage_item(const std::string& name, const std::string& value) = 0;
    virtual void log(const std::string& message) = 0;
    virtual void finish() = 0;

    [[nodiscard]] virtual std::shared_ptr<external_span_context> context() const = 0;
};

/**
 * Pluggable third-party tracing system. The tracer keeps at most one attached at a time and
 * calls into it synchronously while creating spans and moving metadata over the wire.
 */
class external_backend
{
  public:
    using writer = std::function<void(std::string_view key, std::string_view value)>;

    external_backend() = default;
    external_backend(const external_backend& other) = default;
    external_backend(external_backend&& other) = default;
    external_backend& operator=(const external_backend& other) = default;
    external_backend& operator=(external_backend&& other) = default;
    virtual ~external_backend() = default;

    /**
     * Type tag shipped on the wire next to the backend fields. Receivers drop the backend
     * fields unless their own backend reports the same tag.
     */
    [[nodiscard]] virtual std::string type() const = 0;

    /**
     * @return the new span, or nullptr if the backend cannot create one (e.g. it was closed)
     */
    virtual std::shared_ptr<external_span> start_span(const std::shared_ptr<external_span_context>& parent,
                                                      reference_kind kind,
                                                      const std::string& operation_name,
                                                      std::chrono::system_clock::time_point start_time) = 0;

    virtual std::error_code inject(const std::shared_ptr<external_span_context>& context,
                                   serialization_format format,
                                   const writer& write) = 0;

    virtual tl::expected<std::shared_ptr<external_span_context>, std::error_code> extract(
      serialization_format format,
      const std::map<std::string, std::string>& fields) = 0;

    virtual void close() = 0;
};
} // namespace spanline::tracing
