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

#include <spanline/tracing/log_tags.hxx>

#include <memory>
#include <string>

namespace spanline::tracing
{
class span;

/**
 * Immutable propagation context: the span currently in effect (if any) and the log tags of the
 * request. Copies are cheap; every "with_*" call returns a new context.
 */
class trace_context
{
  public:
    trace_context() = default;

    [[nodiscard]] auto span() const -> const std::shared_ptr<tracing::span>&
    {
        return span_;
    }

    [[nodiscard]] auto log_tags() const -> const tracing::log_tags&;

    [[nodiscard]] auto with_span(std::shared_ptr<tracing::span> sp) const -> trace_context;

    [[nodiscard]] auto with_log_tag(const std::string& key, const std::string& value) const -> trace_context;

    [[nodiscard]] auto with_log_tags(tracing::log_tags tags) const -> trace_context;

  private:
    std::shared_ptr<tracing::span> span_{};
    std::shared_ptr<const tracing::log_tags> log_tags_{};
};

/**
 * @return the span carried by the context, or nullptr
 */
inline auto
span_from_context(const trace_context& ctx) -> std::shared_ptr<span>
{
    return ctx.span();
}
} // namespace spanline::tracing
