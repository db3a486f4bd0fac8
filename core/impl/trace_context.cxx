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

#include <spanline/tracing/trace_context.hxx>

#include <utility>

namespace spanline::tracing
{
auto
trace_context::log_tags() const -> const tracing::log_tags&
{
    static const tracing::log_tags empty{};
    if (log_tags_ == nullptr) {
        return empty;
    }
    return *log_tags_;
}

auto
trace_context::with_span(std::shared_ptr<tracing::span> sp) const -> trace_context
{
    trace_context result{ *this };
    result.span_ = std::move(sp);
    return result;
}

auto
trace_context::with_log_tag(const std::string& key, const std::string& value) const -> trace_context
{
    return with_log_tags(log_tags().add(key, value));
}

auto
trace_context::with_log_tags(tracing::log_tags tags) const -> trace_context
{
    trace_context result{ *this };
    result.log_tags_ = std::make_shared<const tracing::log_tags>(std::move(tags));
    return result;
}
} // namespace spanline::tracing
