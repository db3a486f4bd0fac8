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

#include <spanline/tracing/external_backend.hxx>
#include <spanline/tracing/recording_type.hxx>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace spanline::tracing
{
/**
 * Serializable identity of a span: what crosses a process boundary.
 *
 * Produced by span::meta() for local export, or by tracer::extract_meta_from() on the receiving side.
 * A meta with both identifiers set to zero means that no tracing is in effect.
 */
struct span_meta {
    std::uint64_t trace_id{ 0 };
    std::uint64_t span_id{ 0 };
    std::map<std::string, std::string> baggage{};
    tracing::recording_type recording_type{ recording_type::off };

    /**
     * Type of the external backend that produced backend_context, empty when there is none.
     */
    std::string backend_type{};
    std::shared_ptr<external_span_context> backend_context{};

    [[nodiscard]] auto is_noop() const -> bool
    {
        return trace_id == 0 && span_id == 0;
    }
};
} // namespace spanline::tracing
