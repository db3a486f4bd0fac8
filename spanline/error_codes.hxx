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

#include <system_error>

namespace spanline
{
namespace core::impl
{
const std::error_category&
tracing_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Errors reported by the tracer while moving span metadata across process boundaries.
 */
enum class tracing {
    /**
     * The carrier passed to inject/extract does not report a kind the tracer can encode into.
     */
    unsupported_carrier = 1,

    /**
     * A trace or span identifier on the wire could not be decoded.
     */
    span_context_corrupted = 2,

    /**
     * The external backend failed to inject or extract its own context.
     */
    backend_failure = 3,

    /**
     * Returned by a span visitor to end the walk early. Never surfaced to the caller of
     * tracer::visit_spans().
     */
    stop_iteration = 4,

    /**
     * A recording received in JSON form could not be decoded.
     */
    recording_corrupted = 5,
};

inline std::error_code
make_error_code(tracing e)
{
    return { static_cast<int>(e), core::impl::tracing_category() };
}
} // namespace errc
} // namespace spanline

template<>
struct std::is_error_code_enum<spanline::errc::tracing> : std::true_type {
};
