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

#include <cstddef>

namespace spanline::tracing
{
/**
 * Limits fixed for the lifetime of a tracer.
 */
struct tracer_options {
    /**
     * Log entries kept per span; the oldest entry is dropped once full.
     */
    std::size_t max_logs_per_span{ 1000 };

    /**
     * Direct children whose recordings are folded into a span; further children are not kept.
     */
    std::size_t max_children_per_span{ 1000 };

    /**
     * Finished traces kept by the debug sink.
     */
    std::size_t debug_sink_capacity{ 100 };

    /**
     * Events kept per debug trace.
     */
    std::size_t debug_sink_max_events{ 1000 };
};
} // namespace spanline::tracing
