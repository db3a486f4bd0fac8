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

namespace spanline::core::tracing
{
/**
 * Baggage item set on spans that record verbosely, so that spans derived from them (also in
 * other processes) are real and record as well.
 *
 * "sb" is a historical name, and it goes on the wire.
 */
constexpr auto verbose_tracing_baggage_key = "sb";

namespace wire
{
// Keys are lower case, extraction lower-cases incoming keys before comparing.
constexpr auto prefix_tracer_state = "crdb-tracer-";
constexpr auto prefix_baggage = "crdb-baggage-";
// prepended to the keys written by the external backend
constexpr auto prefix_shadow = "crdb-shadow-";

constexpr auto field_trace_id = "crdb-tracer-traceid";
constexpr auto field_span_id = "crdb-tracer-spanid";
constexpr auto field_shadow_type = "crdb-tracer-shadowtype";
} // namespace wire

namespace debug
{
constexpr auto family = "tracing";
} // namespace debug

namespace attributes
{
constexpr auto verbose = "_verbose";
constexpr auto reference = "span.reference";
constexpr auto follows_from = "follows_from";
constexpr auto event = "event";
} // namespace attributes
} // namespace spanline::core::tracing
