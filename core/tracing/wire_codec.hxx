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

#include <spanline/tracing/carrier.hxx>
#include <spanline/tracing/span_meta.hxx>

#include <tl/expected.hpp>

#include <memory>
#include <system_error>

namespace spanline::core::tracing
{
class shadow_tracer;

/**
 * Writes the span metadata into the carrier. Backend fields are written only when the given
 * shadow tracer produced them, i.e. its type equals the one recorded in the metadata.
 */
auto
inject_meta(const spanline::tracing::span_meta& meta,
            spanline::tracing::carrier& destination,
            const std::shared_ptr<shadow_tracer>& shadow) -> std::error_code;

/**
 * Reads span metadata from the carrier. Backend fields are handed to the shadow tracer when it
 * has the type found on the wire, and dropped otherwise.
 */
auto
extract_meta(const spanline::tracing::carrier& source, const std::shared_ptr<shadow_tracer>& shadow)
  -> tl::expected<spanline::tracing::span_meta, std::error_code>;
} // namespace spanline::core::tracing
