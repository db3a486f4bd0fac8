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

#include "wire_codec.hxx"

#include "constants.hxx"
#include "core/logger/logger.hxx"
#include "shadow_tracer.hxx"

#include <spanline/error_codes.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace spanline::core::tracing
{
namespace
{
auto
format_for(spanline::tracing::carrier_kind kind) -> std::optional<spanline::tracing::serialization_format>
{
  switch (kind) {
    case spanline::tracing::carrier_kind::map:
      return spanline::tracing::serialization_format::text_map;
    case spanline::tracing::carrier_kind::metadata:
      return spanline::tracing::serialization_format::http_headers;
    case spanline::tracing::carrier_kind::unknown:
      break;
  }
  return {};
}

auto
parse_id(std::string_view input, std::uint64_t& id) -> bool
{
  if (input.empty()) {
    return false;
  }
  const auto* end = input.data() + input.size();
  auto [ptr, ec] = std::from_chars(input.data(), end, id, 16);
  return ec == std::errc{} && ptr == end;
}

auto
starts_with(std::string_view str, std::string_view prefix) -> bool
{
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

auto
inject_meta(const spanline::tracing::span_meta& meta,
            spanline::tracing::carrier& destination,
            const std::shared_ptr<shadow_tracer>& shadow) -> std::error_code
{
  if (meta.is_noop()) {
    return {};
  }
  auto format = format_for(destination.kind());
  if (!format) {
    return errc::tracing::unsupported_carrier;
  }

  destination.set(wire::field_trace_id, fmt::format("{:x}", meta.trace_id));
  destination.set(wire::field_span_id, fmt::format("{:x}", meta.span_id));
  for (const auto& [key, value] : meta.baggage) {
    destination.set(std::string{ wire::prefix_baggage } + key, value);
  }

  if (meta.backend_type.empty() || shadow == nullptr) {
    return {};
  }
  if (meta.backend_type != shadow->type()) {
    SL_LOG_TRACE("not injecting external backend fields of type \"{}\", current backend is \"{}\"", meta.backend_type, shadow->type());
    return {};
  }
  destination.set(wire::field_shadow_type, meta.backend_type);
  auto ec = shadow->backend()->inject(
    meta.backend_context, format.value(), [&destination](std::string_view key, std::string_view value) {
      destination.set(std::string{ wire::prefix_shadow }.append(key), value);
    });
  if (ec) {
    SL_LOG_DEBUG("external backend \"{}\" failed to inject span context: {}", shadow->type(), ec.message());
  }
  return ec;
}

auto
extract_meta(const spanline::tracing::carrier& source, const std::shared_ptr<shadow_tracer>& shadow)
  -> tl::expected<spanline::tracing::span_meta, std::error_code>
{
  auto format = format_for(source.kind());
  if (!format) {
    return tl::unexpected(make_error_code(errc::tracing::unsupported_carrier));
  }

  spanline::tracing::span_meta meta{};
  std::map<std::string, std::string> shadow_fields{};
  std::string key;
  auto ec = source.for_each([&](std::string_view raw_key, std::string_view value) -> std::error_code {
    key.assign(raw_key);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });

    if (key == wire::field_trace_id) {
      if (!parse_id(value, meta.trace_id)) {
        return errc::tracing::span_context_corrupted;
      }
    } else if (key == wire::field_span_id) {
      if (!parse_id(value, meta.span_id)) {
        return errc::tracing::span_context_corrupted;
      }
    } else if (key == wire::field_shadow_type) {
      meta.backend_type = value;
    } else if (starts_with(key, wire::prefix_baggage)) {
      meta.baggage[key.substr(std::string_view{ wire::prefix_baggage }.size())] = value;
    } else if (starts_with(key, wire::prefix_shadow)) {
      shadow_fields[key.substr(std::string_view{ wire::prefix_shadow }.size())] = value;
    }
    return {};
  });
  if (ec) {
    return tl::unexpected(ec);
  }

  if (meta.is_noop()) {
    return spanline::tracing::span_meta{};
  }

  if (auto it = meta.baggage.find(verbose_tracing_baggage_key); it != meta.baggage.end() && !it->second.empty()) {
    meta.recording_type = spanline::tracing::recording_type::verbose;
  }

  if (meta.backend_type.empty()) {
    return meta;
  }
  if (shadow == nullptr || shadow->type() != meta.backend_type) {
    SL_LOG_TRACE("dropping external backend fields of type \"{}\", current backend is \"{}\"",
                 meta.backend_type,
                 shadow == nullptr ? std::string{} : shadow->type());
    meta.backend_type.clear();
    return meta;
  }
  auto backend_context = shadow->backend()->extract(format.value(), shadow_fields);
  if (!backend_context) {
    SL_LOG_DEBUG("external backend \"{}\" failed to extract span context: {}", meta.backend_type, backend_context.error().message());
    return tl::unexpected(backend_context.error());
  }
  meta.backend_context = std::move(backend_context.value());
  return meta;
}
} // namespace spanline::core::tracing
