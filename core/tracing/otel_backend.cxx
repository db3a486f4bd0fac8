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

#include <spanline/tracing/otel_backend.hxx>

#include <spanline/error_codes.hxx>

#include "constants.hxx"
#include "core/logger/logger.hxx"

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <opentelemetry/context/context.h>
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/default_span.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/provider.h>
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace spanline::tracing
{
namespace
{
constexpr auto baggage_attribute_prefix = "baggage.";

class writer_carrier : public opentelemetry::context::propagation::TextMapCarrier
{
public:
  explicit writer_carrier(const external_backend::writer& write)
    : write_(write)
  {
  }

  auto Get(opentelemetry::nostd::string_view /* key */) const noexcept -> opentelemetry::nostd::string_view override
  {
    return "";
  }

  void Set(opentelemetry::nostd::string_view key, opentelemetry::nostd::string_view value) noexcept override
  {
    write_({ key.data(), key.size() }, { value.data(), value.size() });
  }

private:
  const external_backend::writer& write_;
};

class reader_carrier : public opentelemetry::context::propagation::TextMapCarrier
{
public:
  explicit reader_carrier(const std::map<std::string, std::string>& fields)
    : fields_(fields)
  {
  }

  auto Get(opentelemetry::nostd::string_view key) const noexcept -> opentelemetry::nostd::string_view override
  {
    if (auto it = fields_.find(std::string{ key.data(), key.size() }); it != fields_.end()) {
      return it->second;
    }
    return "";
  }

  void Set(opentelemetry::nostd::string_view /* key */, opentelemetry::nostd::string_view /* value */) noexcept override
  {
  }

private:
  const std::map<std::string, std::string>& fields_;
};
} // namespace

void
otel_span::set_baggage_item(const std::string& name, const std::string& value)
{
  span_->SetAttribute(baggage_attribute_prefix + name, value);
}

auto
otel_backend::from_global_provider(const std::string& instrumentation_scope) -> std::shared_ptr<otel_backend>
{
  return std::make_shared<otel_backend>(
    opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(instrumentation_scope));
}

auto
otel_backend::start_span(const std::shared_ptr<external_span_context>& parent,
                         reference_kind kind,
                         const std::string& operation_name,
                         std::chrono::system_clock::time_point start_time) -> std::shared_ptr<external_span>
{
  if (closed_) {
    return nullptr;
  }
  opentelemetry::trace::StartSpanOptions opts;
  opts.start_system_time = opentelemetry::common::SystemTimestamp(start_time);
  if (auto wrapped_parent = std::dynamic_pointer_cast<otel_span_context>(parent); wrapped_parent) {
    opts.parent = wrapped_parent->span_context();
  }
  auto span = tracer_->StartSpan(operation_name, opts);
  if (kind == reference_kind::follows_from) {
    span->SetAttribute(core::tracing::attributes::reference, core::tracing::attributes::follows_from);
  }
  return std::make_shared<otel_span>(std::move(span));
}

auto
otel_backend::inject(const std::shared_ptr<external_span_context>& context,
                     serialization_format /* format */,
                     const writer& write) -> std::error_code
{
  auto wrapped = std::dynamic_pointer_cast<otel_span_context>(context);
  if (wrapped == nullptr || !wrapped->span_context().IsValid()) {
    return errc::tracing::backend_failure;
  }
  opentelemetry::context::Context otel_context{};
  opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span{ new opentelemetry::trace::DefaultSpan(
    wrapped->span_context()) };
  otel_context = opentelemetry::trace::SetSpan(otel_context, span);

  writer_carrier carrier{ write };
  opentelemetry::trace::propagation::HttpTraceContext{}.Inject(carrier, otel_context);
  return {};
}

auto
otel_backend::extract(serialization_format /* format */, const std::map<std::string, std::string>& fields)
  -> tl::expected<std::shared_ptr<external_span_context>, std::error_code>
{
  const reader_carrier carrier{ fields };
  opentelemetry::context::Context otel_context{};
  auto extracted = opentelemetry::trace::propagation::HttpTraceContext{}.Extract(carrier, otel_context);
  auto span_context = opentelemetry::trace::GetSpan(extracted)->GetContext();
  if (!span_context.IsValid()) {
    SL_LOG_DEBUG("no valid trace context among {} OpenTelemetry fields", fields.size());
    return tl::unexpected(make_error_code(errc::tracing::backend_failure));
  }
  return std::make_shared<otel_span_context>(span_context);
}
} // namespace spanline::tracing
