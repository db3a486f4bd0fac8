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

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/tracer.h>
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace spanline::tracing
{
class otel_span_context : public external_span_context
{
public:
  explicit otel_span_context(opentelemetry::trace::SpanContext context)
    : context_(std::move(context))
  {
  }

  [[nodiscard]] auto span_context() const -> const opentelemetry::trace::SpanContext&
  {
    return context_;
  }

private:
  opentelemetry::trace::SpanContext context_;
};

class otel_span : public external_span
{
public:
  explicit otel_span(opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span)
    : span_(std::move(span))
  {
  }

  void set_tag(const std::string& name, const std::string& value) override
  {
    span_->SetAttribute(name, value);
  }

  void set_tag(const std::string& name, std::uint64_t value) override
  {
    span_->SetAttribute(name, value);
  }

  void set_baggage_item(const std::string& name, const std::string& value) override;

  void log(const std::string& message) override
  {
    span_->AddEvent(message);
  }

  void finish() override
  {
    span_->End();
  }

  [[nodiscard]] auto context() const -> std::shared_ptr<external_span_context> override
  {
    return std::make_shared<otel_span_context>(span_->GetContext());
  }

  auto wrapped_span() -> opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>
  {
    return span_;
  }

private:
  opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
};

/**
 * External backend on top of an OpenTelemetry tracer. Span contexts travel in W3C trace-context
 * form ("traceparent", "tracestate").
 */
class otel_backend : public external_backend
{
public:
  explicit otel_backend(opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer)
    : tracer_(std::move(tracer))
  {
  }

  /**
   * Uses the tracer provider registered globally with opentelemetry::trace::Provider.
   */
  static auto from_global_provider(const std::string& instrumentation_scope) -> std::shared_ptr<otel_backend>;

  [[nodiscard]] auto type() const -> std::string override
  {
    return "otel";
  }

  auto start_span(const std::shared_ptr<external_span_context>& parent,
                  reference_kind kind,
                  const std::string& operation_name,
                  std::chrono::system_clock::time_point start_time) -> std::shared_ptr<external_span> override;

  auto inject(const std::shared_ptr<external_span_context>& context, serialization_format format, const writer& write)
    -> std::error_code override;

  auto extract(serialization_format format, const std::map<std::string, std::string>& fields)
    -> tl::expected<std::shared_ptr<external_span_context>, std::error_code> override;

  /**
   * Spans already started keep working, new spans are no longer created.
   */
  void close() override
  {
    closed_ = true;
  }

private:
  opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
  std::atomic_bool closed_{ false };
};
} // namespace spanline::tracing
