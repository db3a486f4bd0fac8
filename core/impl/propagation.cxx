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

#include <spanline/tracing/propagation.hxx>

#include <spanline/tracing/span.hxx>
#include <spanline/tracing/tracer.hxx>

#include "core/logger/logger.hxx"

#include <utility>

namespace spanline::tracing
{
namespace
{
auto
derive_span(const trace_context& ctx, const std::string& operation_name, span_options options)
  -> std::pair<trace_context, std::shared_ptr<span>>
{
    auto owner = ctx.span()->tracer();
    if (owner == nullptr) {
        SL_LOG_DEBUG(R"(tracer of the context span is gone, not deriving "{}")", operation_name);
        return { ctx, nullptr };
    }
    return owner->start_span_ctx(ctx, operation_name, options);
}
} // namespace

auto
fork_span(const trace_context& ctx, const std::string& operation_name) -> std::pair<trace_context, std::shared_ptr<span>>
{
    if (ctx.span() == nullptr) {
        return { ctx, nullptr };
    }
    return derive_span(ctx, operation_name, span_options{}.parent(ctx.span()).follows_from());
}

auto
child_span(const trace_context& ctx, const std::string& operation_name) -> std::pair<trace_context, std::shared_ptr<span>>
{
    if (ctx.span() == nullptr) {
        return { ctx, nullptr };
    }
    return derive_span(ctx, operation_name, span_options{}.parent(ctx.span()));
}

auto
child_span_remote(const trace_context& ctx, const std::string& operation_name)
  -> std::pair<trace_context, std::shared_ptr<span>>
{
    if (ctx.span() == nullptr) {
        return { ctx, nullptr };
    }
    return derive_span(ctx, operation_name, span_options{}.remote_parent(ctx.span()->meta()));
}

auto
ensure_child_span(const trace_context& ctx,
                  const std::shared_ptr<tracer>& tracer,
                  const std::string& operation_name,
                  span_options options) -> std::pair<trace_context, std::shared_ptr<span>>
{
    // a parent given explicitly by the caller takes precedence over the context
    if (const auto built = options.build(); built.parent == nullptr && !built.remote_parent.has_value()) {
        options.parent(ctx.span());
    }
    return tracer->start_span_ctx(ctx, operation_name, options);
}

auto
start_verbose_trace(const trace_context& ctx, const std::shared_ptr<tracer>& tracer, const std::string& operation_name)
  -> std::pair<trace_context, std::shared_ptr<span>>
{
    auto result = ensure_child_span(ctx, tracer, operation_name, span_options{}.force_real_span());
    result.second->set_verbose(true);
    return result;
}

auto
context_with_recording_span(const trace_context& ctx, const std::string& operation_name) -> recording_span_context
{
    auto private_tracer = tracer::create();
    auto [span_ctx, sp] = private_tracer->start_span_ctx(ctx, operation_name, span_options{}.force_real_span());
    sp->set_verbose(true);

    recording_span_context result{};
    result.ctx = std::move(span_ctx);
    result.get_recording = [sp = sp]() {
        return sp->get_recording();
    };
    result.cancel = [sp = sp, private_tracer]() {
        sp->set_verbose(false);
        sp->finish();
        private_tracer->close();
    };
    return result;
}
} // namespace spanline::tracing
