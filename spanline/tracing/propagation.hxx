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

#include <spanline/tracing/recording.hxx>
#include <spanline/tracing/span_options.hxx>
#include <spanline/tracing/trace_context.hxx>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace spanline::tracing
{
class span;
class tracer;

/**
 * Forks the span carried by the context, if any. The forked span follows from the original,
 * which suits work that may outlive it (asynchronous tasks). Its recording is folded into the
 * original when it finishes.
 *
 * @return the context wrapping the new span and the span itself, or the unchanged context and
 * nullptr if the context carries no span. A non-null span must eventually be finished.
 */
auto
fork_span(const trace_context& ctx, const std::string& operation_name) -> std::pair<trace_context, std::shared_ptr<span>>;

/**
 * Like fork_span(), but the new span is a child of the original.
 */
auto
child_span(const trace_context& ctx, const std::string& operation_name) -> std::pair<trace_context, std::shared_ptr<span>>;

/**
 * Like child_span(), but derived from the parent's metadata. The recording is not folded
 * automatically: the caller ships it back and imports it into the parent.
 */
auto
child_span_remote(const trace_context& ctx, const std::string& operation_name)
  -> std::pair<trace_context, std::shared_ptr<span>>;

/**
 * Creates a child of the span carried by the context, or a new root span if there is none.
 * Never returns nullptr.
 */
auto
ensure_child_span(const trace_context& ctx,
                  const std::shared_ptr<tracer>& tracer,
                  const std::string& operation_name,
                  span_options options = {}) -> std::pair<trace_context, std::shared_ptr<span>>;

/**
 * ensure_child_span() with a real span that records verbosely.
 */
auto
start_verbose_trace(const trace_context& ctx, const std::shared_ptr<tracer>& tracer, const std::string& operation_name)
  -> std::pair<trace_context, std::shared_ptr<span>>;

struct recording_span_context {
    trace_context ctx;
    /**
     * Must be called before cancel().
     */
    std::function<recording()> get_recording;
    /**
     * Finishes the span and closes the private tracer.
     */
    std::function<void()> cancel;
};

/**
 * Starts a verbose span on a private tracer, for callers (mostly tests) that want the recording of
 * everything that happens under the returned context.
 */
auto
context_with_recording_span(const trace_context& ctx, const std::string& operation_name) -> recording_span_context;
} // namespace spanline::tracing
