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

#include "test_helper.hxx"

#include <spanline/tracing/propagation.hxx>
#include <spanline/tracing/span.hxx>
#include <spanline/tracing/tracer.hxx>

using spanline::tracing::span_options;

TEST_CASE("unit: nothing is derived from an empty context", "[unit]")
{
  test::utils::init_logger();
  spanline::tracing::trace_context ctx = spanline::tracing::trace_context{}.with_log_tag("n", "1");

  auto [forked_ctx, forked] = spanline::tracing::fork_span(ctx, "fork");
  REQUIRE(forked == nullptr);
  REQUIRE(forked_ctx.span() == nullptr);
  REQUIRE(forked_ctx.log_tags().to_string() == "n1");

  auto [child_ctx, child] = spanline::tracing::child_span(ctx, "child");
  REQUIRE(child == nullptr);
  REQUIRE(child_ctx.span() == nullptr);

  auto [remote_ctx, remote] = spanline::tracing::child_span_remote(ctx, "remote");
  REQUIRE(remote == nullptr);
  REQUIRE(remote_ctx.span() == nullptr);
}

TEST_CASE("unit: child spans fold into the context span", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();
  auto [ctx, root] = tracer->start_span_ctx({}, "root", span_options{}.force_real_span());
  REQUIRE(ctx.span() == root);

  SECTION("child")
  {
    auto [child_ctx, child] = spanline::tracing::child_span(ctx, "child");
    REQUIRE(child != nullptr);
    REQUIRE(child_ctx.span() == child);
    REQUIRE(child->trace_id() == root->trace_id());
    child->finish();

    auto rec = root->get_recording();
    REQUIRE(rec.size() == 2);
    REQUIRE(rec[1].operation == "child");
    REQUIRE(rec[1].parent_span_id == root->span_id());
    REQUIRE(rec[1].tags.count("span.reference") == 0);
  }

  SECTION("fork")
  {
    auto [fork_ctx, forked] = spanline::tracing::fork_span(ctx, "async work");
    REQUIRE(forked != nullptr);
    REQUIRE(fork_ctx.span() == forked);
    root->finish();
    forked->finish();

    auto rec = root->get_recording();
    auto found = spanline::tracing::find_span(rec, "async work");
    REQUIRE(found.has_value());
    REQUIRE(found->parent_span_id == root->span_id());
    REQUIRE(found->tags.at("span.reference") == "follows_from");
  }

  SECTION("remote child")
  {
    auto [remote_ctx, remote] = spanline::tracing::child_span_remote(ctx, "remote");
    REQUIRE(remote != nullptr);
    REQUIRE(remote->trace_id() == root->trace_id());
    REQUIRE(remote->get_recording()[0].parent_span_id == root->span_id());
    remote->finish();
    REQUIRE(root->get_recording().size() == 1);

    root->import_remote_spans(remote->get_recording());
    REQUIRE(root->get_recording().size() == 2);
  }
}

TEST_CASE("unit: ensure_child_span always returns a span", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();

  SECTION("empty context gets a root span")
  {
    auto [ctx, sp] = spanline::tracing::ensure_child_span({}, tracer, "root");
    REQUIRE(sp != nullptr);
    REQUIRE(sp->is_noop());
    REQUIRE(ctx.span() == sp);

    auto [real_ctx, real] = spanline::tracing::ensure_child_span({}, tracer, "root", span_options{}.force_real_span());
    REQUIRE_FALSE(real->is_noop());
    REQUIRE(real_ctx.span() == real);
  }

  SECTION("context span becomes the parent")
  {
    auto [ctx, root] = tracer->start_span_ctx({}, "root", span_options{}.force_real_span());
    auto [child_ctx, child] = spanline::tracing::ensure_child_span(ctx, tracer, "child");
    REQUIRE_FALSE(child->is_noop());
    REQUIRE(child->trace_id() == root->trace_id());
    child->finish();
    REQUIRE(spanline::tracing::find_span(root->get_recording(), "child").has_value());
  }

  SECTION("explicit parent wins over the context")
  {
    auto [ctx, first] = tracer->start_span_ctx({}, "first", span_options{}.force_real_span());
    auto second = tracer->start_span("second", span_options{}.force_real_span());
    auto [child_ctx, child] = spanline::tracing::ensure_child_span(ctx, tracer, "child", span_options{}.parent(second));
    REQUIRE(child->trace_id() == second->trace_id());
    child->finish();
    REQUIRE(second->get_recording().size() == 2);
    REQUIRE(first->get_recording().size() == 1);
  }
}

TEST_CASE("unit: verbose trace records everything below it", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();

  auto [ctx, root] = spanline::tracing::start_verbose_trace({}, tracer, "request");
  REQUIRE_FALSE(root->is_noop());
  REQUIRE(root->is_recording());
  REQUIRE(root->baggage_item("sb") == "1");

  auto [child_ctx, child] = spanline::tracing::child_span(ctx, "child");
  REQUIRE(child->is_recording());
  child->record("reading from disk");
  child->finish();
  root->finish();

  auto rec = root->get_recording();
  REQUIRE(rec.size() == 2);
  REQUIRE(rec[0].verbose);
  REQUIRE(rec[1].verbose);
  REQUIRE(spanline::tracing::find_log_message(rec, "from disk").has_value());
}

TEST_CASE("unit: recording span context collects the recording", "[unit]")
{
  test::utils::init_logger();
  auto ctx = spanline::tracing::trace_context{}.with_log_tag("s", "3");
  auto recording_ctx = spanline::tracing::context_with_recording_span(ctx, "test");
  REQUIRE(recording_ctx.ctx.span() != nullptr);
  REQUIRE(recording_ctx.ctx.span()->is_recording());

  auto [child_ctx, child] = spanline::tracing::child_span(recording_ctx.ctx, "work");
  REQUIRE(child != nullptr);
  child->recordf("processed {} keys", 42);
  child->finish();
  recording_ctx.ctx.span()->record("done");

  auto rec = recording_ctx.get_recording();
  REQUIRE(rec[0].operation == "test");
  REQUIRE(rec[0].tags.at("s") == "3");
  auto entry = spanline::tracing::find_log_message(rec, "processed 42 keys");
  REQUIRE(entry.has_value());
  REQUIRE(entry->message() == "event:processed 42 keys");
  REQUIRE(spanline::tracing::find_log_message(rec, "done").has_value());
  REQUIRE_FALSE(spanline::tracing::find_log_message(rec, "missing").has_value());

  recording_ctx.cancel();
  REQUIRE_FALSE(recording_ctx.ctx.span()->is_recording());
  REQUIRE(recording_ctx.ctx.span()->get_recording()[0].finished());
}
