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

#include <spanline/error_codes.hxx>
#include <spanline/tracing/tracer.hxx>

#include <fmt/core.h>

using spanline::tracing::span_options;

namespace
{
class unknown_carrier : public spanline::tracing::carrier
{
public:
  void set(std::string_view /* key */, std::string_view /* value */) override
  {
    ++writes;
  }

  std::error_code for_each(const visitor& /* fn */) const override
  {
    return {};
  }

  std::size_t writes{ 0 };
};

auto
tracer_with_backend(const std::string& type, std::shared_ptr<test::utils::fake_backend>& backend)
  -> std::shared_ptr<spanline::tracing::tracer>
{
  auto tracer = spanline::tracing::tracer::create();
  backend = std::make_shared<test::utils::fake_backend>(type);
  spanline::tracing::tracer_configuration configuration{};
  configuration.backends.push_back({ std::make_shared<spanline::tracing::mutable_setting<std::string>>("on"),
                                     [backend](const std::string& /* value */) {
                                       return backend;
                                     } });
  tracer->configure(configuration);
  return tracer;
}
} // namespace

TEST_CASE("unit: span metadata survives a round trip through both carriers", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();
  auto span = tracer->start_span("op", span_options{}.force_real_span());
  span->set_baggage_item("user", "admin");
  span->set_baggage_item("tenant", "42");
  auto meta = span->meta();

  SECTION("map carrier")
  {
    spanline::tracing::map_carrier carrier;
    auto ec = tracer->inject_meta_into(meta, carrier);
    REQUIRE_SUCCESS(ec);
    REQUIRE(carrier.map().at("crdb-tracer-traceid") == fmt::format("{:x}", meta.trace_id));
    REQUIRE(carrier.map().at("crdb-tracer-spanid") == fmt::format("{:x}", meta.span_id));
    REQUIRE(carrier.map().at("crdb-baggage-user") == "admin");
    REQUIRE(carrier.map().count("crdb-tracer-shadowtype") == 0);

    auto extracted = tracer->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->trace_id == meta.trace_id);
    REQUIRE(extracted->span_id == meta.span_id);
    REQUIRE(extracted->baggage == meta.baggage);
    REQUIRE(extracted->recording_type == spanline::tracing::recording_type::off);
  }

  SECTION("metadata carrier")
  {
    spanline::tracing::metadata_carrier carrier;
    auto ec = tracer->inject_meta_into(meta, carrier);
    REQUIRE_SUCCESS(ec);
    REQUIRE(carrier.metadata().size() == 4);

    auto extracted = tracer->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->trace_id == meta.trace_id);
    REQUIRE(extracted->span_id == meta.span_id);
    REQUIRE(extracted->baggage == meta.baggage);
  }
}

TEST_CASE("unit: extraction ignores the case of keys", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();

  SECTION("map carrier")
  {
    spanline::tracing::map_carrier carrier{ {
      { "Crdb-Tracer-TraceId", "A" },
      { "CRDB-TRACER-SPANID", "b" },
      { "Crdb-Baggage-Region", "west" },
      { "content-type", "application/grpc" },
    } };
    auto extracted = tracer->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->trace_id == 10);
    REQUIRE(extracted->span_id == 11);
    REQUIRE(extracted->baggage == std::map<std::string, std::string>{ { "region", "west" } });
  }

  SECTION("metadata carrier lower-cases keys on the way in")
  {
    spanline::tracing::metadata_carrier carrier{ {
      { "CRDB-TRACER-TRACEID", "1f" },
      { "Crdb-Tracer-SpanId", "20" },
    } };
    REQUIRE(carrier.metadata().count("crdb-tracer-traceid") == 1);
    auto extracted = tracer->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->trace_id == 31);
    REQUIRE(extracted->span_id == 32);
  }
}

TEST_CASE("unit: baggage keys come back lower-cased", "[unit]")
{
  test::utils::init_logger();
  auto sender = spanline::tracing::tracer::create();
  auto receiver = spanline::tracing::tracer::create();

  auto span = sender->start_span("op", span_options{}.force_real_span());
  span->set_baggage_item("User-Name", "Admin");
  auto meta = span->meta();

  spanline::tracing::map_carrier carrier;
  auto ec = sender->inject_meta_into(meta, carrier);
  REQUIRE_SUCCESS(ec);
  REQUIRE(carrier.map().at("crdb-baggage-User-Name") == "Admin");

  auto extracted = receiver->extract_meta_from(carrier);
  EXPECT_SUCCESS(extracted);
  REQUIRE(extracted->trace_id == meta.trace_id);
  REQUIRE(extracted->baggage == std::map<std::string, std::string>{ { "user-name", "Admin" } });
  span->finish();
}

TEST_CASE("unit: carriers without identifiers mean no tracing", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();

  spanline::tracing::map_carrier carrier{ { { "crdb-baggage-user", "admin" } } };
  auto extracted = tracer->extract_meta_from(carrier);
  EXPECT_SUCCESS(extracted);
  REQUIRE(extracted->is_noop());
  REQUIRE(extracted->baggage.empty());

  spanline::tracing::map_carrier destination;
  auto ec = tracer->inject_meta_into(spanline::tracing::span_meta{}, destination);
  REQUIRE_SUCCESS(ec);
  REQUIRE(destination.map().empty());
  ec = tracer->inject_meta_into(tracer->noop_span()->meta(), destination);
  REQUIRE_SUCCESS(ec);
  REQUIRE(destination.map().empty());
}

TEST_CASE("unit: malformed identifiers are reported", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();

  for (const auto* value : { "xyz", "", "0x10", "1ffffffffffffffff", "-1", "12 " }) {
    INFO(value);
    spanline::tracing::map_carrier carrier{ { { "crdb-tracer-traceid", value }, { "crdb-tracer-spanid", "1" } } };
    auto extracted = tracer->extract_meta_from(carrier);
    REQUIRE_FALSE(extracted);
    REQUIRE(extracted.error() == spanline::errc::tracing::span_context_corrupted);
  }
}

TEST_CASE("unit: unsupported carriers are rejected unless there is nothing to inject", "[unit]")
{
  test::utils::init_logger();
  auto tracer = spanline::tracing::tracer::create();
  auto span = tracer->start_span("op", span_options{}.force_real_span());

  unknown_carrier carrier;
  REQUIRE(carrier.kind() == spanline::tracing::carrier_kind::unknown);
  REQUIRE(tracer->inject_meta_into(span->meta(), carrier) == spanline::errc::tracing::unsupported_carrier);
  REQUIRE(carrier.writes == 0);

  auto ec = tracer->inject_meta_into(spanline::tracing::span_meta{}, carrier);
  REQUIRE_SUCCESS(ec);
  ec = tracer->inject_meta_into(tracer->noop_span()->meta(), carrier);
  REQUIRE_SUCCESS(ec);
  REQUIRE(carrier.writes == 0);

  auto extracted = tracer->extract_meta_from(carrier);
  REQUIRE_FALSE(extracted);
  REQUIRE(extracted.error() == spanline::errc::tracing::unsupported_carrier);
}

TEST_CASE("unit: verbose baggage item turns on recording", "[unit]")
{
  test::utils::init_logger();
  auto sender = spanline::tracing::tracer::create();
  auto receiver = spanline::tracing::tracer::create();

  auto span = sender->start_span("op", span_options{}.recording(spanline::tracing::recording_type::verbose));
  spanline::tracing::metadata_carrier carrier;
  auto ec = sender->inject_meta_into(span->meta(), carrier);
  REQUIRE_SUCCESS(ec);
  REQUIRE(carrier.metadata().find("crdb-baggage-sb")->second == "1");

  auto extracted = receiver->extract_meta_from(carrier);
  EXPECT_SUCCESS(extracted);
  REQUIRE(extracted->recording_type == spanline::tracing::recording_type::verbose);

  auto remote_child = receiver->start_span("remote child", span_options{}.remote_parent(extracted.value()));
  REQUIRE_FALSE(remote_child->is_noop());
  REQUIRE(remote_child->is_recording());
  REQUIRE(remote_child->trace_id() == span->trace_id());
  REQUIRE(remote_child->get_recording()[0].parent_span_id == span->span_id());
}

TEST_CASE("unit: backend fields travel only between matching backends", "[unit]")
{
  test::utils::init_logger();
  std::shared_ptr<test::utils::fake_backend> backend;
  auto tracer = tracer_with_backend("fake", backend);
  auto span = tracer->start_span("op");
  auto meta = span->meta();
  REQUIRE(meta.backend_type == "fake");

  spanline::tracing::map_carrier carrier;
  auto ec = tracer->inject_meta_into(meta, carrier);
  REQUIRE_SUCCESS(ec);
  REQUIRE(carrier.map().at("crdb-tracer-shadowtype") == "fake");
  REQUIRE(carrier.map().at("crdb-shadow-id") == std::to_string(backend->spans()[0]->id));

  SECTION("same backend type on the receiving side")
  {
    auto extracted = tracer->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->backend_type == "fake");
    auto context = std::dynamic_pointer_cast<test::utils::fake_span_context>(extracted->backend_context);
    REQUIRE(context != nullptr);
    REQUIRE(context->id == backend->spans()[0]->id);
  }

  SECTION("different backend type on the receiving side")
  {
    std::shared_ptr<test::utils::fake_backend> other_backend;
    auto other = tracer_with_backend("other", other_backend);
    auto extracted = other->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->trace_id == meta.trace_id);
    REQUIRE(extracted->span_id == meta.span_id);
    REQUIRE(extracted->backend_type.empty());
    REQUIRE(extracted->backend_context == nullptr);

    spanline::tracing::map_carrier forwarded;
    auto forward_ec = other->inject_meta_into(meta, forwarded);
    REQUIRE_SUCCESS(forward_ec);
    REQUIRE(forwarded.map().count("crdb-tracer-shadowtype") == 0);
    REQUIRE(forwarded.map().count("crdb-shadow-id") == 0);
    REQUIRE(forwarded.map().count("crdb-tracer-traceid") == 1);
  }

  SECTION("no backend on the receiving side")
  {
    auto plain = spanline::tracing::tracer::create();
    auto extracted = plain->extract_meta_from(carrier);
    EXPECT_SUCCESS(extracted);
    REQUIRE(extracted->backend_type.empty());
  }

  SECTION("backend errors are passed through")
  {
    backend->fail_inject = true;
    spanline::tracing::map_carrier destination;
    REQUIRE(tracer->inject_meta_into(meta, destination) == spanline::errc::tracing::backend_failure);

    spanline::tracing::map_carrier incomplete{ {
      { "crdb-tracer-traceid", "1" },
      { "crdb-tracer-spanid", "2" },
      { "crdb-tracer-shadowtype", "fake" },
    } };
    auto extracted = tracer->extract_meta_from(incomplete);
    REQUIRE_FALSE(extracted);
    REQUIRE(extracted.error() == spanline::errc::tracing::backend_failure);
  }
}
