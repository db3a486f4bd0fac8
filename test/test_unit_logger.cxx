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

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/sinks/ostream_sink.h>

#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace
{
auto
create_stream_logger(std::ostringstream& stream, spanline::core::logger::level level, std::string pattern = {})
  -> std::optional<std::string>
{
  spanline::core::logger::configuration configuration{};
  configuration.console = false;
  configuration.log_level = level;
  configuration.sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
  configuration.pattern = std::move(pattern);
  return spanline::core::logger::create_logger(configuration);
}
} // namespace

TEST_CASE("unit: logger writes to a custom sink", "[unit]")
{
  std::ostringstream stream;
  REQUIRE_FALSE(create_stream_logger(stream, spanline::core::logger::level::debug).has_value());
  REQUIRE(spanline::core::logger::is_initialized());

  SL_LOG_DEBUG("attached backend \"{}\"", "fake");
  SL_LOG_TRACE("not visible {}", 1);
  spanline::core::logger::flush();

  auto output = stream.str();
  REQUIRE(output.find(R"(attached backend "fake")") != std::string::npos);
  REQUIRE(output.find("not visible") == std::string::npos);

  spanline::core::logger::reset();
  test::utils::init_logger();
}

TEST_CASE("unit: logger applies the configured pattern", "[unit]")
{
  std::ostringstream stream;
  REQUIRE_FALSE(create_stream_logger(stream, spanline::core::logger::level::info, "%l|%v").has_value());

  SL_LOG_INFO("tracing mode changed to {}", "background");
  SL_LOG_WARNING("backend {} failed", 7);
  spanline::core::logger::flush();

  REQUIRE(stream.str() == "info|tracing mode changed to background\nwarning|backend 7 failed\n");

  spanline::core::logger::reset();
  test::utils::init_logger();
}

TEST_CASE("unit: logger levels", "[unit]")
{
  std::ostringstream stream;
  REQUIRE_FALSE(create_stream_logger(stream, spanline::core::logger::level::warn).has_value());
  REQUIRE_FALSE(spanline::core::logger::should_log(spanline::core::logger::level::info));
  REQUIRE(spanline::core::logger::should_log(spanline::core::logger::level::err));

  spanline::core::logger::set_log_levels(spanline::core::logger::level::trace);
  REQUIRE(spanline::core::logger::should_log(spanline::core::logger::level::trace));
  SL_LOG_TRACE("now visible");
  spanline::core::logger::flush();
  REQUIRE(stream.str().find("now visible") != std::string::npos);

  REQUIRE(spanline::core::logger::level_from_str("debug") == spanline::core::logger::level::debug);
  REQUIRE(spanline::core::logger::level_from_str("warning") == spanline::core::logger::level::warn);
  REQUIRE(spanline::core::logger::level_from_str("error") == spanline::core::logger::level::err);
  REQUIRE(spanline::core::logger::level_from_str("off") == spanline::core::logger::level::off);
  REQUIRE_FALSE(spanline::core::logger::level_from_str("verbose").has_value());
  REQUIRE_FALSE(spanline::core::logger::level_from_str("DEBUG").has_value());

  spanline::core::logger::reset();
  test::utils::init_logger();
}

TEST_CASE("unit: logging without a logger is a no-op", "[unit]")
{
  spanline::core::logger::reset();
  REQUIRE_FALSE(spanline::core::logger::is_initialized());
  REQUIRE_FALSE(spanline::core::logger::should_log(spanline::core::logger::level::critical));
  SL_LOG_CRITICAL("dropped {}", 42);
  spanline::core::logger::flush();

  spanline::core::logger::create_blackhole_logger();
  REQUIRE(spanline::core::logger::is_initialized());
  REQUIRE_FALSE(spanline::core::logger::should_log(spanline::core::logger::level::critical));

  spanline::core::logger::reset();
  test::utils::init_logger();
}
