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

#include "logger.hxx"

#include "configuration.hxx"

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <memory>
#include <utility>
#include <vector>

namespace spanline::core::logger
{
namespace
{
const std::string logger_name{ "spanline" };
const std::string default_pattern{ "[%Y-%m-%d %T.%e] [%^%4!l%$] [%P,%t] %v" };

// swapped atomically, every log call takes its own reference
std::shared_ptr<spdlog::logger> current_logger{};

static_assert(static_cast<int>(level::trace) == spdlog::level::trace);
static_assert(static_cast<int>(level::critical) == spdlog::level::critical);
static_assert(static_cast<int>(level::off) == spdlog::level::off);

auto
to_spdlog(level lvl) -> spdlog::level::level_enum
{
  return static_cast<spdlog::level::level_enum>(lvl);
}

auto
current() -> std::shared_ptr<spdlog::logger>
{
  return std::atomic_load(&current_logger);
}

void
install(std::shared_ptr<spdlog::logger> logger)
{
  if (auto previous = std::atomic_exchange(&current_logger, std::move(logger)); previous) {
    previous->flush();
  }
}
} // namespace

auto
level_from_str(std::string_view name) -> std::optional<level>
{
  static const std::array<std::pair<std::string_view, level>, 9> names{ {
    { "trace", level::trace },
    { "debug", level::debug },
    { "info", level::info },
    { "warn", level::warn },
    { "warning", level::warn },
    { "err", level::err },
    { "error", level::err },
    { "critical", level::critical },
    { "off", level::off },
  } };
  for (const auto& [candidate, lvl] : names) {
    if (candidate == name) {
      return lvl;
    }
  }
  return {};
}

auto
create_logger(const configuration& settings) -> std::optional<std::string>
{
  try {
    std::vector<spdlog::sink_ptr> sinks{};
    if (settings.console) {
      auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console->set_level(to_spdlog(settings.console_log_level));
      sinks.emplace_back(std::move(console));
    }
    if (settings.sink) {
      sinks.emplace_back(settings.sink);
    }
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_pattern(settings.pattern.empty() ? default_pattern : settings.pattern);
    logger->set_level(to_spdlog(settings.log_level));
    logger->flush_on(spdlog::level::warn);
    install(std::move(logger));
  } catch (const spdlog::spdlog_ex& e) {
    return fmt::format("unable to create logger: {}", e.what());
  }
  return {};
}

void
create_blackhole_logger()
{
  auto logger = std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::off);
  install(std::move(logger));
}

void
reset()
{
  install(nullptr);
}

void
set_log_levels(level lvl)
{
  if (auto logger = current(); logger) {
    logger->set_level(to_spdlog(lvl));
  }
}

auto
should_log(level lvl) -> bool
{
  if (auto logger = current(); logger) {
    return logger->should_log(to_spdlog(lvl));
  }
  return false;
}

void
flush()
{
  if (auto logger = current(); logger) {
    logger->flush();
  }
}

auto
is_initialized() -> bool
{
  return current() != nullptr;
}

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg)
{
  if (auto logger = current(); logger) {
    logger->log(spdlog::source_loc{ file, line, function }, to_spdlog(lvl), msg);
  }
}
} // namespace detail
} // namespace spanline::core::logger
