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

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace test::utils
{
struct fake_span_context : public spanline::tracing::external_span_context {
  explicit fake_span_context(std::uint64_t span_id)
    : id{ span_id }
  {
  }

  std::uint64_t id;
};

/**
 * What a fake_span went through, kept alive by the backend for inspection.
 */
struct fake_span_state {
  std::string operation{};
  std::uint64_t id{ 0 };
  std::uint64_t parent_id{ 0 };
  spanline::tracing::reference_kind kind{ spanline::tracing::reference_kind::child_of };
  std::map<std::string, std::string> tags{};
  std::map<std::string, std::string> baggage{};
  std::vector<std::string> logs{};
  bool finished{ false };
};

class fake_span : public spanline::tracing::external_span
{
public:
  explicit fake_span(std::shared_ptr<fake_span_state> state);

  void set_tag(const std::string& name, const std::string& value) override;
  void set_tag(const std::string& name, std::uint64_t value) override;
  void set_baggage_item(const std::string& name, const std::string& value) override;
  void log(const std::string& message) override;
  void finish() override;

  [[nodiscard]] auto context() const -> std::shared_ptr<spanline::tracing::external_span_context> override;

private:
  mutable std::mutex mutex_{};
  std::shared_ptr<fake_span_state> state_;
};

/**
 * In-memory external backend. Its context travels as a single "id" field.
 */
class fake_backend : public spanline::tracing::external_backend
{
public:
  explicit fake_backend(std::string type = "fake");

  [[nodiscard]] auto type() const -> std::string override
  {
    return type_;
  }

  auto start_span(const std::shared_ptr<spanline::tracing::external_span_context>& parent,
                  spanline::tracing::reference_kind kind,
                  const std::string& operation_name,
                  std::chrono::system_clock::time_point start_time)
    -> std::shared_ptr<spanline::tracing::external_span> override;

  auto inject(const std::shared_ptr<spanline::tracing::external_span_context>& context,
              spanline::tracing::serialization_format format,
              const writer& write) -> std::error_code override;

  auto extract(spanline::tracing::serialization_format format, const std::map<std::string, std::string>& fields)
    -> tl::expected<std::shared_ptr<spanline::tracing::external_span_context>, std::error_code> override;

  void close() override;

  [[nodiscard]] auto spans() const -> std::vector<std::shared_ptr<fake_span_state>>;
  [[nodiscard]] auto find_span(const std::string& operation) const -> std::shared_ptr<fake_span_state>;
  [[nodiscard]] auto is_closed() const -> bool;

  std::atomic_bool fail_inject{ false };

private:
  const std::string type_;
  std::atomic_bool closed_{ false };
  std::atomic<std::uint64_t> next_id_{ 1 };
  mutable std::mutex mutex_{};
  std::vector<std::shared_ptr<fake_span_state>> spans_{};
};
} // namespace test::utils
