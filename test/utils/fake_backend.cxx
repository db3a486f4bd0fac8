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

#include "fake_backend.hxx"

#include <spanline/error_codes.hxx>

#include <string>
#include <utility>

namespace test::utils
{
fake_span::fake_span(std::shared_ptr<fake_span_state> state)
  : state_{ std::move(state) }
{
}

void
fake_span::set_tag(const std::string& name, const std::string& value)
{
  const std::scoped_lock lock(mutex_);
  state_->tags[name] = value;
}

void
fake_span::set_tag(const std::string& name, std::uint64_t value)
{
  const std::scoped_lock lock(mutex_);
  state_->tags[name] = std::to_string(value);
}

void
fake_span::set_baggage_item(const std::string& name, const std::string& value)
{
  const std::scoped_lock lock(mutex_);
  state_->baggage[name] = value;
}

void
fake_span::log(const std::string& message)
{
  const std::scoped_lock lock(mutex_);
  state_->logs.push_back(message);
}

void
fake_span::finish()
{
  const std::scoped_lock lock(mutex_);
  state_->finished = true;
}

auto
fake_span::context() const -> std::shared_ptr<spanline::tracing::external_span_context>
{
  return std::make_shared<fake_span_context>(state_->id);
}

fake_backend::fake_backend(std::string type)
  : type_{ std::move(type) }
{
}

auto
fake_backend::start_span(const std::shared_ptr<spanline::tracing::external_span_context>& parent,
                         spanline::tracing::reference_kind kind,
                         const std::string& operation_name,
                         std::chrono::system_clock::time_point /* start_time */)
  -> std::shared_ptr<spanline::tracing::external_span>
{
  if (closed_) {
    return nullptr;
  }
  auto state = std::make_shared<fake_span_state>();
  state->operation = operation_name;
  state->id = next_id_++;
  state->kind = kind;
  if (auto fake_parent = std::dynamic_pointer_cast<fake_span_context>(parent); fake_parent) {
    state->parent_id = fake_parent->id;
  }
  {
    const std::scoped_lock lock(mutex_);
    spans_.push_back(state);
  }
  return std::make_shared<fake_span>(std::move(state));
}

auto
fake_backend::inject(const std::shared_ptr<spanline::tracing::external_span_context>& context,
                     spanline::tracing::serialization_format /* format */,
                     const writer& write) -> std::error_code
{
  auto fake_context = std::dynamic_pointer_cast<fake_span_context>(context);
  if (fail_inject || fake_context == nullptr) {
    return spanline::errc::tracing::backend_failure;
  }
  write("id", std::to_string(fake_context->id));
  return {};
}

auto
fake_backend::extract(spanline::tracing::serialization_format /* format */, const std::map<std::string, std::string>& fields)
  -> tl::expected<std::shared_ptr<spanline::tracing::external_span_context>, std::error_code>
{
  auto it = fields.find("id");
  if (it == fields.end()) {
    return tl::unexpected(spanline::errc::make_error_code(spanline::errc::tracing::backend_failure));
  }
  return std::make_shared<fake_span_context>(std::stoull(it->second));
}

void
fake_backend::close()
{
  closed_ = true;
}

auto
fake_backend::spans() const -> std::vector<std::shared_ptr<fake_span_state>>
{
  const std::scoped_lock lock(mutex_);
  return spans_;
}

auto
fake_backend::find_span(const std::string& operation) const -> std::shared_ptr<fake_span_state>
{
  const std::scoped_lock lock(mutex_);
  for (const auto& state : spans_) {
    if (state->operation == operation) {
      return state;
    }
  }
  return nullptr;
}

auto
fake_backend::is_closed() const -> bool
{
  return closed_;
}
} // namespace test::utils
