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

#include <memory>
#include <string>

namespace spanline::core::tracing
{
/**
 * The external backend as attached to a tracer. Spans capture the instance that was current when
 * they were created, so replacing it never affects spans that are already running.
 */
class shadow_tracer
{
public:
  explicit shadow_tracer(std::shared_ptr<spanline::tracing::external_backend> backend);

  [[nodiscard]] auto type() const -> const std::string&
  {
    return type_;
  }

  [[nodiscard]] auto backend() const -> const std::shared_ptr<spanline::tracing::external_backend>&
  {
    return backend_;
  }

  void close();

private:
  std::shared_ptr<spanline::tracing::external_backend> backend_;
  std::string type_;
};

struct shadow_span {
  std::shared_ptr<shadow_tracer> tracer;
  std::shared_ptr<spanline::tracing::external_span> span;
};
} // namespace spanline::core::tracing
