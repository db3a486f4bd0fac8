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

#include "shadow_tracer.hxx"

#include "core/logger/logger.hxx"

#include <utility>

namespace spanline::core::tracing
{
shadow_tracer::shadow_tracer(std::shared_ptr<spanline::tracing::external_backend> backend)
  : backend_{ std::move(backend) }
  , type_{ backend_->type() }
{
}

void
shadow_tracer::close()
{
  SL_LOG_INFO("closing external tracing backend, type=\"{}\"", type_);
  backend_->close();
}
} // namespace spanline::core::tracing
