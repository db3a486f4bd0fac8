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

#include <spanline/error_codes.hxx>

#include <string>

namespace spanline::core::impl
{

struct tracing_error_category : std::error_category {
    [[nodiscard]] const char* name() const noexcept override
    {
        return "spanline.tracing";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override
    {
        switch (static_cast<errc::tracing>(ev)) {
            case errc::tracing::unsupported_carrier:
                return "unsupported_carrier (1)";
            case errc::tracing::span_context_corrupted:
                return "span_context_corrupted (2)";
            case errc::tracing::backend_failure:
                return "backend_failure (3)";
            case errc::tracing::stop_iteration:
                return "stop_iteration (4)";
            case errc::tracing::recording_corrupted:
                return "recording_corrupted (5)";
        }
        return "FIXME: unknown error code (recompile with newer library): spanline.tracing." + std::to_string(ev);
    }
};

const inline static tracing_error_category category_instance;

const std::error_category&
tracing_category() noexcept
{
    return category_instance;
}
} // namespace spanline::core::impl
