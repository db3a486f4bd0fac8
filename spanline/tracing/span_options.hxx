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
#include <spanline/tracing/log_tags.hxx>
#include <spanline/tracing/recording_type.hxx>
#include <spanline/tracing/span_meta.hxx>

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace spanline::tracing
{
class span;

/**
 * Options for tracer#start_span() and tracer#start_span_ctx().
 */
class span_options
{
  public:
    /**
     * Immutable value object representing consistent options.
     */
    struct built {
        const std::shared_ptr<tracing::span> parent;
        const std::optional<span_meta> remote_parent;
        const bool force_real_span;
        const std::optional<tracing::recording_type> recording;
        const std::map<std::string, std::string> tags;
        const std::optional<tracing::log_tags> log_tags;
        const bool bypass_registry;
        const reference_kind reference;
    };

    /**
     * Validates options and returns them as an immutable value.
     *
     * @exception std::invalid_argument if both a local and a remote parent were given. This is a
     * programming error on the caller's side, the span is not created.
     */
    [[nodiscard]] auto build() const -> built
    {
        if (parent_ != nullptr && remote_parent_.has_value()) {
            throw std::invalid_argument("span_options: can't specify both a local parent and a remote parent");
        }
        return { parent_, remote_parent_, force_real_span_, recording_, tags_, log_tags_, bypass_registry_, reference_ };
    }

    /**
     * Derives the span from a span of this process. The child's recording is folded into the
     * parent when the child finishes.
     *
     * @param parent the parent span, nullptr is the same as not setting a parent
     */
    auto parent(std::shared_ptr<tracing::span> parent) -> span_options&
    {
        parent_ = std::move(parent);
        return *this;
    }

    /**
     * Derives the span from metadata received from another process (or exported through
     * span#meta()). The caller is responsible for shipping the recording back.
     *
     * A meta that denotes "no tracing" is ignored.
     */
    auto remote_parent(span_meta meta) -> span_options&
    {
        if (meta.is_noop()) {
            remote_parent_.reset();
        } else {
            remote_parent_ = std::move(meta);
        }
        return *this;
    }

    /**
     * Creates a real span even if the tracer would otherwise hand out its noop span.
     */
    auto force_real_span(bool force = true) -> span_options&
    {
        force_real_span_ = force;
        return *this;
    }

    /**
     * Overrides the recording type that would be inherited from the parent.
     */
    auto recording(tracing::recording_type type) -> span_options&
    {
        recording_ = type;
        return *this;
    }

    auto tag(const std::string& key, const std::string& value) -> span_options&
    {
        tags_[key] = value;
        return *this;
    }

    auto tags(std::map<std::string, std::string> tags) -> span_options&
    {
        tags_ = std::move(tags);
        return *this;
    }

    /**
     * Replaces the log tags that would be taken from the context (or the parent span).
     */
    auto log_tags(tracing::log_tags tags) -> span_options&
    {
        log_tags_ = std::move(tags);
        return *this;
    }

    /**
     * Keeps a root span out of the tracer's registry of active spans.
     */
    auto bypass_registry(bool bypass = true) -> span_options&
    {
        bypass_registry_ = bypass;
        return *this;
    }

    auto follows_from() -> span_options&
    {
        reference_ = reference_kind::follows_from;
        return *this;
    }

  private:
    std::shared_ptr<tracing::span> parent_{};
    std::optional<span_meta> remote_parent_{};
    bool force_real_span_{ false };
    std::optional<tracing::recording_type> recording_{};
    std::map<std::string, std::string> tags_{};
    std::optional<tracing::log_tags> log_tags_{};
    bool bypass_registry_{ false };
    reference_kind reference_{ reference_kind::child_of };
};
} // namespace spanline::tracing
