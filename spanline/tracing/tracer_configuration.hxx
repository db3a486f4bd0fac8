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
#include <spanline/tracing/settings.hxx>
#include <spanline/tracing/tracing_mode.hxx>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spanline::tracing
{
/**
 * Builds an external backend from the (non-empty) value of its selecting setting, e.g. a collector
 * address or an access token. May return nullptr if the backend can't be created.
 */
using backend_factory = std::function<std::shared_ptr<external_backend>(const std::string& selection)>;

struct backend_selector {
    std::shared_ptr<setting<std::string>> selection;
    backend_factory factory;
};

/**
 * Settings the tracer follows through tracer#configure(). Unset settings read as their default
 * (legacy mode, debug sink disabled).
 */
struct tracer_configuration {
    std::shared_ptr<setting<tracing_mode>> mode{};
    std::shared_ptr<setting<bool>> debug_sink_enabled{};

    /**
     * Candidate backends in priority order: the first selector whose setting is not empty wins.
     */
    std::vector<backend_selector> backends{};

    /**
     * Settings seeded from SPANLINE_TRACE_MODE ("legacy" or "background") and SPANLINE_TRACE_DEBUG
     * ("1"/"true" enables the debug sink). The returned settings are mutable_setting instances.
     */
    static auto from_environment() -> tracer_configuration;
};
} // namespace spanline::tracing
