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

#include <cstdint>

namespace spanline::core::platform
{
/**
 * Returns a uniformly distributed, non-zero 63-bit value (the top bit is always clear).
 *
 * Each thread draws from its own generator seeded from std::random_device.
 */
std::uint64_t
random_id();

/**
 * Identifier of the calling thread, suitable for diagnostics only.
 */
std::uint64_t
current_task_id();
} // namespace spanline::core::platform
