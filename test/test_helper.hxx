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

#include "utils/fake_backend.hxx"
#include "utils/logger.hxx"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <fmt/core.h>

#include <system_error>

/**
 * This will make Catch2 show the category and message of an error code when used in an assertion that fails.
 */
template<>
struct Catch::StringMaker<std::error_code> {
  static auto convert(const std::error_code& ec) -> std::string
  {
    return fmt::format("std::error_code{{ {}: {} ({}) }}", ec.category().name(), ec.message(), ec.value());
  }
};

#define REQUIRE_SUCCESS(ec)                                                                        \
  INFO((ec).message());                                                                            \
  REQUIRE_FALSE(ec)
#define EXPECT_SUCCESS(result)                                                                     \
  if (!(result)) {                                                                                 \
    INFO((result).error().message());                                                              \
  }                                                                                                \
  REQUIRE(result)
