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

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace spanline::tracing
{
/**
 * A single configuration value owned by the embedding application.
 *
 * The tracer reads current_value() when it is configured and again whenever a registered
 * callback fires.
 */
template<typename T>
class setting
{
  public:
    using callback = std::function<void()>;

    setting() = default;
    setting(const setting& other) = delete;
    setting(setting&& other) = delete;
    setting& operator=(const setting& other) = delete;
    setting& operator=(setting&& other) = delete;
    virtual ~setting() = default;

    [[nodiscard]] virtual T current_value() const = 0;

    virtual void on_change(callback cb) = 0;
};

/**
 * In-memory setting, for applications without a settings framework of their own and for tests.
 *
 * Callbacks run on the thread calling set(), after the new value is visible, and without any
 * lock held.
 */
template<typename T>
class mutable_setting : public setting<T>
{
  public:
    explicit mutable_setting(T initial = T{})
      : value_{ std::move(initial) }
    {
    }

    [[nodiscard]] T current_value() const override
    {
        const std::scoped_lock lock(mutex_);
        return value_;
    }

    void on_change(typename setting<T>::callback cb) override
    {
        const std::scoped_lock lock(mutex_);
        callbacks_.emplace_back(std::move(cb));
    }

    void set(T value)
    {
        std::vector<typename setting<T>::callback> callbacks;
        {
            const std::scoped_lock lock(mutex_);
            value_ = std::move(value);
            callbacks = callbacks_;
        }
        for (const auto& cb : callbacks) {
            cb();
        }
    }

  private:
    mutable std::mutex mutex_{};
    T value_;
    std::vector<typename setting<T>::callback> callbacks_{};
};
} // namespace spanline::tracing
