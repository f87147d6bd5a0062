// Copyright 2024 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_CONFIG_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_CONFIG_HPP

#include <algorithm>
#include <optional>
#include <string>

#include "fmt/core.h"
#include "src/taskcache/logging/log_level.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr unsigned int kDefaultInitialBackoffSeconds{2};
inline constexpr unsigned int kDefaultMaxBackoffSeconds{10};
inline constexpr unsigned int kDefaultAttempts{3};
inline constexpr auto kRetryLogLevel = LogLevel::Progress;

class RetryConfig final {
  public:
    class Builder;

    RetryConfig() = default;

    [[nodiscard]] auto GetMaxAttempts() const noexcept -> unsigned int {
        return attempts_;
    }

    /// \brief The waiting time is doubled at each \p attempt, starting from
    /// the initial backoff, until it reaches max_backoff_seconds.
    [[nodiscard]] auto GetSleepTimeSeconds(unsigned int attempt) const noexcept
        -> unsigned int {
        auto backoff = initial_backoff_seconds_;
        // on the first attempt, we don't double the backoff time
        // also we do it in a for loop to avoid overflow
        for (auto x = 1U; x < attempt; ++x) {
            backoff <<= 1U;
            if (backoff >= max_backoff_seconds_) {
                return max_backoff_seconds_;
            }
        }
        return backoff < max_backoff_seconds_ ? backoff : max_backoff_seconds_;
    }

  private:
    unsigned int initial_backoff_seconds_ = kDefaultInitialBackoffSeconds;
    unsigned int max_backoff_seconds_ = kDefaultMaxBackoffSeconds;
    unsigned int attempts_ = kDefaultAttempts;

    RetryConfig(unsigned int initial_backoff_seconds,
                unsigned int max_backoff_seconds,
                unsigned int attempts)
        : initial_backoff_seconds_{initial_backoff_seconds},
          max_backoff_seconds_{max_backoff_seconds},
          attempts_{attempts} {}
};

class RetryConfig::Builder final {
  public:
    auto SetInitialBackoffSeconds(std::optional<unsigned int> x) noexcept
        -> Builder& {
        initial_backoff_seconds_ = x;
        return *this;
    }

    auto SetMaxBackoffSeconds(std::optional<unsigned int> x) noexcept
        -> Builder& {
        max_backoff_seconds_ = x;
        return *this;
    }

    auto SetMaxAttempts(std::optional<unsigned int> x) noexcept -> Builder& {
        attempts_ = x;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<RetryConfig, std::string> {
        auto const initial =
            initial_backoff_seconds_.value_or(kDefaultInitialBackoffSeconds);
        if (initial < 1) {
            return unexpected{fmt::format(
                "Invalid initial backoff provided: {}.\nValue must be "
                "strictly greater than 0.",
                initial)};
        }
        auto const max = max_backoff_seconds_.value_or(
            std::max(initial, kDefaultMaxBackoffSeconds));
        if (max < initial) {
            return unexpected{fmt::format(
                "Invalid max backoff provided: {}.\nValue must not be "
                "smaller than the initial backoff of {} seconds.",
                max,
                initial)};
        }
        auto const attempts = attempts_.value_or(kDefaultAttempts);
        if (attempts < 1) {
            return unexpected{
                fmt::format("Invalid max number of attempts provided: "
                            "{}.\nValue must be strictly greater than 0.",
                            attempts)};
        }
        return RetryConfig(initial, max, attempts);
    }

  private:
    std::optional<unsigned int> initial_backoff_seconds_;
    std::optional<unsigned int> max_backoff_seconds_;
    std::optional<unsigned int> attempts_;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_CONFIG_HPP
