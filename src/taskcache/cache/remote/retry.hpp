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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "src/taskcache/cache/remote/retry_config.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

// Outcome of a single attempt.
//
// Please note that it is user's responsibility to do not set both to true.
struct RetryResponse {
    // When set to true, it means the function successfully run
    bool ok = false;
    // When set to true, it means that it is not worthy to retry.
    bool exit_retry_loop = false;
    // error message logged when exit_retry_loop was set to true or when the
    // last retry attempt failed
    std::optional<std::string> error_msg = std::nullopt;
};

using CallableReturningRetryResponse = std::function<RetryResponse(void)>;

/// \brief Waits between two attempts. Replaceable so that callers can make
/// the wait interruptible and tests can skip it.
using SleepFunction = std::function<void(std::chrono::seconds)>;

/// \brief Blocks the calling thread for the full duration.
[[nodiscard]] auto ThreadSleep() -> SleepFunction;

/// \brief Calls a function with a retry strategy using a backoff algorithm.
/// Retry loop interrupts when one of the two members of the function's returned
/// RetryResponse object is set to true. An empty \p sleep blocks the thread
/// between attempts.
[[nodiscard]] auto WithRetry(CallableReturningRetryResponse const& f,
                             RetryConfig const& retry_config,
                             Logger const& logger,
                             SleepFunction const& sleep,
                             LogLevel fatal_log_level = LogLevel::Warning)
    noexcept -> bool;

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_RETRY_HPP
