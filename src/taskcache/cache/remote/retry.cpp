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

#include "src/taskcache/cache/remote/retry.hpp"

#include <algorithm>
#include <exception>
#include <thread>

#include "fmt/core.h"

auto ThreadSleep() -> SleepFunction {
    return [](std::chrono::seconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

auto WithRetry(CallableReturningRetryResponse const& f,
               RetryConfig const& retry_config,
               Logger const& logger,
               SleepFunction const& sleep,
               LogLevel fatal_log_level) noexcept -> bool {
    try {
        auto const& attempts = retry_config.GetMaxAttempts();
        for (auto attempt = 1U; attempt <= attempts; ++attempt) {
            auto [ok, fatal, error_msg] = f();
            if (ok) {
                return true;
            }
            if (fatal) {
                if (error_msg) {
                    logger.Emit(fatal_log_level, "{}", *error_msg);
                }
                return false;
            }
            // don't wait if it was the last attempt
            if (attempt < attempts) {
                auto const sleep_for_seconds =
                    retry_config.GetSleepTimeSeconds(attempt);
                logger.Emit(kRetryLogLevel,
                            "Attempt {}/{} failed{} Retrying in {} seconds.",
                            attempt,
                            attempts,
                            error_msg ? fmt::format(": {}", *error_msg) : ".",
                            sleep_for_seconds);
                auto const& wait = sleep ? sleep : ThreadSleep();
                wait(std::chrono::seconds(sleep_for_seconds));
            }
            else {
                if (error_msg) {
                    logger.Emit(fatal_log_level,
                                "After {} attempts: {}",
                                attempt,
                                *error_msg);
                }
            }
        }
    } catch (std::exception const& ex) {
        logger.Emit(std::min(fatal_log_level, LogLevel::Warning),
                    "WithRetry: caught exception: {}",
                    ex.what());
    }
    return false;
}
