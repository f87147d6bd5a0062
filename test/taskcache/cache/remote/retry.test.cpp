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

#include <chrono>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/cache/remote/retry_config.hpp"
#include "src/taskcache/logging/logger.hpp"

namespace {

[[nodiscard]] auto RecordingSleep(std::vector<unsigned int>* slept)
    -> SleepFunction {
    return [slept](std::chrono::seconds duration) {
        slept->push_back(static_cast<unsigned int>(duration.count()));
    };
}

}  // namespace

TEST_CASE("Backoff doubles up to the maximum", "[retry]") {
    RetryConfig config{};
    CHECK(config.GetMaxAttempts() == 3);
    CHECK(config.GetSleepTimeSeconds(1) == 2);
    CHECK(config.GetSleepTimeSeconds(2) == 4);
    CHECK(config.GetSleepTimeSeconds(3) == 8);
    CHECK(config.GetSleepTimeSeconds(4) == 10);
    CHECK(config.GetSleepTimeSeconds(40) == 10);
}

TEST_CASE("Builder validates its input", "[retry]") {
    SECTION("defaults") {
        auto config = RetryConfig::Builder{}.Build();
        REQUIRE(config);
        CHECK(config->GetMaxAttempts() == kDefaultAttempts);
        CHECK(config->GetSleepTimeSeconds(1) == kDefaultInitialBackoffSeconds);
    }
    SECTION("zero initial backoff") {
        CHECK_FALSE(RetryConfig::Builder{}.SetInitialBackoffSeconds(0).Build());
    }
    SECTION("maximum below initial backoff") {
        CHECK_FALSE(RetryConfig::Builder{}
                        .SetInitialBackoffSeconds(5)
                        .SetMaxBackoffSeconds(3)
                        .Build());
    }
    SECTION("zero attempts") {
        CHECK_FALSE(RetryConfig::Builder{}.SetMaxAttempts(0).Build());
    }
    SECTION("large initial backoff raises the default maximum") {
        auto config =
            RetryConfig::Builder{}.SetInitialBackoffSeconds(30).Build();
        REQUIRE(config);
        CHECK(config->GetSleepTimeSeconds(2) == 30);
    }
}

TEST_CASE("WithRetry", "[retry]") {
    Logger logger{"RetryTest"};
    RetryConfig config{};
    std::vector<unsigned int> slept{};
    int calls{};

    SECTION("succeeds after transient failures") {
        auto ok = WithRetry(
            [&calls]() {
                ++calls;
                return RetryResponse{.ok = calls == 3};
            },
            config,
            logger,
            RecordingSleep(&slept));
        CHECK(ok);
        CHECK(calls == 3);
        CHECK(slept == std::vector<unsigned int>{2, 4});
    }

    SECTION("gives up after the last attempt without sleeping") {
        auto ok = WithRetry(
            [&calls]() {
                ++calls;
                return RetryResponse{.error_msg = "unavailable"};
            },
            config,
            logger,
            RecordingSleep(&slept));
        CHECK_FALSE(ok);
        CHECK(calls == 3);
        CHECK(slept.size() == 2);
    }

    SECTION("stops on a fatal response") {
        auto ok = WithRetry(
            [&calls]() {
                ++calls;
                return RetryResponse{.exit_retry_loop = true,
                                     .error_msg = "fatal"};
            },
            config,
            logger,
            RecordingSleep(&slept));
        CHECK_FALSE(ok);
        CHECK(calls == 1);
        CHECK(slept.empty());
    }
}
