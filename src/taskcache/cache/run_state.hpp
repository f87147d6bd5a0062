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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_RUN_STATE_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_RUN_STATE_HPP

#include <atomic>
#include <cstddef>

/// \brief State shared by all stores of one run. Counts failed remote
/// requests; once the maximum is reached, the remote cache is skipped for
/// the rest of the run.
/// The entire class is thread-safe.
class RunState {
  public:
    static constexpr std::size_t kDefaultMaxRemoteFailures = 3;

    explicit RunState(std::size_t max_remote_failures =
                          kDefaultMaxRemoteFailures) noexcept
        : max_remote_failures_{max_remote_failures} {}

    /// \brief Record a failed remote request.
    /// \returns True if this failure tripped the breaker.
    auto RecordRemoteFailure() noexcept -> bool {
        return ++remote_failures_ == max_remote_failures_;
    }

    [[nodiscard]] auto RemoteFailures() const noexcept -> std::size_t {
        return remote_failures_.load();
    }

    [[nodiscard]] auto IsRemoteTripped() const noexcept -> bool {
        return remote_failures_.load() >= max_remote_failures_;
    }

    /// \brief True exactly once, for the first caller after the breaker
    /// tripped. Used to warn about the degraded cache only once.
    [[nodiscard]] auto ClaimTripWarning() noexcept -> bool {
        return IsRemoteTripped() and not trip_warned_.exchange(true);
    }

  private:
    std::size_t max_remote_failures_;
    std::atomic<std::size_t> remote_failures_{};
    std::atomic<bool> trip_warned_{};
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_RUN_STATE_HPP
