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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_CANCELLATION_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_CANCELLATION_HPP

#include <atomic>
#include <memory>

/// \brief Shared flag to abort in-flight cache operations, e.g. on user
/// interrupt. Copies observe the same flag.
class CancellationToken {
  public:
    CancellationToken() : flag_{std::make_shared<std::atomic<bool>>(false)} {}

    void Cancel() const noexcept { flag_->store(true); }

    [[nodiscard]] auto IsCancelled() const noexcept -> bool {
        return flag_->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_CANCELLATION_HPP
