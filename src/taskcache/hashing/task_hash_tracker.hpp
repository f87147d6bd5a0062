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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASH_TRACKER_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASH_TRACKER_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "src/taskcache/common/task_id.hpp"
#include "src/taskcache/hashing/environment.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Per run record of hashes computed so far.
/// The entire class is thread-safe.
class TaskHashTracker {
  public:
    TaskHashTracker() = default;
    explicit TaskHashTracker(
        std::map<TaskId, std::string> package_inputs_hashes)
        : package_inputs_hashes_{std::move(package_inputs_hashes)} {}

    [[nodiscard]] auto Hash(TaskId const& task_id) const
        -> std::optional<std::string>;

    [[nodiscard]] auto EnvVars(TaskId const& task_id) const
        -> std::optional<DetailedMap>;

    [[nodiscard]] auto PackageInputsHash(TaskId const& task_id) const
        -> std::optional<std::string>;

    [[nodiscard]] auto ExpandedOutputs(TaskId const& task_id) const
        -> std::optional<std::vector<std::string>>;

    void InsertPackageInputsHash(TaskId const& task_id, std::string hash);

    void InsertHash(TaskId const& task_id,
                    DetailedMap env_vars,
                    std::string hash);

    void InsertExpandedOutputs(TaskId const& task_id,
                               std::vector<std::string> outputs);

    /// \brief Sorted, de-duplicated hashes of the given dependencies. The
    /// root node and tasks of the root package do not contribute.
    /// Fails if any other dependency has not been hashed yet.
    [[nodiscard]] auto CalculateDependencyHashes(
        std::vector<TaskNode> const& dependencies) const
        -> expected<std::vector<std::string>, std::string>;

  private:
    mutable std::shared_mutex mutex_{};
    std::map<TaskId, std::string> package_inputs_hashes_{};
    std::map<TaskId, std::string> task_hashes_{};
    std::map<TaskId, DetailedMap> env_vars_{};
    std::map<TaskId, std::vector<std::string>> expanded_outputs_{};
};

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASH_TRACKER_HPP
