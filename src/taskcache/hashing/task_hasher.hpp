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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASHER_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASHER_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "gsl/gsl"
#include "src/taskcache/common/task_definition.hpp"
#include "src/taskcache/common/task_id.hpp"
#include "src/taskcache/hashing/env_mode.hpp"
#include "src/taskcache/hashing/environment.hpp"
#include "src/taskcache/hashing/task_hash_tracker.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Computes task hashes of one run. Safe to use from several
/// workers, provided each task is hashed only after its dependencies.
class TaskHasher {
  public:
    TaskHasher(gsl::not_null<TaskHashTracker*> const& tracker,
               std::string global_hash,
               EnvironmentVariableMap env_at_execution_start,
               std::vector<std::string> pass_through_args = {})
        : tracker_{tracker},
          global_hash_{std::move(global_hash)},
          env_at_execution_start_{std::move(env_at_execution_start)},
          pass_through_args_{std::move(pass_through_args)} {}

    /// \brief Hash the inputs of \p task_id and record it in the tracker,
    /// where \ref CalculateTaskHash picks it up.
    [[nodiscard]] auto HashPackageInputs(
        std::filesystem::path const& repo_root,
        TaskId const& task_id,
        PackageInfo const& package,
        TaskDefinition const& definition) const
        -> expected<std::string, std::string>;

    /// \brief Compute and record the hash of \p task_id.
    /// \param env_mode     Resolved env mode of the task.
    /// \param dependencies Direct dependencies in the task graph.
    [[nodiscard]] auto CalculateTaskHash(
        TaskId const& task_id,
        TaskDefinition const& definition,
        EnvMode env_mode,
        PackageInfo const& package,
        std::vector<TaskNode> const& dependencies) const
        -> expected<std::string, std::string>;

  private:
    gsl::not_null<TaskHashTracker*> tracker_;
    std::string global_hash_;
    EnvironmentVariableMap env_at_execution_start_;
    std::vector<std::string> pass_through_args_;
};

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_TASK_HASHER_HPP
