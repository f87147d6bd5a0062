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

#include "src/taskcache/hashing/task_hash_tracker.hpp"

#include <mutex>
#include <set>
#include <utility>

#include "fmt/core.h"

namespace {
template <class T>
[[nodiscard]] auto Lookup(std::map<TaskId, T> const& map, TaskId const& key)
    -> std::optional<T> {
    auto it = map.find(key);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}
}  // namespace

auto TaskHashTracker::Hash(TaskId const& task_id) const
    -> std::optional<std::string> {
    std::shared_lock lock{mutex_};
    return Lookup(task_hashes_, task_id);
}

auto TaskHashTracker::EnvVars(TaskId const& task_id) const
    -> std::optional<DetailedMap> {
    std::shared_lock lock{mutex_};
    return Lookup(env_vars_, task_id);
}

auto TaskHashTracker::PackageInputsHash(TaskId const& task_id) const
    -> std::optional<std::string> {
    std::shared_lock lock{mutex_};
    return Lookup(package_inputs_hashes_, task_id);
}

auto TaskHashTracker::ExpandedOutputs(TaskId const& task_id) const
    -> std::optional<std::vector<std::string>> {
    std::shared_lock lock{mutex_};
    return Lookup(expanded_outputs_, task_id);
}

void TaskHashTracker::InsertPackageInputsHash(TaskId const& task_id,
                                              std::string hash) {
    std::unique_lock lock{mutex_};
    package_inputs_hashes_.insert_or_assign(task_id, std::move(hash));
}

void TaskHashTracker::InsertHash(TaskId const& task_id,
                                 DetailedMap env_vars,
                                 std::string hash) {
    std::unique_lock lock{mutex_};
    env_vars_.insert_or_assign(task_id, std::move(env_vars));
    task_hashes_.insert_or_assign(task_id, std::move(hash));
}

void TaskHashTracker::InsertExpandedOutputs(TaskId const& task_id,
                                            std::vector<std::string> outputs) {
    std::unique_lock lock{mutex_};
    expanded_outputs_.insert_or_assign(task_id, std::move(outputs));
}

auto TaskHashTracker::CalculateDependencyHashes(
    std::vector<TaskNode> const& dependencies) const
    -> expected<std::vector<std::string>, std::string> {
    std::set<std::string> hashes{};
    std::shared_lock lock{mutex_};
    for (auto const& dependency : dependencies) {
        if (not dependency or dependency->IsRootTask()) {
            continue;
        }
        auto it = task_hashes_.find(*dependency);
        if (it == task_hashes_.end()) {
            return unexpected{fmt::format("missing hash for dependent task: {}",
                                          dependency->ToString())};
        }
        hashes.insert(it->second);
    }
    return std::vector<std::string>(hashes.begin(), hashes.end());
}
