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

#include "src/taskcache/hashing/task_hasher.hpp"

#include <optional>
#include <utility>

#include "fmt/core.h"
#include "fmt/ranges.h"
#include "src/taskcache/hashing/hash_engine.hpp"
#include "src/taskcache/hashing/hashable.hpp"
#include "src/taskcache/hashing/package_file_hashes.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/path.hpp"

auto TaskHasher::HashPackageInputs(std::filesystem::path const& repo_root,
                                   TaskId const& task_id,
                                   PackageInfo const& package,
                                   TaskDefinition const& definition) const
    -> expected<std::string, std::string> {
    auto hashes =
        GetPackageFileHashes(repo_root, package.dir, definition.inputs);
    if (not hashes) {
        return unexpected{std::move(hashes).error()};
    }
    auto hash = HashEngine::HashFileHashes(*hashes);
    tracker_->InsertPackageInputsHash(task_id, hash);
    return hash;
}

auto TaskHasher::CalculateTaskHash(TaskId const& task_id,
                                   TaskDefinition const& definition,
                                   EnvMode env_mode,
                                   PackageInfo const& package,
                                   std::vector<TaskNode> const& dependencies)
    const -> expected<std::string, std::string> {
    auto hash_of_files = tracker_->PackageInputsHash(task_id);
    if (not hash_of_files) {
        return unexpected{fmt::format("missing file hashes for task: {}",
                                      task_id.ToString())};
    }

    auto env_vars = env_at_execution_start_.FromWildcards(definition.env);
    auto dependency_hashes = tracker_->CalculateDependencyHashes(dependencies);
    if (not dependency_hashes) {
        return unexpected{std::move(dependency_hashes).error()};
    }

    TaskHashable hashable{};
    hashable.global_hash = global_hash_;
    auto const package_dir = ToUnixPath(package.dir);
    if (not package_dir.empty() and package_dir != ".") {
        hashable.package_dir = package_dir;
    }
    hashable.hash_of_files = *std::move(hash_of_files);
    if (package.transitive_dependencies) {
        hashable.external_deps_hash =
            HashEngine::HashLockfilePackages(*package.transitive_dependencies);
    }
    hashable.task = task_id.task;
    hashable.env_mode = env_mode;
    hashable.outputs = definition.HashableOutputs();
    hashable.task_dependency_hashes = *std::move(dependency_hashes);
    hashable.pass_through_args = pass_through_args_;
    hashable.env = definition.env;
    hashable.pass_through_env = definition.pass_through_env;
    hashable.dot_env = definition.dot_env;
    hashable.resolved_env_vars = env_vars.ToHashable();

    if (not hashable.resolved_env_vars.empty()) {
        Logger::Log(LogLevel::Debug, [&] {
            auto masked = env_vars.ToSecretHashable();
            return fmt::format(
                "task hash env vars for {}:\n vars: {}",
                task_id.ToString(),
                masked ? fmt::format("{}", fmt::join(*masked, ", "))
                       : masked.error());
        });
    }

    auto hash = HashEngine::ComputeTaskHash(hashable);
    if (not hash) {
        return hash;
    }
    tracker_->InsertHash(
        task_id,
        DetailedMap{.all = env_vars, .explicit_vars = env_vars, .matching = {}},
        *hash);
    return hash;
}
