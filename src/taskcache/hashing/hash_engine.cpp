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

#include "src/taskcache/hashing/hash_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/hashing/hashable_writer.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/hex_string.hpp"
#include "xxhash.h"

namespace {

[[nodiscard]] auto Sorted(std::vector<std::string> values)
    -> std::vector<std::string> {
    std::sort(values.begin(), values.end());
    return values;
}

[[nodiscard]] auto SortedUnique(std::vector<std::string> const& values)
    -> std::vector<std::string> {
    std::set<std::string> unique{values.begin(), values.end()};
    return {unique.begin(), unique.end()};
}

/// \brief In loose mode the whole environment is available to the task, so
/// the names of pass-through variables carry no information.
[[nodiscard]] auto HashablePassThrough(
    EnvMode mode,
    std::vector<std::string> const& pass_through)
    -> std::vector<std::string> {
    if (mode == EnvMode::Loose) {
        return {};
    }
    return pass_through;
}

[[nodiscard]] auto CheckEnvModeResolved(EnvMode mode)
    -> std::optional<std::string> {
    if (mode == EnvMode::Infer) {
        return "env mode must be resolved to loose or strict before hashing";
    }
    return std::nullopt;
}

}  // namespace

auto HashEngine::HashData(std::string_view data) noexcept -> std::string {
    auto const hash = XXH64(data.data(), data.size(), /*seed=*/0);
    return ToHexString(static_cast<std::uint64_t>(hash));
}

auto HashEngine::SerializeGlobal(GlobalHashable const& hashable)
    -> expected<std::string, std::string> {
    if (auto error = CheckEnvModeResolved(hashable.env_mode)) {
        return unexpected{std::move(*error)};
    }
    HashableWriter writer{};
    writer.String(kHashableFormatVersion)
        .String(hashable.global_cache_key)
        .Map(hashable.global_file_hash_map)
        .String(hashable.root_external_deps_hash)
        .List(hashable.env)
        .List(Sorted(hashable.resolved_env_vars))
        .List(HashablePassThrough(hashable.env_mode,
                                  hashable.pass_through_env))
        .String(ToString(hashable.env_mode))
        .Flag(hashable.framework_inference)
        .List(hashable.dot_env);
    return std::move(writer).Data();
}

auto HashEngine::SerializeTask(TaskHashable const& hashable)
    -> expected<std::string, std::string> {
    if (auto error = CheckEnvModeResolved(hashable.env_mode)) {
        return unexpected{std::move(*error)};
    }
    std::optional<std::vector<std::string>> pass_through{};
    if (hashable.pass_through_env) {
        pass_through = HashablePassThrough(hashable.env_mode,
                                           *hashable.pass_through_env);
    }
    HashableWriter writer{};
    writer.String(kHashableFormatVersion)
        .String(hashable.global_hash)
        .OptionalString(hashable.package_dir)
        .String(hashable.hash_of_files)
        .String(hashable.external_deps_hash)
        .String(hashable.task)
        .String(ToString(hashable.env_mode))
        .List(Sorted(hashable.outputs.inclusions))
        .List(Sorted(hashable.outputs.exclusions))
        .List(SortedUnique(hashable.task_dependency_hashes))
        .List(hashable.pass_through_args)
        .List(hashable.env)
        .OptionalList(pass_through)
        .List(hashable.dot_env)
        .List(Sorted(hashable.resolved_env_vars));
    return std::move(writer).Data();
}

auto HashEngine::ComputeGlobalHash(GlobalHashable const& hashable)
    -> expected<std::string, std::string> {
    auto data = SerializeGlobal(hashable);
    if (not data) {
        return unexpected{fmt::format("computing global hash failed: {}",
                                      std::move(data).error())};
    }
    auto hash = HashData(*data);
    Logger::Log(LogLevel::Debug, "global hash: {}", hash);
    return hash;
}

auto HashEngine::ComputeTaskHash(TaskHashable const& hashable)
    -> expected<std::string, std::string> {
    auto data = SerializeTask(hashable);
    if (not data) {
        return unexpected{fmt::format("computing hash of task {} failed: {}",
                                      hashable.task,
                                      std::move(data).error())};
    }
    return HashData(*data);
}

auto HashEngine::HashFileHashes(FileHashes const& hashes) -> std::string {
    HashableWriter writer{};
    writer.Map(hashes);
    return HashData(writer.Data());
}

auto HashEngine::HashLockfilePackages(std::vector<LockfilePackage> packages)
    -> std::string {
    std::sort(packages.begin(),
              packages.end(),
              [](LockfilePackage const& lhs, LockfilePackage const& rhs) {
                  return std::tie(lhs.key, lhs.version) <
                         std::tie(rhs.key, rhs.version);
              });
    HashableWriter writer{};
    for (auto const& package : packages) {
        writer.String(package.key).String(package.version);
    }
    return HashData(writer.Data());
}
