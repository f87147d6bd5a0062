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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/taskcache/common/task_definition.hpp"
#include "src/taskcache/crypto/file_fingerprinter.hpp"
#include "src/taskcache/hashing/env_mode.hpp"
#include "src/taskcache/hashing/environment.hpp"

/// \brief Version of the canonical field layout below. Any change to the
/// fields or their order must bump it, which invalidates all cache entries.
inline constexpr std::string_view kHashableFormatVersion = "taskcache-1";

/// \brief Run-wide hash ingredients. Computed once per run.
struct GlobalHashable {
    std::string global_cache_key{};
    FileHashes global_file_hash_map{};
    std::string root_external_deps_hash{};
    std::vector<std::string> env{};
    EnvironmentVariablePairs resolved_env_vars{};
    std::vector<std::string> pass_through_env{};
    EnvMode env_mode{EnvMode::Infer};
    bool framework_inference{};
    std::vector<std::string> dot_env{};
};

/// \brief Per task hash ingredients.
struct TaskHashable {
    std::string global_hash{};
    std::optional<std::string> package_dir{};  ///< nullopt for the root
    std::string hash_of_files{};
    std::string external_deps_hash{};
    std::string task{};
    EnvMode env_mode{EnvMode::Infer};
    TaskOutputs outputs{};
    std::vector<std::string> task_dependency_hashes{};
    std::vector<std::string> pass_through_args{};
    std::vector<std::string> env{};
    std::optional<std::vector<std::string>> pass_through_env{};
    std::vector<std::string> dot_env{};
    EnvironmentVariablePairs resolved_env_vars{};
};

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_HPP
