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

#ifndef INCLUDED_SRC_TASKCACHE_COMMON_TASK_DEFINITION_HPP
#define INCLUDED_SRC_TASKCACHE_COMMON_TASK_DEFINITION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "src/taskcache/common/output_mode.hpp"

/// \brief Output globs of a task, split by the leading `!`.
struct TaskOutputs {
    std::vector<std::string> inclusions{};
    std::vector<std::string> exclusions{};

    [[nodiscard]] static auto FromGlobs(std::vector<std::string> const& globs)
        -> TaskOutputs {
        TaskOutputs outputs{};
        for (auto const& glob : globs) {
            if (not glob.empty() and glob.front() == '!') {
                outputs.exclusions.emplace_back(glob.substr(1));
            }
            else {
                outputs.inclusions.emplace_back(glob);
            }
        }
        return outputs;
    }

    [[nodiscard]] auto operator==(TaskOutputs const&) const -> bool = default;
};

/// \brief Configuration of one task of one package, as resolved by the
/// workspace collaborator.
struct TaskDefinition {
    std::vector<std::string> depends_on{};
    std::vector<std::string> outputs{};  ///< globs, `!` marks exclusions
    std::vector<std::string> inputs{};   ///< empty means all files
    std::vector<std::string> env{};
    std::optional<std::vector<std::string>> pass_through_env{};
    std::vector<std::string> dot_env{};
    bool cache{true};
    bool persistent{false};
    OutputMode output_mode{OutputMode::Full};

    [[nodiscard]] auto HashableOutputs() const -> TaskOutputs {
        return TaskOutputs::FromGlobs(outputs);
    }

    /// \brief Long running tasks are never cached.
    [[nodiscard]] auto IsCacheable() const noexcept -> bool {
        return cache and not persistent;
    }
};

/// \brief One resolved external package of a lockfile.
struct LockfilePackage {
    std::string key{};
    std::string version{};
};

/// \brief What hashing needs to know about a package.
struct PackageInfo {
    std::string name{};
    std::filesystem::path dir{};  ///< relative to the repository root
    /// \brief Resolved external dependencies, nullopt if no lockfile
    /// information is available.
    std::optional<std::vector<LockfilePackage>> transitive_dependencies{};
};

#endif  // INCLUDED_SRC_TASKCACHE_COMMON_TASK_DEFINITION_HPP
