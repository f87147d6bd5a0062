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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_ENVIRONMENT_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_ENVIRONMENT_HPP

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "src/utils/cpp/expected.hpp"

/// \brief List of "NAME=value" strings.
using EnvironmentVariablePairs = std::vector<std::string>;

struct WildcardMaps;

/// \brief Environment variables by name. Ordered by name.
class EnvironmentVariableMap {
  public:
    using Map = std::map<std::string, std::string>;

    EnvironmentVariableMap() = default;
    explicit EnvironmentVariableMap(Map vars) : vars_{std::move(vars)} {}

    /// \brief Snapshot of the environment of the current process.
    [[nodiscard]] static auto FromProcessEnvironment()
        -> EnvironmentVariableMap;

    [[nodiscard]] auto Vars() const& noexcept -> Map const& { return vars_; }

    [[nodiscard]] auto Size() const noexcept -> std::size_t {
        return vars_.size();
    }

    void Insert(std::string name, std::string value) {
        vars_.insert_or_assign(std::move(name), std::move(value));
    }

    /// \brief Add all entries of \p other, overwriting existing ones.
    void Union(EnvironmentVariableMap const& other);

    /// \brief Remove all names present in \p other.
    void Difference(EnvironmentVariableMap const& other);

    /// \brief Sorted variable names.
    [[nodiscard]] auto Names() const -> std::vector<std::string>;

    /// \brief Sorted "NAME=value" pairs. This is what joins the hash.
    [[nodiscard]] auto ToHashable() const -> EnvironmentVariablePairs;

    /// \brief Sorted "NAME=<sha256 of value>" pairs, or "NAME=" for empty
    /// values, suitable for logs and summaries.
    [[nodiscard]] auto ToSecretHashable() const
        -> expected<EnvironmentVariablePairs, std::string>;

    /// \brief Variables matching wildcard patterns, minus the ones matching
    /// an exclusion. `*` matches any run of characters, `\*` is a literal
    /// star, a leading `!` marks an exclusion and `\!` a literal bang.
    [[nodiscard]] auto FromWildcards(
        std::vector<std::string> const& patterns) const
        -> EnvironmentVariableMap;

    /// \brief Like \ref FromWildcards, but keeps inclusions and exclusions
    /// apart, so that exclusions can take precedence over inclusions from
    /// other sources.
    [[nodiscard]] auto WildcardMapsFromWildcards(
        std::vector<std::string> const& patterns) const -> WildcardMaps;

    [[nodiscard]] auto operator==(EnvironmentVariableMap const& other) const
        -> bool = default;

  private:
    Map vars_{};
};

struct WildcardMaps {
    EnvironmentVariableMap inclusions{};
    EnvironmentVariableMap exclusions{};

    /// \brief Collapse into inclusions minus exclusions.
    [[nodiscard]] auto Resolve() const -> EnvironmentVariableMap {
        auto result = inclusions;
        result.Difference(exclusions);
        return result;
    }
};

/// \brief Composite map of variables plus where they came from.
struct DetailedMap {
    EnvironmentVariableMap all{};
    EnvironmentVariableMap explicit_vars{};  ///< named by the user
    EnvironmentVariableMap matching{};       ///< built-in defaults
};

/// \brief Variables known to affect build outputs even when not declared.
[[nodiscard]] auto DefaultGlobalEnvVars() -> std::vector<std::string> const&;

/// \brief Global variables joining the hash: user inclusions plus built-in
/// defaults, minus user exclusions.
[[nodiscard]] auto GetGlobalHashableEnvVars(
    EnvironmentVariableMap const& env_at_execution_start,
    std::vector<std::string> const& global_env) -> DetailedMap;

/// \brief Check a variable name against a single wildcard pattern (without
/// any `!` prefix).
[[nodiscard]] auto WildcardMatches(std::string const& pattern,
                                   std::string const& name) -> bool;

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_ENVIRONMENT_HPP
