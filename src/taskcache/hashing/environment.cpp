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

#include "src/taskcache/hashing/environment.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/crypto/hasher.hpp"

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace {

constexpr char kWildcard = '*';
constexpr char kWildcardEscape = '\\';
constexpr char kExclusionPrefix = '!';

/// \brief Literal pieces of a wildcard pattern. Consecutive pieces are
/// separated by one wildcard, so a pattern without wildcards has exactly one
/// piece.
[[nodiscard]] auto SplitAtWildcards(std::string const& pattern)
    -> std::vector<std::string> {
    std::vector<std::string> pieces{};
    std::string current{};
    char previous{};
    for (auto c : pattern) {
        if (c == kWildcard) {
            if (previous == kWildcardEscape) {
                current.back() = kWildcard;
            }
            else {
                pieces.emplace_back(std::move(current));
                current.clear();
            }
        }
        else {
            current.push_back(c);
        }
        previous = c;
    }
    pieces.emplace_back(std::move(current));
    return pieces;
}

[[nodiscard]] auto Classify(std::vector<std::string> const& patterns)
    -> std::pair<std::vector<std::string>, std::vector<std::string>> {
    std::vector<std::string> includes{};
    std::vector<std::string> excludes{};
    for (auto const& pattern : patterns) {
        if (not pattern.empty() and pattern.front() == kExclusionPrefix) {
            excludes.emplace_back(pattern.substr(1));
        }
        else if (pattern.size() >= 2 and pattern[0] == kWildcardEscape and
                 pattern[1] == kExclusionPrefix) {
            includes.emplace_back(pattern.substr(1));
        }
        else {
            includes.emplace_back(pattern);
        }
    }
    return {std::move(includes), std::move(excludes)};
}

[[nodiscard]] auto MatchesAny(std::vector<std::string> const& patterns,
                              std::string const& name) -> bool {
    return std::any_of(
        patterns.begin(), patterns.end(), [&name](auto const& pattern) {
            return WildcardMatches(pattern, name);
        });
}

}  // namespace

auto WildcardMatches(std::string const& pattern, std::string const& name)
    -> bool {
    auto const pieces = SplitAtWildcards(pattern);
    if (pieces.size() == 1) {
        return pieces.front() == name;
    }
    std::string_view rest{name};
    auto const& first = pieces.front();
    auto const& last = pieces.back();
    if (rest.size() < first.size() + last.size() or
        not rest.starts_with(first) or not rest.ends_with(last)) {
        return false;
    }
    rest = rest.substr(first.size(), rest.size() - first.size() - last.size());
    for (std::size_t i = 1; i + 1 < pieces.size(); ++i) {
        auto const pos = rest.find(pieces[i]);
        if (pos == std::string_view::npos) {
            return false;
        }
        rest.remove_prefix(pos + pieces[i].size());
    }
    return true;
}

auto EnvironmentVariableMap::FromProcessEnvironment()
    -> EnvironmentVariableMap {
    Map vars{};
    for (char** entry = environ; entry != nullptr and *entry != nullptr;
         ++entry) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        std::string_view const line{*entry};
        auto const sep = line.find('=');
        if (sep == std::string_view::npos or sep == 0) {
            continue;
        }
        vars.insert_or_assign(std::string{line.substr(0, sep)},
                              std::string{line.substr(sep + 1)});
    }
    return EnvironmentVariableMap{std::move(vars)};
}

void EnvironmentVariableMap::Union(EnvironmentVariableMap const& other) {
    for (auto const& [name, value] : other.vars_) {
        vars_.insert_or_assign(name, value);
    }
}

void EnvironmentVariableMap::Difference(EnvironmentVariableMap const& other) {
    for (auto const& [name, value] : other.vars_) {
        vars_.erase(name);
    }
}

auto EnvironmentVariableMap::Names() const -> std::vector<std::string> {
    std::vector<std::string> names{};
    names.reserve(vars_.size());
    std::transform(vars_.begin(),
                   vars_.end(),
                   std::back_inserter(names),
                   [](auto const& entry) { return entry.first; });
    return names;
}

auto EnvironmentVariableMap::ToHashable() const -> EnvironmentVariablePairs {
    EnvironmentVariablePairs pairs{};
    pairs.reserve(vars_.size());
    for (auto const& [name, value] : vars_) {
        pairs.emplace_back(fmt::format("{}={}", name, value));
    }
    return pairs;
}

auto EnvironmentVariableMap::ToSecretHashable() const
    -> expected<EnvironmentVariablePairs, std::string> {
    EnvironmentVariablePairs pairs{};
    pairs.reserve(vars_.size());
    for (auto const& [name, value] : vars_) {
        if (value.empty()) {
            pairs.emplace_back(fmt::format("{}=", name));
            continue;
        }
        auto digest = Hasher::HexDigest(Hasher::HashType::SHA256, value);
        if (not digest) {
            return unexpected{
                fmt::format("failed to mask value of variable {}", name)};
        }
        pairs.emplace_back(fmt::format("{}={}", name, *digest));
    }
    return pairs;
}

auto EnvironmentVariableMap::WildcardMapsFromWildcards(
    std::vector<std::string> const& patterns) const -> WildcardMaps {
    WildcardMaps maps{};
    if (patterns.empty()) {
        return maps;
    }
    auto const [includes, excludes] = Classify(patterns);
    for (auto const& [name, value] : vars_) {
        if (MatchesAny(includes, name)) {
            maps.inclusions.Insert(name, value);
        }
        if (MatchesAny(excludes, name)) {
            maps.exclusions.Insert(name, value);
        }
    }
    return maps;
}

auto EnvironmentVariableMap::FromWildcards(
    std::vector<std::string> const& patterns) const -> EnvironmentVariableMap {
    return WildcardMapsFromWildcards(patterns).Resolve();
}

auto DefaultGlobalEnvVars() -> std::vector<std::string> const& {
    static std::vector<std::string> const kDefaults{"VERCEL_ANALYTICS_ID"};
    return kDefaults;
}

auto GetGlobalHashableEnvVars(
    EnvironmentVariableMap const& env_at_execution_start,
    std::vector<std::string> const& global_env) -> DetailedMap {
    auto const defaults =
        env_at_execution_start.FromWildcards(DefaultGlobalEnvVars());
    auto const user =
        env_at_execution_start.WildcardMapsFromWildcards(global_env);

    DetailedMap result{};
    result.all.Union(user.inclusions);
    result.all.Union(defaults);
    result.all.Difference(user.exclusions);

    result.explicit_vars.Union(user.inclusions);
    result.explicit_vars.Difference(user.exclusions);

    result.matching.Union(defaults);
    result.matching.Difference(result.explicit_vars);
    return result;
}
