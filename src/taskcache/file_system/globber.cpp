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

#include "src/taskcache/file_system/globber.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/file_system/glob_pattern.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/path.hpp"

namespace {

[[nodiscard]] auto Accepts(WalkType walk_type,
                           std::filesystem::file_status const& status) noexcept
    -> bool {
    if (walk_type == WalkType::All) {
        return true;
    }
    return std::filesystem::is_regular_file(status) or
           std::filesystem::is_symlink(status);
}

[[nodiscard]] auto CreatePatterns(std::filesystem::path const& repo_root,
                                  std::filesystem::path const& base_dir,
                                  std::vector<std::string> const& patterns)
    -> expected<std::vector<GlobPattern>, std::string> {
    std::vector<GlobPattern> result{};
    result.reserve(patterns.size());
    for (auto const& pattern : patterns) {
        auto glob = GlobPattern::Create(repo_root, base_dir, pattern);
        if (not glob) {
            return unexpected{std::move(glob).error()};
        }
        result.emplace_back(std::move(glob).value());
    }
    return result;
}

}  // namespace

auto Globber::Walk(std::filesystem::path const& repo_root,
                   std::filesystem::path const& base_dir,
                   GlobSpec const& spec,
                   WalkType walk_type)
    -> expected<std::vector<std::string>, std::string> {
    static std::vector<std::string> const kEverything{"**"};

    auto const root = ToNormalPath(repo_root);
    auto const base = ToNormalPath(base_dir);
    auto includes = CreatePatterns(
        root, base, spec.inclusions.empty() ? kEverything : spec.inclusions);
    if (not includes) {
        return unexpected{std::move(includes).error()};
    }
    auto excludes = CreatePatterns(root, base, spec.exclusions);
    if (not excludes) {
        return unexpected{std::move(excludes).error()};
    }

    auto is_excluded = [&excludes](std::vector<std::string> const& segments) {
        return std::any_of(excludes->begin(),
                           excludes->end(),
                           [&segments](GlobPattern const& exclude) {
                               return exclude.Matches(segments);
                           });
    };
    auto prune_below = [&excludes](std::vector<std::string> const& segments) {
        return std::any_of(excludes->begin(),
                           excludes->end(),
                           [&segments](GlobPattern const& exclude) {
                               return exclude.MatchesAllBelow(segments);
                           });
    };

    std::set<std::filesystem::path> found{};
    try {
        for (auto const& include : *includes) {
            auto const prefix = include.LiteralPrefix();
            auto const start = root / prefix;
            auto const status = std::filesystem::symlink_status(start);
            if (not std::filesystem::exists(status)) {
                continue;
            }
            if (include.IsLiteral()) {
                // a literal path names the entry itself, never descendants
                if (Accepts(walk_type, status) and
                    not is_excluded(GlobPattern::Split(prefix))) {
                    found.emplace(prefix);
                }
                continue;
            }
            if (not std::filesystem::is_directory(status)) {
                continue;
            }
            for (auto it = std::filesystem::recursive_directory_iterator(start);
                 it != std::filesystem::recursive_directory_iterator();
                 ++it) {
                auto rel = it->path().lexically_relative(root);
                auto const segments = GlobPattern::Split(rel);
                auto const entry_status = it->symlink_status();
                if (std::filesystem::is_directory(entry_status) and
                    prune_below(segments)) {
                    it.disable_recursion_pending();
                }
                if (Accepts(walk_type, entry_status) and
                    include.Matches(segments) and not is_excluded(segments)) {
                    found.emplace(std::move(rel));
                }
            }
        }
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "walking {} failed:\n{}", base.string(), e.what())};
    }

    std::set<std::string> result{};
    auto const base_rel = base.lexically_relative(root);
    for (auto const& path : found) {
        result.emplace(ToUnixPath(base_rel == "." ? path
                                                  : path.lexically_relative(
                                                        base_rel)));
    }
    Logger::Log(LogLevel::Trace, [&] {
        return fmt::format("glob walk in {} found {} entries",
                           base.string(),
                           result.size());
    });
    return std::vector<std::string>(result.begin(), result.end());
}
