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

#include "src/taskcache/file_system/git_ignore.hpp"

#include <iterator>
#include <optional>
#include <sstream>
#include <utility>

#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/path.hpp"

namespace {

struct IgnorePattern {
    std::string pattern;
    bool anchored{false};
    bool dir_only{false};
};

[[nodiscard]] auto ParseLine(std::string line) -> std::optional<IgnorePattern> {
    if (not line.empty() and line.back() == '\r') {
        line.pop_back();
    }
    // trailing spaces are ignored unless escaped
    while (not line.empty() and line.back() == ' ' and
           (line.size() < 2 or line[line.size() - 2] != '\\')) {
        line.pop_back();
    }
    if (line.empty() or line.front() == '#') {
        return std::nullopt;
    }
    if (line.front() == '!') {
        Logger::Log(LogLevel::Debug,
                    "negated ignore pattern {} is not supported, skipping",
                    line);
        return std::nullopt;
    }
    if (line.starts_with("\\#") or line.starts_with("\\!")) {
        line.erase(0, 1);
    }

    IgnorePattern result{};
    while (not line.empty() and line.back() == '/') {
        result.dir_only = true;
        line.pop_back();
    }
    result.anchored = line.find('/') != std::string::npos;
    while (not line.empty() and line.front() == '/') {
        line.erase(0, 1);
    }
    if (line.empty()) {
        return std::nullopt;
    }
    for (auto const& segment : std::filesystem::path{line}) {
        if (segment == "..") {
            Logger::Log(LogLevel::Debug,
                        "ignore pattern {} leaves its directory, skipping",
                        line);
            return std::nullopt;
        }
    }
    result.pattern = std::move(line);
    return result;
}

}  // namespace

auto GitIgnoreExclusions(std::filesystem::path const& dir,
                         std::string const& content)
    -> std::vector<std::string> {
    auto const base = ToNormalPath(dir).generic_string();
    std::vector<std::string> globs{};
    std::istringstream lines{content};
    std::string line{};
    while (std::getline(lines, line)) {
        auto parsed = ParseLine(line);
        if (not parsed) {
            continue;
        }
        auto prefix = parsed->anchored
                          ? base + "/" + parsed->pattern
                          : base + "/**/" + parsed->pattern;
        bool const spans = prefix.ends_with("**");
        if (not parsed->dir_only or spans) {
            globs.emplace_back(prefix);
        }
        if (not spans) {
            globs.emplace_back(prefix + "/**");
        }
    }
    return globs;
}

auto ReadGitIgnoreExclusions(std::filesystem::path const& repo_root,
                             std::filesystem::path const& package_root)
    -> std::vector<std::string> {
    auto dir = ToNormalPath(repo_root);
    auto const rel = ToNormalPath(package_root).lexically_relative(dir);

    std::vector<std::filesystem::path> dirs{dir};
    for (auto const& segment : rel) {
        if (segment == "..") {
            break;
        }
        if (segment.empty() or segment == ".") {
            continue;
        }
        dir /= segment;
        dirs.emplace_back(dir);
    }

    std::vector<std::string> exclusions{};
    for (auto const& candidate : dirs) {
        auto const file = candidate / ".gitignore";
        if (not FileSystemManager::IsFile(file)) {
            continue;
        }
        auto content = FileSystemManager::ReadFile(file);
        if (not content) {
            Logger::Log(LogLevel::Warning,
                        "could not read {}, not applying its patterns",
                        file.string());
            continue;
        }
        auto globs = GitIgnoreExclusions(candidate, *content);
        exclusions.insert(exclusions.end(),
                          std::make_move_iterator(globs.begin()),
                          std::make_move_iterator(globs.end()));
    }
    return exclusions;
}
