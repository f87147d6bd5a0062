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

#include "src/taskcache/file_system/glob_pattern.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

#include "fmt/core.h"
#include "src/utils/cpp/path.hpp"

namespace {

constexpr auto kDoubleStar = "**";

[[nodiscard]] auto HasWildcard(std::string const& segment) noexcept -> bool {
    return segment.find_first_of("*?[\\") != std::string::npos;
}

}  // namespace

GlobPattern::GlobPattern(std::vector<std::string> segments)
    : segments_{std::move(segments)} {
    auto first_wildcard =
        std::find_if(segments_.begin(), segments_.end(), HasWildcard);
    literal_count_ = static_cast<std::size_t>(
        std::distance(segments_.begin(), first_wildcard));
}

auto GlobPattern::Create(std::filesystem::path const& repo_root,
                         std::filesystem::path const& base_dir,
                         std::string const& pattern)
    -> expected<GlobPattern, std::string> {
    try {
        auto const raw = std::filesystem::path{pattern};
        auto const anchored = raw.is_absolute() ? raw : base_dir / raw;
        auto const normal = anchored.lexically_normal();
        if (not PathIsWithin(repo_root, normal)) {
            return unexpected{
                fmt::format("invalid glob pattern {}: resolves to {} which is "
                            "outside of the repository root {}",
                            pattern,
                            normal.string(),
                            repo_root.string())};
        }
        auto const relative = ToNormalPath(normal).lexically_relative(
            ToNormalPath(repo_root));
        return GlobPattern{Split(relative)};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("invalid glob pattern {}: {}", pattern, e.what())};
    }
}

auto GlobPattern::Split(std::filesystem::path const& path)
    -> std::vector<std::string> {
    std::vector<std::string> segments{};
    for (auto const& part : path) {
        auto segment = part.string();
        if (segment.empty() or segment == ".") {
            continue;
        }
        segments.emplace_back(std::move(segment));
    }
    return segments;
}

auto GlobPattern::Matches(
    std::vector<std::string> const& segments) const noexcept -> bool {
    return MatchFrom(0, segments, 0, segments_.size());
}

auto GlobPattern::MatchesAllBelow(
    std::vector<std::string> const& segments) const noexcept -> bool {
    if (segments_.empty() or segments_.back() != kDoubleStar) {
        return false;
    }
    return MatchFrom(0, segments, 0, segments_.size() - 1);
}

auto GlobPattern::LiteralPrefix() const -> std::filesystem::path {
    std::filesystem::path prefix{};
    for (std::size_t i = 0; i < literal_count_; ++i) {
        prefix /= segments_[i];
    }
    return prefix;
}

auto GlobPattern::ToString() const -> std::string {
    std::string result{};
    for (auto const& segment : segments_) {
        if (not result.empty()) {
            result.push_back('/');
        }
        result.append(segment);
    }
    return result;
}

auto GlobPattern::MatchFrom(std::size_t pat_pos,
                            std::vector<std::string> const& path,
                            std::size_t path_pos,
                            std::size_t pat_end) const noexcept -> bool {
    if (pat_pos == pat_end) {
        return path_pos == path.size();
    }
    auto const& segment = segments_[pat_pos];
    if (segment == kDoubleStar) {
        bool const trailing =
            pat_pos + 1 == pat_end and pat_end == segments_.size();
        if (trailing) {
            return path_pos < path.size();
        }
        for (auto pos = path_pos; pos <= path.size(); ++pos) {
            if (MatchFrom(pat_pos + 1, path, pos, pat_end)) {
                return true;
            }
        }
        return false;
    }
    if (path_pos >= path.size()) {
        return false;
    }
    if (::fnmatch(segment.c_str(), path[path_pos].c_str(), 0) != 0) {
        return false;
    }
    return MatchFrom(pat_pos + 1, path, path_pos + 1, pat_end);
}
