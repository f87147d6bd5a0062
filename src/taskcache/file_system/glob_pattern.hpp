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

#ifndef INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOB_PATTERN_HPP
#define INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOB_PATTERN_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "src/utils/cpp/expected.hpp"

/// \brief A glob pattern anchored at the repository root.
/// Segments are matched with POSIX fnmatch semantics (`*`, `?`, `[...]`),
/// except for the segment `**`, which spans directories. A trailing `**`
/// matches one or more segments, any other `**` zero or more.
class GlobPattern {
  public:
    /// \brief Anchor \p pattern at \p base_dir and normalize it.
    /// Fails if the resulting pattern leaves \p repo_root.
    /// \param repo_root    Absolute repository root.
    /// \param base_dir     Absolute directory relative patterns start from.
    /// \param pattern      Pattern as written by the user.
    [[nodiscard]] static auto Create(std::filesystem::path const& repo_root,
                                     std::filesystem::path const& base_dir,
                                     std::string const& pattern)
        -> expected<GlobPattern, std::string>;

    /// \brief Check a repository-relative path given as segments.
    [[nodiscard]] auto Matches(
        std::vector<std::string> const& segments) const noexcept -> bool;

    /// \brief True if every path strictly below the directory \p segments
    /// matches, i.e. the pattern ends in `**` and its other segments match
    /// the directory. Allows pruning excluded subtrees.
    [[nodiscard]] auto MatchesAllBelow(
        std::vector<std::string> const& segments) const noexcept -> bool;

    /// \brief Leading segments without any wildcard, as repository-relative
    /// path. Walking can start there.
    [[nodiscard]] auto LiteralPrefix() const -> std::filesystem::path;

    /// \brief True if the pattern has no wildcard at all and thus names
    /// exactly one path.
    [[nodiscard]] auto IsLiteral() const noexcept -> bool {
        return literal_count_ == segments_.size();
    }

    [[nodiscard]] auto ToString() const -> std::string;

    /// \brief Split a relative path into its segments, dropping `.`.
    [[nodiscard]] static auto Split(std::filesystem::path const& path)
        -> std::vector<std::string>;

  private:
    std::vector<std::string> segments_;
    std::size_t literal_count_{};

    explicit GlobPattern(std::vector<std::string> segments);

    [[nodiscard]] auto MatchFrom(std::size_t pat_pos,
                                 std::vector<std::string> const& path,
                                 std::size_t path_pos,
                                 std::size_t pat_end) const noexcept -> bool;
};

#endif  // INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOB_PATTERN_HPP
