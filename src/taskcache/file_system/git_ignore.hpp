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

#ifndef INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GIT_IGNORE_HPP
#define INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GIT_IGNORE_HPP

#include <filesystem>
#include <string>
#include <vector>

/// \brief Translate the content of a `.gitignore` file into exclusion globs
/// for Globber::Walk.
/// \param dir      Absolute directory containing the `.gitignore` file.
///                 Patterns with a slash are anchored there, others match
///                 at any depth below it.
/// \param content  Content of the file.
/// \returns Absolute glob patterns. Negated patterns are skipped.
[[nodiscard]] auto GitIgnoreExclusions(std::filesystem::path const& dir,
                                       std::string const& content)
    -> std::vector<std::string>;

/// \brief Exclusion globs of the `.gitignore` files in \p repo_root and in
/// every directory from there down to \p package_root.
[[nodiscard]] auto ReadGitIgnoreExclusions(
    std::filesystem::path const& repo_root,
    std::filesystem::path const& package_root) -> std::vector<std::string>;

#endif  // INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GIT_IGNORE_HPP
