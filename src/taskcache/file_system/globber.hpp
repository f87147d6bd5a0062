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

#ifndef INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOBBER_HPP
#define INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOBBER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "src/utils/cpp/expected.hpp"

/// \brief Which kind of entries a walk reports.
enum class WalkType : std::uint8_t {
    Files,  ///< regular files and symlinks (input hashing)
    All     ///< additionally directories and special files (outputs)
};

/// \brief Include and exclude patterns of a glob walk, as written by the
/// user, relative to the walk's base directory.
struct GlobSpec {
    std::vector<std::string> inclusions;
    std::vector<std::string> exclusions;
};

class Globber {
  public:
    /// \brief Resolve patterns to existing paths below \p base_dir.
    /// Exclusions win over inclusions. A pattern that leaves \p repo_root
    /// is an error. Directory symlinks are not followed.
    /// \returns Sorted, de-duplicated paths relative to \p base_dir, using
    /// forward slashes.
    [[nodiscard]] static auto Walk(std::filesystem::path const& repo_root,
                                   std::filesystem::path const& base_dir,
                                   GlobSpec const& spec,
                                   WalkType walk_type)
        -> expected<std::vector<std::string>, std::string>;
};

#endif  // INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_GLOBBER_HPP
