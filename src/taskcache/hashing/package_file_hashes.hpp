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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_PACKAGE_FILE_HASHES_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_PACKAGE_FILE_HASHES_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "src/taskcache/crypto/file_fingerprinter.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Fingerprint the input files of a package.
/// \param repo_root    Absolute repository root.
/// \param package_dir  Package directory relative to \p repo_root.
/// \param inputs       Input globs relative to the package, `!` marks an
///                     exclusion. Without inclusions, all files of the
///                     package count except installed dependencies, cache
///                     logs and files matched by `.gitignore` patterns.
/// \returns Map from package-relative unix path to file hash.
[[nodiscard]] auto GetPackageFileHashes(
    std::filesystem::path const& repo_root,
    std::filesystem::path const& package_dir,
    std::vector<std::string> const& inputs)
    -> expected<FileHashes, std::string>;

/// \brief Fingerprint files matching the global dependency globs, keyed by
/// repository-relative path. Files vanishing between walk and hashing are
/// skipped.
[[nodiscard]] auto GetGlobalFileHashes(std::filesystem::path const& repo_root,
                                       std::vector<std::string> const& globs)
    -> expected<FileHashes, std::string>;

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_PACKAGE_FILE_HASHES_HPP
