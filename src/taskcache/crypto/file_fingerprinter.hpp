// Copyright 2022 Huawei Cloud Computing Technology Co., Ltd.
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

#ifndef INCLUDED_SRC_TASKCACHE_CRYPTO_FILE_FINGERPRINTER_HPP
#define INCLUDED_SRC_TASKCACHE_CRYPTO_FILE_FINGERPRINTER_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "src/utils/cpp/expected.hpp"

/// \brief Hex encoded git blob id of a file.
using FileHash = std::string;

/// \brief Map from unix style relative path to file hash. Ordered, so that
/// iterating it yields the canonical sort order.
using FileHashes = std::map<std::string, FileHash>;

/// \brief Content fingerprints compatible with git's object ids for blobs,
/// i.e., SHA1 over "blob <size>\0<content>".
class FileFingerprinter {
  public:
    /// \brief Fingerprint in-memory content.
    [[nodiscard]] static auto HashBlob(std::string const& data) noexcept
        -> expected<FileHash, std::string>;

    /// \brief Fingerprint the file at \p path. A symlink is fingerprinted by
    /// its target string, never by the content it points to. Read errors
    /// are reported, including a file changing size while being read.
    [[nodiscard]] static auto HashFile(
        std::filesystem::path const& path) noexcept
        -> expected<FileHash, std::string>;

    /// \brief Fingerprint \p files given relative to \p root.
    /// \param allow_missing    Skip files that do not exist instead of
    ///                         failing.
    [[nodiscard]] static auto HashFiles(std::filesystem::path const& root,
                                        std::vector<std::string> const& files,
                                        bool allow_missing) noexcept
        -> expected<FileHashes, std::string>;
};

#endif  // INCLUDED_SRC_TASKCACHE_CRYPTO_FILE_FINGERPRINTER_HPP
