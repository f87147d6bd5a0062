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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_ARCHIVE_CODEC_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_ARCHIVE_CODEC_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/taskcache/cache/cache_error.hpp"
#include "src/utils/cpp/expected.hpp"

extern "C" {
struct archive;
}

enum class ArchiveCompression : std::uint8_t { None, Zstd };

/// \brief Compression implied by the file name, `.tar.zst` or `.tar`.
[[nodiscard]] auto CompressionFromPath(std::filesystem::path const& path)
    -> ArchiveCompression;

/// \brief Streaming writer for cache artifacts. Produces GNU tar, optionally
/// zstd compressed, with all owner and time metadata zeroed so that equal
/// file sets give byte-identical archives.
/// The archive is written to a temporary sibling of the target and only
/// renamed into place by \ref Finish.
class ArchiveWriter {
  public:
    [[nodiscard]] static auto Create(std::filesystem::path const& target)
        -> expected<std::unique_ptr<ArchiveWriter>, CacheError>;

    ArchiveWriter(ArchiveWriter const&) = delete;
    ArchiveWriter(ArchiveWriter&&) = delete;
    auto operator=(ArchiveWriter const&) -> ArchiveWriter& = delete;
    auto operator=(ArchiveWriter&&) -> ArchiveWriter& = delete;
    ~ArchiveWriter() noexcept;

    /// \brief Add the entry \p anchor / \p path under the name \p path.
    /// Regular files, directories and symlinks are supported.
    [[nodiscard]] auto AddFile(std::filesystem::path const& anchor,
                               std::filesystem::path const& path) noexcept
        -> std::optional<CacheError>;

    /// \brief Flush, close and move the archive to its target.
    [[nodiscard]] auto Finish() noexcept -> std::optional<CacheError>;

  private:
    struct ArchiveCloser {
        void operator()(archive* a_out) const noexcept;
    };

    std::unique_ptr<archive, ArchiveCloser> archive_;
    std::filesystem::path target_;
    std::filesystem::path tmp_path_;
    bool finished_{false};

    ArchiveWriter(std::unique_ptr<archive, ArchiveCloser> archive,
                  std::filesystem::path target,
                  std::filesystem::path tmp_path) noexcept;

    [[nodiscard]] auto WriteContent(std::filesystem::path const& source)
        -> std::optional<CacheError>;
};

class ArchiveReader {
  public:
    /// \brief Restore all entries of \p archive_path below \p anchor.
    /// Entries with absolute or upwards paths are rejected, as are entries
    /// whose parent directory resolves outside of \p anchor. Symlinks with
    /// missing targets are created after all other entries.
    /// \returns Restored paths, relative to \p anchor with forward slashes,
    /// in archive order.
    [[nodiscard]] static auto Restore(std::filesystem::path const& archive_path,
                                      std::filesystem::path const& anchor)
        -> expected<std::vector<std::string>, CacheError>;
};

/// \brief Archive \p files (relative to \p anchor) at \p target. Entries of
/// unsupported type are skipped with a warning.
[[nodiscard]] auto CreateArchive(std::filesystem::path const& target,
                                 std::filesystem::path const& anchor,
                                 std::vector<std::string> const& files)
    -> std::optional<CacheError>;

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_ARCHIVE_CODEC_HPP
