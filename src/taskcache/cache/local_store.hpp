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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_LOCAL_STORE_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_LOCAL_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/taskcache/cache/cache_error.hpp"
#include "src/taskcache/cache/cache_item.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Artifact store in a local directory. Every artifact is one archive
/// named after its hash, next to a small metadata file.
/// Writes become visible atomically, so concurrent readers never observe a
/// partially written artifact.
class LocalStore {
  public:
    explicit LocalStore(std::filesystem::path cache_dir) noexcept
        : cache_dir_{std::move(cache_dir)} {}

    [[nodiscard]] auto CacheDir() const noexcept
        -> std::filesystem::path const& {
        return cache_dir_;
    }

    /// \brief Archive \p files (relative to \p anchor) as artifact \p hash.
    [[nodiscard]] auto Put(std::filesystem::path const& anchor,
                           std::string const& hash,
                           std::uint64_t duration_ms,
                           std::vector<std::string> const& files) const
        -> std::optional<CacheError>;

    /// \brief Restore artifact \p hash below \p anchor.
    /// \returns The hit, nullopt if there is no artifact, or an error.
    [[nodiscard]] auto Fetch(std::filesystem::path const& anchor,
                             std::string const& hash) const
        -> expected<std::optional<CacheHit>, CacheError>;

    [[nodiscard]] auto Exists(std::string const& hash) const
        -> std::optional<CacheHitMetadata>;

    /// \brief Store raw archive bytes obtained elsewhere as artifact \p hash.
    [[nodiscard]] auto ImportArtifact(std::string const& hash,
                                      std::string const& bytes,
                                      std::uint64_t duration_ms) const
        -> std::optional<CacheError>;

    /// \brief Raw bytes of the archive of \p hash, if present.
    [[nodiscard]] auto ReadArtifact(std::string const& hash) const
        -> std::optional<std::string>;

    /// \brief Path of the compressed archive written for \p hash.
    [[nodiscard]] auto ArtifactPath(std::string const& hash) const
        -> std::filesystem::path;

  private:
    std::filesystem::path cache_dir_;

    [[nodiscard]] auto UncompressedPath(std::string const& hash) const
        -> std::filesystem::path;

    [[nodiscard]] auto MetadataPath(std::string const& hash) const
        -> std::filesystem::path;

    /// \brief Existing archive of \p hash, preferring the compressed one.
    [[nodiscard]] auto FindArtifact(std::string const& hash) const
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto WriteMetadata(std::string const& hash,
                                     std::uint64_t duration_ms) const
        -> std::optional<CacheError>;

    [[nodiscard]] auto ReadDuration(std::string const& hash) const
        -> std::uint64_t;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_LOCAL_STORE_HPP
