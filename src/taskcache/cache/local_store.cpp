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

#include "src/taskcache/cache/local_store.hpp"

#include <utility>

#include "nlohmann/json.hpp"
#include "src/taskcache/cache/archive_codec.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/json.hpp"

namespace {

constexpr auto kCompressedSuffix = ".tar.zst";
constexpr auto kUncompressedSuffix = ".tar";
constexpr auto kMetadataSuffix = "-meta.json";

}  // namespace

auto LocalStore::ArtifactPath(std::string const& hash) const
    -> std::filesystem::path {
    return cache_dir_ / (hash + kCompressedSuffix);
}

auto LocalStore::UncompressedPath(std::string const& hash) const
    -> std::filesystem::path {
    return cache_dir_ / (hash + kUncompressedSuffix);
}

auto LocalStore::MetadataPath(std::string const& hash) const
    -> std::filesystem::path {
    return cache_dir_ / (hash + kMetadataSuffix);
}

auto LocalStore::FindArtifact(std::string const& hash) const
    -> std::optional<std::filesystem::path> {
    for (auto const& path : {ArtifactPath(hash), UncompressedPath(hash)}) {
        if (FileSystemManager::IsFile(path)) {
            return path;
        }
    }
    return std::nullopt;
}

auto LocalStore::WriteMetadata(std::string const& hash,
                               std::uint64_t duration_ms) const
    -> std::optional<CacheError> {
    auto const meta = nlohmann::json{{"hash", hash}, {"duration", duration_ms}};
    if (not FileSystemManager::WriteFileAtomically(meta.dump(),
                                                   MetadataPath(hash))) {
        return CacheError::Create(CacheErrorKind::Io,
                                  "could not write metadata of {}",
                                  hash);
    }
    return std::nullopt;
}

auto LocalStore::ReadDuration(std::string const& hash) const -> std::uint64_t {
    auto content = FileSystemManager::ReadFile(MetadataPath(hash));
    if (not content) {
        return 0;
    }
    auto meta = ParseJson(*content);
    if (not meta) {
        Logger::Log(LogLevel::Debug,
                    "ignoring malformed metadata of {}: {}",
                    hash,
                    meta.error());
        return 0;
    }
    return ExtractValueAs<std::uint64_t>(
               *meta,
               "duration",
               [&hash](std::string const& error) {
                   Logger::Log(LogLevel::Debug,
                               "no duration in metadata of {}: {}",
                               hash,
                               error);
               })
        .value_or(0);
}

auto LocalStore::Put(std::filesystem::path const& anchor,
                     std::string const& hash,
                     std::uint64_t duration_ms,
                     std::vector<std::string> const& files) const
    -> std::optional<CacheError> {
    if (auto error = CreateArchive(ArtifactPath(hash), anchor, files)) {
        return error;
    }
    return WriteMetadata(hash, duration_ms);
}

auto LocalStore::Fetch(std::filesystem::path const& anchor,
                       std::string const& hash) const
    -> expected<std::optional<CacheHit>, CacheError> {
    auto artifact = FindArtifact(hash);
    if (not artifact) {
        Logger::Log(LogLevel::Debug, "local cache miss for {}", hash);
        return std::optional<CacheHit>{};
    }
    auto restored = ArchiveReader::Restore(*artifact, anchor);
    if (not restored) {
        return unexpected{std::move(restored).error()};
    }
    return std::optional<CacheHit>{CacheHit{.source = CacheSource::Local,
                                            .duration_ms = ReadDuration(hash),
                                            .files = *std::move(restored)}};
}

auto LocalStore::Exists(std::string const& hash) const
    -> std::optional<CacheHitMetadata> {
    if (not FindArtifact(hash)) {
        return std::nullopt;
    }
    return CacheHitMetadata{.source = CacheSource::Local,
                            .duration_ms = ReadDuration(hash)};
}

auto LocalStore::ImportArtifact(std::string const& hash,
                                std::string const& bytes,
                                std::uint64_t duration_ms) const
    -> std::optional<CacheError> {
    if (not FileSystemManager::WriteFileAtomically(bytes, ArtifactPath(hash))) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not store artifact {} locally", hash);
    }
    return WriteMetadata(hash, duration_ms);
}

auto LocalStore::ReadArtifact(std::string const& hash) const
    -> std::optional<std::string> {
    if (auto artifact = FindArtifact(hash)) {
        return FileSystemManager::ReadFile(*artifact);
    }
    return std::nullopt;
}
