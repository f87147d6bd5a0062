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

#include "src/taskcache/cache/cache.hpp"

#include <utility>

#include "src/taskcache/cache/archive_codec.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/log_level.hpp"

namespace {

/// \brief Temporary file that is removed when going out of scope.
class ScopedTempFile {
  public:
    explicit ScopedTempFile(std::filesystem::path path) noexcept
        : path_{std::move(path)} {}
    ScopedTempFile(ScopedTempFile const&) = delete;
    ScopedTempFile(ScopedTempFile&&) = delete;
    auto operator=(ScopedTempFile const&) -> ScopedTempFile& = delete;
    auto operator=(ScopedTempFile&&) -> ScopedTempFile& = delete;
    ~ScopedTempFile() noexcept {
        if (not FileSystemManager::RemoveFile(path_)) {
            Logger::Log(LogLevel::Warning,
                        "could not remove temporary file {}",
                        path_.string());
        }
    }

    [[nodiscard]] auto GetPath() const noexcept
        -> std::filesystem::path const& {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

}  // namespace

Cache::Cache(CacheActions actions,
             LocalStore local,
             std::unique_ptr<RemoteStore> remote,
             gsl::not_null<std::shared_ptr<RunState>> run_state) noexcept
    : actions_{actions},
      local_{std::move(local)},
      remote_{std::move(remote)},
      run_state_{std::move(run_state)} {}

auto Cache::Create(CacheOpts const& opts,
                   std::shared_ptr<IHttpClient> const& http_client,
                   gsl::not_null<std::shared_ptr<RunState>> const& run_state,
                   SleepFunction sleep) -> std::unique_ptr<Cache> {
    std::unique_ptr<RemoteStore> remote{};
    if (opts.actions.remote.Enabled()) {
        if (http_client == nullptr) {
            Logger::Log(LogLevel::Warning,
                        "remote caching requested, but no HTTP client is "
                        "available");
        }
        else {
            remote = std::make_unique<RemoteStore>(opts.remote,
                                                   http_client,
                                                   run_state,
                                                   opts.retry,
                                                   std::move(sleep));
        }
    }
    return std::make_unique<Cache>(
        opts.actions, LocalStore{opts.cache_dir}, std::move(remote), run_state);
}

auto Cache::RemoteUsable() const noexcept -> bool {
    if (remote_ == nullptr) {
        return false;
    }
    if (run_state_->IsRemoteTripped()) {
        if (run_state_->ClaimTripWarning()) {
            logger_.Emit(LogLevel::Warning,
                         "too many failed requests to the remote cache, "
                         "skipping it for the rest of the run");
        }
        return false;
    }
    return true;
}

void Cache::ReportRemoteFailure(std::string const& operation,
                                CacheError const& error) const {
    if (error.kind == CacheErrorKind::TooManyFailures) {
        // reported once, when the breaker is noticed
        static_cast<void>(RemoteUsable());
        return;
    }
    logger_.Emit(LogLevel::Warning,
                 "failed to {} remote cache: {}",
                 operation,
                 error.ToString());
}

auto Cache::RestoreRemoteArtifact(std::filesystem::path const& anchor,
                                  std::string const& hash,
                                  RemoteArtifact const& artifact) const
    -> expected<CacheHit, CacheError> {
    if (actions_.local.write) {
        if (auto error = local_.ImportArtifact(
                hash, artifact.bytes, artifact.duration_ms)) {
            return unexpected{*std::move(error)};
        }
        auto restored =
            ArchiveReader::Restore(local_.ArtifactPath(hash), anchor);
        if (not restored) {
            return unexpected{std::move(restored).error()};
        }
        return CacheHit{.source = CacheSource::Remote,
                        .duration_ms = artifact.duration_ms,
                        .files = *std::move(restored)};
    }

    // no local writes: restore from a scratch copy
    auto tmp_path =
        FileSystemManager::TemporarySibling(local_.ArtifactPath(hash));
    if (not tmp_path or
        not FileSystemManager::WriteFile(artifact.bytes, *tmp_path)) {
        return MakeCacheError(CacheErrorKind::Io,
                              "could not stage remote artifact {}",
                              hash);
    }
    ScopedTempFile staged{*std::move(tmp_path)};
    auto restored = ArchiveReader::Restore(staged.GetPath(), anchor);
    if (not restored) {
        return unexpected{std::move(restored).error()};
    }
    return CacheHit{.source = CacheSource::Remote,
                    .duration_ms = artifact.duration_ms,
                    .files = *std::move(restored)};
}

auto Cache::Fetch(std::filesystem::path const& anchor,
                  std::string const& hash,
                  CancellationToken const& cancel) const
    -> expected<std::optional<CacheHit>, CacheError> {
    std::optional<CacheError> failure{};
    if (actions_.local.read) {
        auto local = local_.Fetch(anchor, hash);
        if (not local) {
            logger_.Emit(LogLevel::Debug,
                         "failed to read local cache entry {}: {}",
                         hash,
                         local.error().ToString());
            failure = std::move(local).error();
        }
        else if (*local) {
            return *std::move(local);
        }
    }

    if (actions_.remote.read and RemoteUsable()) {
        auto remote = remote_->Fetch(hash, cancel);
        if (not remote) {
            if (remote.error().kind == CacheErrorKind::TooManyFailures) {
                static_cast<void>(RemoteUsable());
            }
            else {
                failure = std::move(remote).error();
            }
        }
        else if (*remote) {
            auto hit = RestoreRemoteArtifact(anchor, hash, **remote);
            if (not hit) {
                return unexpected{std::move(hit).error()};
            }
            return std::optional<CacheHit>{*std::move(hit)};
        }
    }

    if (failure) {
        return unexpected{*std::move(failure)};
    }
    logger_.Emit(LogLevel::Debug, "cache miss for {}", hash);
    return std::optional<CacheHit>{};
}

auto Cache::Upload(std::filesystem::path const& anchor,
                   std::string const& hash,
                   std::uint64_t duration_ms,
                   std::vector<std::string> const& files,
                   CancellationToken const& cancel) const
    -> std::optional<CacheError> {
    std::optional<std::string> bytes{};
    if (actions_.local.write) {
        bytes = local_.ReadArtifact(hash);
    }
    else {
        auto tmp_path =
            FileSystemManager::TemporarySibling(local_.ArtifactPath(hash));
        if (not tmp_path) {
            return CacheError::Create(CacheErrorKind::Io,
                                      "could not stage artifact {}",
                                      hash);
        }
        ScopedTempFile staged{*std::move(tmp_path)};
        if (auto error = CreateArchive(staged.GetPath(), anchor, files)) {
            return error;
        }
        bytes = FileSystemManager::ReadFile(staged.GetPath());
    }
    if (not bytes) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not read artifact {} for upload", hash);
    }
    return remote_->Put(hash, *bytes, duration_ms, cancel);
}

auto Cache::Put(std::filesystem::path const& anchor,
                std::string const& hash,
                std::uint64_t duration_ms,
                std::vector<std::string> const& files,
                CancellationToken const& cancel) const
    -> std::optional<CacheError> {
    if (actions_.local.write) {
        if (auto error = local_.Put(anchor, hash, duration_ms, files)) {
            return error;
        }
    }
    if (actions_.remote.write and RemoteUsable()) {
        if (auto error = Upload(anchor, hash, duration_ms, files, cancel)) {
            ReportRemoteFailure("upload to", *error);
        }
    }
    return std::nullopt;
}

auto Cache::Exists(std::string const& hash,
                   CancellationToken const& cancel) const
    -> std::optional<CacheHitMetadata> {
    if (actions_.local.read) {
        if (auto meta = local_.Exists(hash)) {
            return meta;
        }
    }
    if (actions_.remote.read and RemoteUsable()) {
        auto meta = remote_->Exists(hash, cancel);
        if (meta) {
            return *meta;
        }
        ReportRemoteFailure("query", meta.error());
    }
    return std::nullopt;
}
