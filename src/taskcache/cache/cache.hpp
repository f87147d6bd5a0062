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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_CACHE_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gsl/gsl"
#include "src/taskcache/cache/cache_config.hpp"
#include "src/taskcache/cache/cache_error.hpp"
#include "src/taskcache/cache/cache_item.hpp"
#include "src/taskcache/cache/cancellation.hpp"
#include "src/taskcache/cache/local_store.hpp"
#include "src/taskcache/cache/remote/http_client.hpp"
#include "src/taskcache/cache/remote/remote_store.hpp"
#include "src/taskcache/cache/run_state.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Local-first cache over the local and the remote store.
/// Remote failures never fail an operation that the local store can serve;
/// once the run state trips, the remote store is no longer contacted.
/// The entire class is thread-safe for operations on different hashes.
class Cache {
  public:
    /// \param remote   Remote store, or nullptr if there is none.
    Cache(CacheActions actions,
          LocalStore local,
          std::unique_ptr<RemoteStore> remote,
          gsl::not_null<std::shared_ptr<RunState>> run_state) noexcept;

    /// \brief Create the cache described by \p opts. The remote store uses
    /// \p http_client and is only created if remote actions are enabled.
    [[nodiscard]] static auto Create(
        CacheOpts const& opts,
        std::shared_ptr<IHttpClient> const& http_client,
        gsl::not_null<std::shared_ptr<RunState>> const& run_state,
        SleepFunction sleep = {}) -> std::unique_ptr<Cache>;

    /// \brief Restore artifact \p hash below \p anchor, trying the local
    /// store first. A remote hit is imported into the local store.
    /// \returns The hit, nullopt on a miss, or the error that prevented a
    /// lookup.
    [[nodiscard]] auto Fetch(std::filesystem::path const& anchor,
                             std::string const& hash,
                             CancellationToken const& cancel) const
        -> expected<std::optional<CacheHit>, CacheError>;

    /// \brief Store \p files (relative to \p anchor) as artifact \p hash.
    /// Only local failures are reported; remote uploads are best-effort.
    [[nodiscard]] auto Put(std::filesystem::path const& anchor,
                           std::string const& hash,
                           std::uint64_t duration_ms,
                           std::vector<std::string> const& files,
                           CancellationToken const& cancel) const
        -> std::optional<CacheError>;

    [[nodiscard]] auto Exists(std::string const& hash,
                              CancellationToken const& cancel) const
        -> std::optional<CacheHitMetadata>;

    [[nodiscard]] auto Actions() const noexcept -> CacheActions const& {
        return actions_;
    }

    /// \brief True once the remote cache has been given up for this run.
    [[nodiscard]] auto IsRemoteTripped() const noexcept -> bool {
        return run_state_->IsRemoteTripped();
    }

  private:
    CacheActions actions_;
    LocalStore local_;
    std::unique_ptr<RemoteStore> remote_;
    std::shared_ptr<RunState> run_state_;
    Logger logger_{"Cache"};

    [[nodiscard]] auto RemoteUsable() const noexcept -> bool;

    /// \brief Report a remote failure as warning; the breaker tripping is
    /// only reported once per run.
    void ReportRemoteFailure(std::string const& operation,
                             CacheError const& error) const;

    [[nodiscard]] auto RestoreRemoteArtifact(
        std::filesystem::path const& anchor,
        std::string const& hash,
        RemoteArtifact const& artifact) const
        -> expected<CacheHit, CacheError>;

    [[nodiscard]] auto Upload(std::filesystem::path const& anchor,
                              std::string const& hash,
                              std::uint64_t duration_ms,
                              std::vector<std::string> const& files,
                              CancellationToken const& cancel) const
        -> std::optional<CacheError>;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_CACHE_HPP
