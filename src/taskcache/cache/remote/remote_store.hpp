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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_REMOTE_STORE_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_REMOTE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gsl/gsl"
#include "src/taskcache/cache/cache_error.hpp"
#include "src/taskcache/cache/cache_item.hpp"
#include "src/taskcache/cache/cancellation.hpp"
#include "src/taskcache/cache/remote/artifact_signature.hpp"
#include "src/taskcache/cache/remote/http_client.hpp"
#include "src/taskcache/cache/remote/retry.hpp"
#include "src/taskcache/cache/remote/retry_config.hpp"
#include "src/taskcache/cache/run_state.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr auto kDefaultApiUrl = "https://vercel.com/api";

struct RemoteStoreOptions {
    std::string api_url{kDefaultApiUrl};
    std::string token;
    std::string team_id;
    std::string team_slug;
    std::string user_agent{"taskcache"};
    std::chrono::seconds timeout{20};
    std::chrono::seconds upload_timeout{60};
    /// \brief Sign uploads and verify downloads.
    bool signature{false};
    /// \brief Signing key; if unset, it is taken from the environment.
    std::optional<std::string> signature_key;
};

/// \brief Artifact store behind the remote cache HTTP API.
/// Every request is retried according to the retry config; failed attempts
/// are counted in the shared run state, and no request is made once the
/// run state reports the remote cache as tripped.
/// Thread-safe as long as the HTTP client is.
class RemoteStore {
  public:
    RemoteStore(RemoteStoreOptions options,
                gsl::not_null<std::shared_ptr<IHttpClient>> client,
                gsl::not_null<std::shared_ptr<RunState>> run_state,
                RetryConfig retry_config = RetryConfig{},
                SleepFunction sleep = {});

    /// \brief Upload \p artifact for \p hash.
    [[nodiscard]] auto Put(std::string const& hash,
                           std::string const& artifact,
                           std::uint64_t duration_ms,
                           CancellationToken const& cancel) const
        -> std::optional<CacheError>;

    /// \brief Download the artifact of \p hash.
    /// \returns The artifact, nullopt on a miss, or an error.
    [[nodiscard]] auto Fetch(std::string const& hash,
                             CancellationToken const& cancel) const
        -> expected<std::optional<RemoteArtifact>, CacheError>;

    /// \brief Check for the artifact of \p hash without downloading it.
    [[nodiscard]] auto Exists(std::string const& hash,
                              CancellationToken const& cancel) const
        -> expected<std::optional<CacheHitMetadata>, CacheError>;

    [[nodiscard]] auto ArtifactUrl(std::string const& hash) const
        -> std::string;

  private:
    RemoteStoreOptions options_;
    std::shared_ptr<IHttpClient> client_;
    std::shared_ptr<RunState> run_state_;
    RetryConfig retry_config_;
    SleepFunction sleep_;
    std::optional<ArtifactSignature> signature_;
    Logger logger_{"RemoteStore"};

    [[nodiscard]] auto Headers() const
        -> std::vector<std::pair<std::string, std::string>>;

    /// \brief Send \p request with retries. A response is returned for every
    /// status that is not worth retrying.
    [[nodiscard]] auto Send(HttpRequest const& request,
                            CancellationToken const& cancel) const
        -> expected<HttpResponse, CacheError>;

    [[nodiscard]] auto Sleeper(CancellationToken const& cancel) const
        -> SleepFunction;
};

/// \brief Status codes worth another attempt: 429 and 5xx except 501.
[[nodiscard]] auto IsRetryableStatus(long status) noexcept -> bool;

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_REMOTE_STORE_HPP
