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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_CACHE_CONFIG_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_CACHE_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "gsl/gsl"
#include "nlohmann/json.hpp"
#include "src/taskcache/cache/remote/remote_store.hpp"
#include "src/taskcache/cache/remote/retry_config.hpp"
#include "src/taskcache/cache/run_state.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/utils/cpp/expected.hpp"

struct CacheAccess {
    bool read{false};
    bool write{false};

    [[nodiscard]] auto Enabled() const noexcept -> bool {
        return read or write;
    }
    [[nodiscard]] auto operator==(CacheAccess const&) const -> bool = default;
};

/// \brief Which cache sources may be read and written.
struct CacheActions {
    CacheAccess local{.read = true, .write = true};
    CacheAccess remote{};

    [[nodiscard]] auto operator==(CacheActions const&) const -> bool = default;
};

/// \brief Parse a cache string such as `local:rw,remote:r`.
/// Sources not named are disabled.
[[nodiscard]] auto ParseCacheActions(std::string const& text)
    -> expected<CacheActions, std::string>;

[[nodiscard]] auto ToString(CacheActions const& actions) -> std::string;

struct CacheOpts {
    std::filesystem::path cache_dir;
    CacheActions actions;
    RemoteStoreOptions remote;
    RetryConfig retry;
    std::size_t max_remote_failures{RunState::kDefaultMaxRemoteFailures};
    std::optional<LogLevel> log_level;

    /// \brief Built-in defaults for the repository at \p repo_root.
    [[nodiscard]] static auto Defaults(std::filesystem::path const& repo_root)
        -> CacheOpts;

    /// \brief Fresh state for one run, tripping after the configured number
    /// of remote failures.
    [[nodiscard]] auto MakeRunState() const
        -> gsl::not_null<std::shared_ptr<RunState>>;
};

/// \brief Lookup of environment variables; nullopt if unset.
using EnvLookup =
    std::function<std::optional<std::string>(std::string const& name)>;

/// \brief Lookup in the environment of the current process.
[[nodiscard]] auto ProcessEnvLookup() -> EnvLookup;

/// \brief Apply the settings of a JSON config object onto \p opts.
[[nodiscard]] auto ApplyCacheConfigJson(nlohmann::json const& config,
                                        gsl::not_null<CacheOpts*> const& opts)
    -> std::optional<std::string>;

/// \brief Apply `TURBO_*` environment variables onto \p opts.
[[nodiscard]] auto ApplyCacheEnv(EnvLookup const& env,
                                 gsl::not_null<CacheOpts*> const& opts)
    -> std::optional<std::string>;

/// \brief Resolve the cache options from defaults, the optional config file
/// and the environment, in increasing precedence. Remote caching without a
/// token is disabled with a warning.
[[nodiscard]] auto LoadCacheOpts(
    std::filesystem::path const& repo_root,
    std::optional<std::filesystem::path> const& config_file,
    EnvLookup const& env = ProcessEnvLookup())
    -> expected<CacheOpts, std::string>;

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_CACHE_CONFIG_HPP
