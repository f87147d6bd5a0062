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

#include "src/taskcache/cache/cache_config.hpp"

#include <charconv>
#include <cstdlib>
#include <exception>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/json.hpp"

namespace {

[[nodiscard]] auto ParseAccess(std::string_view text)
    -> std::optional<CacheAccess> {
    if (text.empty()) {
        return CacheAccess{};
    }
    if (text == "r") {
        return CacheAccess{.read = true};
    }
    if (text == "w") {
        return CacheAccess{.write = true};
    }
    if (text == "rw") {
        return CacheAccess{.read = true, .write = true};
    }
    return std::nullopt;
}

[[nodiscard]] auto AccessToString(CacheAccess const& access) -> std::string {
    return fmt::format(
        "{}{}", access.read ? "r" : "", access.write ? "w" : "");
}

[[nodiscard]] auto ParseSeconds(std::string const& name,
                                std::string const& value)
    -> expected<std::chrono::seconds, std::string> {
    unsigned int seconds{};
    auto const* end = value.data() + value.size();  // NOLINT
    auto [ptr, ec] = std::from_chars(value.data(), end, seconds);
    if (value.empty() or ec != std::errc{} or ptr != end) {
        return unexpected{fmt::format(
            "invalid value {} for {}: expected a number of seconds",
            value,
            name)};
    }
    return std::chrono::seconds{seconds};
}

}  // namespace

auto ParseCacheActions(std::string const& text)
    -> expected<CacheActions, std::string> {
    CacheActions actions{.local = CacheAccess{}, .remote = CacheAccess{}};
    if (text.empty()) {
        return actions;
    }
    std::set<std::string_view> seen{};
    auto rest = std::string_view{text};
    while (true) {
        auto const comma = rest.find(',');
        auto const item = rest.substr(0, comma);
        auto const colon = item.find(':');
        if (colon == std::string_view::npos) {
            return unexpected{fmt::format(
                "invalid cache item {}: expected <source>:<actions>", item)};
        }
        auto const source = item.substr(0, colon);
        auto access = ParseAccess(item.substr(colon + 1));
        if (not access) {
            return unexpected{fmt::format(
                "invalid cache actions {} for {}: expected r, w, rw or nothing",
                item.substr(colon + 1),
                source)};
        }
        if (not seen.insert(source).second) {
            return unexpected{
                fmt::format("duplicate cache source {}", source)};
        }
        if (source == "local") {
            actions.local = *access;
        }
        else if (source == "remote") {
            actions.remote = *access;
        }
        else {
            return unexpected{fmt::format(
                "unknown cache source {}: expected local or remote", source)};
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest = rest.substr(comma + 1);
    }
    return actions;
}

auto ToString(CacheActions const& actions) -> std::string {
    return fmt::format("local:{},remote:{}",
                       AccessToString(actions.local),
                       AccessToString(actions.remote));
}

auto CacheOpts::Defaults(std::filesystem::path const& repo_root) -> CacheOpts {
    CacheOpts opts{};
    opts.cache_dir = repo_root / "node_modules" / ".cache" / "turbo";
    return opts;
}

auto CacheOpts::MakeRunState() const
    -> gsl::not_null<std::shared_ptr<RunState>> {
    return std::make_shared<RunState>(max_remote_failures);
}

auto ProcessEnvLookup() -> EnvLookup {
    return [](std::string const& name) -> std::optional<std::string> {
        if (auto const* value = std::getenv(name.c_str())) {
            return std::string{value};
        }
        return std::nullopt;
    };
}

auto ApplyCacheConfigJson(nlohmann::json const& config,
                          gsl::not_null<CacheOpts*> const& opts)
    -> std::optional<std::string> {
    if (not config.is_object()) {
        return fmt::format("cache config must be an object, found {}",
                           config.dump());
    }
    std::optional<std::string> error{};
    auto record = [&error](std::string const& msg) { error = msg; };
    auto const read_string = [&](nlohmann::json const& obj,
                                 std::string const& key)
        -> std::optional<std::string> {
        if (not obj.contains(key)) {
            return std::nullopt;
        }
        return ExtractValueAs<std::string>(obj, key, record);
    };

    if (auto dir = read_string(config, "cacheDir")) {
        opts->cache_dir = *dir;
    }
    if (auto cache = read_string(config, "cache")) {
        auto actions = ParseCacheActions(*cache);
        if (not actions) {
            return std::move(actions).error();
        }
        opts->actions = *actions;
    }
    if (error) {
        return error;
    }

    auto it = config.find("remoteCache");
    if (it == config.end()) {
        return std::nullopt;
    }
    auto const& remote = *it;
    if (not remote.is_object()) {
        return fmt::format("remoteCache must be an object, found {}",
                           remote.dump());
    }
    if (auto url = read_string(remote, "apiUrl")) {
        opts->remote.api_url = *url;
    }
    if (auto team_id = read_string(remote, "teamId")) {
        opts->remote.team_id = *team_id;
    }
    if (auto slug = read_string(remote, "teamSlug")) {
        opts->remote.team_slug = *slug;
    }
    if (auto token = read_string(remote, "token")) {
        opts->remote.token = *token;
    }
    if (remote.contains("timeout")) {
        if (auto timeout =
                ExtractValueAs<unsigned int>(remote, "timeout", record)) {
            opts->remote.timeout = std::chrono::seconds{*timeout};
        }
    }
    if (remote.contains("uploadTimeout")) {
        if (auto timeout = ExtractValueAs<unsigned int>(
                remote, "uploadTimeout", record)) {
            opts->remote.upload_timeout = std::chrono::seconds{*timeout};
        }
    }
    if (remote.contains("signature")) {
        if (auto signature =
                ExtractValueAs<bool>(remote, "signature", record)) {
            opts->remote.signature = *signature;
        }
    }
    if (remote.contains("enabled")) {
        if (auto enabled = ExtractValueAs<bool>(remote, "enabled", record)) {
            opts->actions.remote = CacheAccess{.read = *enabled,
                                               .write = *enabled};
        }
    }
    if (error) {
        return fmt::format("invalid remoteCache config: {}", *error);
    }
    return std::nullopt;
}

auto ApplyCacheEnv(EnvLookup const& env, gsl::not_null<CacheOpts*> const& opts)
    -> std::optional<std::string> {
    if (auto dir = env("TURBO_CACHE_DIR")) {
        opts->cache_dir = *dir;
    }
    if (auto cache = env("TURBO_CACHE")) {
        auto actions = ParseCacheActions(*cache);
        if (not actions) {
            return fmt::format("invalid TURBO_CACHE: {}", actions.error());
        }
        opts->actions = *actions;
    }
    if (auto url = env("TURBO_API")) {
        opts->remote.api_url = *url;
    }
    if (auto token = env("TURBO_TOKEN")) {
        opts->remote.token = *token;
    }
    if (auto slug = env("TURBO_TEAM")) {
        opts->remote.team_slug = *slug;
    }
    if (auto team_id = env("TURBO_TEAMID")) {
        opts->remote.team_id = *team_id;
    }
    if (auto value = env("TURBO_REMOTE_CACHE_TIMEOUT")) {
        auto timeout = ParseSeconds("TURBO_REMOTE_CACHE_TIMEOUT", *value);
        if (not timeout) {
            return std::move(timeout).error();
        }
        opts->remote.timeout = *timeout;
    }
    if (auto value = env("TURBO_REMOTE_CACHE_UPLOAD_TIMEOUT")) {
        auto timeout =
            ParseSeconds("TURBO_REMOTE_CACHE_UPLOAD_TIMEOUT", *value);
        if (not timeout) {
            return std::move(timeout).error();
        }
        opts->remote.upload_timeout = *timeout;
    }
    if (auto key = env(kSignatureKeyEnvVar)) {
        opts->remote.signature_key = *key;
    }
    if (auto verbosity = env("TURBO_LOG_VERBOSITY")) {
        auto level = ParseLogLevel(*verbosity);
        if (not level) {
            return fmt::format("invalid TURBO_LOG_VERBOSITY: {}", *verbosity);
        }
        opts->log_level = *level;
    }
    return std::nullopt;
}

auto LoadCacheOpts(std::filesystem::path const& repo_root,
                   std::optional<std::filesystem::path> const& config_file,
                   EnvLookup const& env) -> expected<CacheOpts, std::string> {
    auto opts = CacheOpts::Defaults(repo_root);
    if (config_file) {
        auto content = FileSystemManager::ReadFile(*config_file);
        if (not content) {
            return unexpected{fmt::format("could not read cache config {}",
                                          config_file->string())};
        }
        auto config = ParseJson(*content);
        if (not config) {
            return unexpected{fmt::format("parsing cache config {} failed:\n{}",
                                          config_file->string(),
                                          config.error())};
        }
        if (auto error = ApplyCacheConfigJson(*config, &opts)) {
            return unexpected{fmt::format(
                "in cache config {}: {}", config_file->string(), *error)};
        }
    }
    if (auto error = ApplyCacheEnv(env, &opts)) {
        return unexpected{std::move(*error)};
    }
    if (opts.cache_dir.is_relative()) {
        opts.cache_dir = repo_root / opts.cache_dir;
    }
    if (opts.actions.remote.Enabled() and opts.remote.token.empty()) {
        Logger::Log(LogLevel::Warning,
                    "remote caching is enabled but no token is configured, "
                    "set TURBO_TOKEN. Using the local cache only");
        opts.actions.remote = CacheAccess{};
    }
    return opts;
}
