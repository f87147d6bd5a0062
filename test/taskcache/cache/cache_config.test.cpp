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

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "test/utils/test_env.hpp"

namespace {

[[nodiscard]] auto EnvOf(std::map<std::string, std::string> vars)
    -> EnvLookup {
    return [vars = std::move(vars)](
               std::string const& name) -> std::optional<std::string> {
        if (auto it = vars.find(name); it != vars.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

}  // namespace

TEST_CASE("Parse cache actions", "[cache_config]") {
    SECTION("local and remote") {
        auto actions = ParseCacheActions("local:rw,remote:r");
        REQUIRE(actions);
        CHECK(actions->local == CacheAccess{.read = true, .write = true});
        CHECK(actions->remote == CacheAccess{.read = true, .write = false});
        CHECK(ToString(*actions) == "local:rw,remote:r");
    }
    SECTION("sources not named are disabled") {
        auto actions = ParseCacheActions("remote:w");
        REQUIRE(actions);
        CHECK_FALSE(actions->local.Enabled());
        CHECK(actions->remote == CacheAccess{.read = false, .write = true});
    }
    SECTION("empty access") {
        auto actions = ParseCacheActions("local:");
        REQUIRE(actions);
        CHECK_FALSE(actions->local.Enabled());
    }
    SECTION("empty string disables everything") {
        auto actions = ParseCacheActions("");
        REQUIRE(actions);
        CHECK(ToString(*actions) == "local:,remote:");
    }
    SECTION("malformed") {
        CHECK_FALSE(ParseCacheActions("local"));
        CHECK_FALSE(ParseCacheActions("local:x"));
        CHECK_FALSE(ParseCacheActions("disk:rw"));
        CHECK_FALSE(ParseCacheActions("local:r,local:w"));
    }
}

TEST_CASE("Cache defaults", "[cache_config]") {
    auto opts = CacheOpts::Defaults("/repo");
    CHECK(opts.cache_dir ==
          std::filesystem::path{"/repo/node_modules/.cache/turbo"});
    CHECK(opts.actions.local == CacheAccess{.read = true, .write = true});
    CHECK_FALSE(opts.actions.remote.Enabled());
    CHECK(opts.max_remote_failures == 3);
    CHECK(opts.remote.api_url == kDefaultApiUrl);
    CHECK(opts.remote.timeout == std::chrono::seconds{20});
    CHECK(opts.remote.upload_timeout == std::chrono::seconds{60});
}

TEST_CASE("Run state uses the configured failure threshold",
          "[cache_config]") {
    auto opts = CacheOpts::Defaults("/repo");
    opts.max_remote_failures = 1;
    auto state = opts.MakeRunState();
    CHECK_FALSE(state->IsRemoteTripped());
    CHECK(state->RecordRemoteFailure());
    CHECK(state->IsRemoteTripped());

    auto defaults = CacheOpts::Defaults("/repo").MakeRunState();
    CHECK_FALSE(defaults->RecordRemoteFailure());
    CHECK_FALSE(defaults->RecordRemoteFailure());
    CHECK(defaults->RecordRemoteFailure());
}

TEST_CASE("Environment overrides", "[cache_config]") {
    auto opts = CacheOpts::Defaults("/repo");

    SECTION("all settings") {
        auto env = EnvOf({{"TURBO_CACHE_DIR", "/cache"},
                          {"TURBO_CACHE", "local:r,remote:rw"},
                          {"TURBO_API", "https://cache.example.com"},
                          {"TURBO_TOKEN", "token"},
                          {"TURBO_TEAM", "acme"},
                          {"TURBO_TEAMID", "team_acme"},
                          {"TURBO_REMOTE_CACHE_TIMEOUT", "5"},
                          {"TURBO_REMOTE_CACHE_UPLOAD_TIMEOUT", "90"},
                          {"TURBO_LOG_VERBOSITY", "debug"}});
        REQUIRE_FALSE(ApplyCacheEnv(env, &opts));
        CHECK(opts.cache_dir == std::filesystem::path{"/cache"});
        CHECK(ToString(opts.actions) == "local:r,remote:rw");
        CHECK(opts.remote.api_url == "https://cache.example.com");
        CHECK(opts.remote.token == "token");
        CHECK(opts.remote.team_slug == "acme");
        CHECK(opts.remote.team_id == "team_acme");
        CHECK(opts.remote.timeout == std::chrono::seconds{5});
        CHECK(opts.remote.upload_timeout == std::chrono::seconds{90});
        CHECK(opts.log_level == LogLevel::Debug);
    }
    SECTION("invalid timeout") {
        auto env = EnvOf({{"TURBO_REMOTE_CACHE_TIMEOUT", "soon"}});
        auto error = ApplyCacheEnv(env, &opts);
        REQUIRE(error);
        CHECK(error->find("TURBO_REMOTE_CACHE_TIMEOUT") != std::string::npos);
    }
    SECTION("invalid cache actions") {
        CHECK(ApplyCacheEnv(EnvOf({{"TURBO_CACHE", "remote"}}), &opts));
    }
}

TEST_CASE("JSON configuration", "[cache_config]") {
    auto opts = CacheOpts::Defaults("/repo");

    SECTION("remote cache settings") {
        auto config = nlohmann::json::parse(R"({
            "cacheDir": ".cache",
            "remoteCache": {
                "apiUrl": "https://cache.example.com",
                "teamId": "team_x",
                "teamSlug": "x",
                "timeout": 3,
                "uploadTimeout": 7,
                "signature": true,
                "enabled": true
            }
        })");
        REQUIRE_FALSE(ApplyCacheConfigJson(config, &opts));
        CHECK(opts.cache_dir == std::filesystem::path{".cache"});
        CHECK(opts.remote.api_url == "https://cache.example.com");
        CHECK(opts.remote.team_id == "team_x");
        CHECK(opts.remote.team_slug == "x");
        CHECK(opts.remote.timeout == std::chrono::seconds{3});
        CHECK(opts.remote.upload_timeout == std::chrono::seconds{7});
        CHECK(opts.remote.signature);
        CHECK(opts.actions.remote == CacheAccess{.read = true, .write = true});
    }
    SECTION("wrong types") {
        CHECK(ApplyCacheConfigJson(nlohmann::json::array(), &opts));
        CHECK(ApplyCacheConfigJson(
            nlohmann::json{{"remoteCache", {{"timeout", "long"}}}}, &opts));
        CHECK(ApplyCacheConfigJson(nlohmann::json{{"cacheDir", 1}}, &opts));
    }
}

TEST_CASE("Load cache options", "[cache_config]") {
    ScratchDir scratch{"cache_config"};
    REQUIRE(scratch.Valid());
    auto const repo = scratch.GetPath();

    SECTION("defaults without config file") {
        auto opts = LoadCacheOpts(repo, std::nullopt, EnvOf({}));
        REQUIRE(opts);
        CHECK(opts->cache_dir == repo / "node_modules/.cache/turbo");
    }
    SECTION("environment wins over the config file") {
        auto const config = repo / "cache.json";
        REQUIRE(FileSystemManager::WriteFile(
            R"({"cacheDir": "from-file", "cache": "local:r"})", config));
        auto opts = LoadCacheOpts(
            repo, config, EnvOf({{"TURBO_CACHE_DIR", "from-env"}}));
        REQUIRE(opts);
        CHECK(opts->cache_dir == repo / "from-env");
        CHECK(ToString(opts->actions) == "local:r,remote:");
    }
    SECTION("remote caching without a token falls back to local") {
        auto env = EnvOf({{"TURBO_CACHE", "local:rw,remote:rw"}});
        auto opts = LoadCacheOpts(repo, std::nullopt, env);
        REQUIRE(opts);
        CHECK(ToString(opts->actions) == "local:rw,remote:");
    }
    SECTION("remote caching with a token") {
        auto env = EnvOf(
            {{"TURBO_CACHE", "local:rw,remote:rw"}, {"TURBO_TOKEN", "t"}});
        auto opts = LoadCacheOpts(repo, std::nullopt, env);
        REQUIRE(opts);
        CHECK(ToString(opts->actions) == "local:rw,remote:rw");
    }
    SECTION("unreadable config file") {
        CHECK_FALSE(LoadCacheOpts(repo, repo / "missing.json", EnvOf({})));
    }
    SECTION("malformed config file") {
        auto const config = repo / "cache.json";
        REQUIRE(FileSystemManager::WriteFile("{", config));
        CHECK_FALSE(LoadCacheOpts(repo, config, EnvOf({})));
    }
}
