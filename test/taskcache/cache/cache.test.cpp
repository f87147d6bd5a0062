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

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/cache/cache_config.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "test/utils/remote/fake_http_client.hpp"
#include "test/utils/test_env.hpp"

namespace {

constexpr auto kHash = "a1b2c3d4e5f60718";

class CacheFixture {
  public:
    ScratchDir scratch{"cache"};
    std::shared_ptr<FakeHttpClient> client{std::make_shared<FakeHttpClient>()};
    CancellationToken cancel{};

    CacheFixture() {
        REQUIRE(scratch.Valid());
        REQUIRE(FileSystemManager::WriteFile("output\n", Repo() / "dist/x.js"));
    }

    [[nodiscard]] auto Repo() const -> std::filesystem::path {
        return scratch.GetPath() / "repo";
    }

    /// \brief Cache with its own local directory \p name, sharing the fake
    /// remote with every other cache of this fixture.
    [[nodiscard]] auto MakeCache(std::string const& name,
                                 std::string const& actions,
                                 std::shared_ptr<RunState> run_state =
                                     std::make_shared<RunState>())
        -> std::unique_ptr<Cache> {
        auto opts = CacheOpts::Defaults(Repo());
        opts.cache_dir = scratch.GetPath() / name;
        auto parsed = ParseCacheActions(actions);
        REQUIRE(parsed);
        opts.actions = *parsed;
        opts.remote.api_url = "https://cache.example.com";
        opts.remote.token = "token";
        return Cache::Create(
            opts, client, run_state, [](std::chrono::seconds /*unused*/) {});
    }

    void RemoveOutputs() const {
        REQUIRE(FileSystemManager::RemoveDirectory(Repo() / "dist",
                                                   /*recursively=*/true));
    }
};

}  // namespace

TEST_CASE_METHOD(CacheFixture, "Local cache round trip", "[cache]") {
    auto cache = MakeCache("local", "local:rw");
    CHECK(cache->Actions() ==
          CacheActions{.local = {.read = true, .write = true}, .remote = {}});
    auto miss = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE(miss);
    CHECK_FALSE(*miss);

    REQUIRE_FALSE(cache->Put(Repo(), kHash, 100, {"dist/x.js"}, cancel));
    RemoveOutputs();

    auto hit = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE(hit);
    REQUIRE(*hit);
    CHECK((*hit)->source == CacheSource::Local);
    CHECK((*hit)->duration_ms == 100);
    CHECK(FileSystemManager::ReadFile(Repo() / "dist/x.js") == "output\n");
    CHECK(client->RequestCount() == 0);
}

TEST_CASE_METHOD(CacheFixture, "Read-only local cache", "[cache]") {
    auto cache = MakeCache("local", "local:r");
    REQUIRE_FALSE(cache->Put(Repo(), kHash, 100, {"dist/x.js"}, cancel));
    CHECK_FALSE(cache->Exists(kHash, cancel));
}

TEST_CASE_METHOD(CacheFixture,
                 "Remote hits are imported locally",
                 "[cache]") {
    auto producer = MakeCache("producer", "local:rw,remote:rw");
    REQUIRE_FALSE(producer->Put(Repo(), kHash, 250, {"dist/x.js"}, cancel));
    CHECK(client->RequestCount() == 1);
    RemoveOutputs();

    auto consumer = MakeCache("consumer", "local:rw,remote:rw");
    auto hit = consumer->Fetch(Repo(), kHash, cancel);
    REQUIRE(hit);
    REQUIRE(*hit);
    CHECK((*hit)->source == CacheSource::Remote);
    CHECK((*hit)->duration_ms == 250);
    CHECK((*hit)->files == std::vector<std::string>{"dist/x.js"});
    CHECK(FileSystemManager::ReadFile(Repo() / "dist/x.js") == "output\n");
    CHECK(LocalStore{scratch.GetPath() / "consumer"}.Exists(kHash));

    // served locally from now on
    auto const requests = client->RequestCount();
    auto again = consumer->Fetch(Repo(), kHash, cancel);
    REQUIRE(again);
    REQUIRE(*again);
    CHECK((*again)->source == CacheSource::Local);
    CHECK(client->RequestCount() == requests);
}

TEST_CASE_METHOD(CacheFixture, "Remote-only cache", "[cache]") {
    auto cache = MakeCache("remote-only", "remote:rw");
    REQUIRE_FALSE(cache->Put(Repo(), kHash, 5, {"dist/x.js"}, cancel));
    CHECK_FALSE(LocalStore{scratch.GetPath() / "remote-only"}.Exists(kHash));
    RemoveOutputs();

    auto hit = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE(hit);
    REQUIRE(*hit);
    CHECK((*hit)->source == CacheSource::Remote);
    CHECK(FileSystemManager::ReadFile(Repo() / "dist/x.js") == "output\n");
    CHECK_FALSE(LocalStore{scratch.GetPath() / "remote-only"}.Exists(kHash));

    auto meta = cache->Exists(kHash, cancel);
    REQUIRE(meta);
    CHECK(meta->source == CacheSource::Remote);
    CHECK(meta->duration_ms == 5);
}

TEST_CASE_METHOD(CacheFixture,
                 "Failed uploads do not fail the put",
                 "[cache]") {
    auto cache = MakeCache("local", "local:rw,remote:rw");
    client->ScriptStatus(403);
    REQUIRE_FALSE(cache->Put(Repo(), kHash, 1, {"dist/x.js"}, cancel));
    CHECK(LocalStore{scratch.GetPath() / "local"}.Exists(kHash));
}

TEST_CASE_METHOD(CacheFixture,
                 "Unreachable remote is given up for the run",
                 "[cache]") {
    auto run_state = std::make_shared<RunState>();
    auto cache = MakeCache("local", "local:rw,remote:rw", run_state);
    client->SetOffline(true);

    auto first = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE_FALSE(first);
    CHECK(first.error().kind == CacheErrorKind::Remote);
    CHECK(client->RequestCount() == 3);
    CHECK(cache->IsRemoteTripped());

    // further lookups are local misses without network traffic
    auto second = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE(second);
    CHECK_FALSE(*second);
    REQUIRE_FALSE(cache->Put(Repo(), kHash, 1, {"dist/x.js"}, cancel));
    CHECK(client->RequestCount() == 3);
    CHECK_FALSE(run_state->ClaimTripWarning());

    auto hit = cache->Fetch(Repo(), kHash, cancel);
    REQUIRE(hit);
    REQUIRE(*hit);
    CHECK((*hit)->source == CacheSource::Local);
}
