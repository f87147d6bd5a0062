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

#include "src/taskcache/cache/remote/remote_store.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/cache/remote/artifact_signature.hpp"
#include "test/utils/remote/fake_http_client.hpp"

namespace {

constexpr auto kHash = "0123456789abcdef";

[[nodiscard]] auto Options() -> RemoteStoreOptions {
    RemoteStoreOptions options{};
    options.api_url = "https://cache.example.com/api/";
    options.token = "secret-token";
    options.team_id = "team_abc";
    options.team_slug = "acme";
    return options;
}

[[nodiscard]] auto HeaderOf(HttpRequest const& request,
                            std::string const& name)
    -> std::optional<std::string> {
    auto it = std::find_if(request.headers.begin(),
                           request.headers.end(),
                           [&name](auto const& h) { return h.first == name; });
    if (it == request.headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

class RemoteStoreFixture {
  public:
    std::shared_ptr<FakeHttpClient> client{std::make_shared<FakeHttpClient>()};
    std::shared_ptr<RunState> run_state{std::make_shared<RunState>()};
    std::vector<std::chrono::seconds> slept{};
    CancellationToken cancel{};

    [[nodiscard]] auto Create(RemoteStoreOptions options = Options())
        -> RemoteStore {
        return RemoteStore{std::move(options),
                           client,
                           run_state,
                           RetryConfig{},
                           [this](std::chrono::seconds s) {
                               slept.push_back(s);
                           }};
    }
};

}  // namespace

TEST_CASE("Artifact URL carries the team scope", "[remote_store]") {
    auto client = std::make_shared<FakeHttpClient>();
    auto run_state = std::make_shared<RunState>();

    SECTION("team id and slug") {
        RemoteStore store{Options(), client, run_state};
        CHECK(store.ArtifactUrl(kHash) ==
              "https://cache.example.com/api/v8/artifacts/0123456789abcdef"
              "?teamId=team_abc&slug=acme");
    }
    SECTION("team id without the team_ prefix is not sent") {
        auto options = Options();
        options.team_id = "abc";
        options.team_slug.clear();
        RemoteStore store{options, client, run_state};
        CHECK(store.ArtifactUrl(kHash) ==
              "https://cache.example.com/api/v8/artifacts/0123456789abcdef");
    }
}

TEST_CASE("Retryable statuses", "[remote_store]") {
    CHECK(IsRetryableStatus(0));
    CHECK(IsRetryableStatus(429));
    CHECK(IsRetryableStatus(500));
    CHECK(IsRetryableStatus(503));
    CHECK_FALSE(IsRetryableStatus(501));
    CHECK_FALSE(IsRetryableStatus(200));
    CHECK_FALSE(IsRetryableStatus(403));
    CHECK_FALSE(IsRetryableStatus(404));
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Upload and download round trip",
                 "[remote_store]") {
    auto store = Create();
    REQUIRE_FALSE(store.Put(kHash, "artifact bytes", 1234, cancel));

    auto requests = client->Requests();
    REQUIRE(requests.size() == 1);
    auto const& put = requests[0];
    CHECK(put.method == HttpMethod::Put);
    CHECK(put.body == "artifact bytes");
    CHECK(HeaderOf(put, "Authorization") == "Bearer secret-token");
    CHECK(HeaderOf(put, "Content-Type") == "application/octet-stream");
    CHECK(HeaderOf(put, "x-artifact-duration") == "1234");
    CHECK_FALSE(HeaderOf(put, "x-artifact-tag"));
    CHECK(put.timeout == std::chrono::seconds{60});

    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE(fetched);
    REQUIRE(*fetched);
    CHECK((*fetched)->bytes == "artifact bytes");
    CHECK((*fetched)->duration_ms == 1234);

    auto exists = store.Exists(kHash, cancel);
    REQUIRE(exists);
    REQUIRE(*exists);
    CHECK((*exists)->source == CacheSource::Remote);
    CHECK((*exists)->duration_ms == 1234);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Missing artifact is a miss",
                 "[remote_store]") {
    auto store = Create();
    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE(fetched);
    CHECK_FALSE(*fetched);
    CHECK(run_state->RemoteFailures() == 0);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Transient failures are retried",
                 "[remote_store]") {
    auto store = Create();
    client->ScriptStatus(503);
    client->ScriptStatus(503);
    client->Script(HttpResponse{
        .status = 200, .headers = {{"x-artifact-duration", "7"}}, .body = "a"});

    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE(fetched);
    REQUIRE(*fetched);
    CHECK((*fetched)->bytes == "a");
    CHECK(client->RequestCount() == 3);
    CHECK(slept == std::vector<std::chrono::seconds>{std::chrono::seconds{2},
                                                     std::chrono::seconds{4}});
    CHECK(run_state->RemoteFailures() == 2);
    CHECK_FALSE(run_state->IsRemoteTripped());
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Rate limiting is retried, 501 is not",
                 "[remote_store]") {
    auto store = Create();

    SECTION("429") {
        client->ScriptStatus(429);
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE(fetched);
        CHECK_FALSE(*fetched);
        CHECK(client->RequestCount() == 2);
    }
    SECTION("501") {
        client->ScriptStatus(501);
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE_FALSE(fetched);
        CHECK(fetched.error().kind == CacheErrorKind::Remote);
        CHECK(client->RequestCount() == 1);
        CHECK(run_state->RemoteFailures() == 0);
    }
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "TLS verification failures are never retried",
                 "[remote_store]") {
    auto store = Create();
    client->ScriptTransportError(TransportErrorKind::TlsVerification);

    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE_FALSE(fetched);
    CHECK(fetched.error().kind == CacheErrorKind::Remote);
    CHECK(client->RequestCount() == 1);
    CHECK(slept.empty());
    CHECK(run_state->RemoteFailures() == 1);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Exhausted retries report the last failure",
                 "[remote_store]") {
    auto store = Create();
    client->ScriptTransportError(TransportErrorKind::Timeout);
    client->ScriptTransportError(TransportErrorKind::Network);
    client->ScriptTransportError(TransportErrorKind::Network);

    auto error = store.Put(kHash, "x", 1, cancel);
    REQUIRE(error);
    CHECK(error->kind == CacheErrorKind::Remote);
    CHECK(client->RequestCount() == 3);
    CHECK(run_state->IsRemoteTripped());
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Circuit breaker skips the network once tripped",
                 "[remote_store]") {
    auto store = Create();
    for (int i = 0; i < 3; ++i) {
        client->ScriptTransportError(TransportErrorKind::TlsVerification);
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE_FALSE(fetched);
    }
    REQUIRE(client->RequestCount() == 3);
    REQUIRE(run_state->IsRemoteTripped());

    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE_FALSE(fetched);
    CHECK(fetched.error().kind == CacheErrorKind::TooManyFailures);
    CHECK(client->RequestCount() == 3);

    CHECK(store.Put(kHash, "x", 1, cancel)->kind ==
          CacheErrorKind::TooManyFailures);
    CHECK(client->RequestCount() == 3);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Forbidden is reported as such",
                 "[remote_store]") {
    auto store = Create();
    client->ScriptStatus(403);
    auto error = store.Put(kHash, "x", 1, cancel);
    REQUIRE(error);
    CHECK(error->kind == CacheErrorKind::Forbidden);
    CHECK(client->RequestCount() == 1);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Cancelled requests stop immediately",
                 "[remote_store]") {
    auto store = Create();
    cancel.Cancel();
    auto fetched = store.Fetch(kHash, cancel);
    REQUIRE_FALSE(fetched);
    CHECK(fetched.error().kind == CacheErrorKind::Cancelled);
    CHECK(client->RequestCount() == 0);
}

TEST_CASE_METHOD(RemoteStoreFixture,
                 "Signed artifacts",
                 "[remote_store]") {
    auto options = Options();
    options.signature = true;
    options.signature_key = "signing-key";
    auto store = Create(options);

    REQUIRE_FALSE(store.Put(kHash, "signed bytes", 5, cancel));
    auto const put = client->Requests().front();
    auto tag = HeaderOf(put, "x-artifact-tag");
    REQUIRE(tag);
    auto expected_tag = ArtifactSignature{"team_abc", "signing-key"}
                            .GenerateTag(kHash, "signed bytes");
    REQUIRE(expected_tag);
    CHECK(*tag == *expected_tag);

    SECTION("valid tag") {
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE(fetched);
        REQUIRE(*fetched);
        CHECK((*fetched)->tag == tag);
    }
    SECTION("missing tag") {
        client->ScriptStatus(200, "signed bytes");
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE_FALSE(fetched);
        CHECK(fetched.error().kind == CacheErrorKind::Signature);
    }
    SECTION("tampered artifact") {
        client->Script(HttpResponse{.status = 200,
                                    .headers = {{"x-artifact-tag", *tag}},
                                    .body = "tampered bytes"});
        auto fetched = store.Fetch(kHash, cancel);
        REQUIRE_FALSE(fetched);
        CHECK(fetched.error().kind == CacheErrorKind::Signature);
    }
}
