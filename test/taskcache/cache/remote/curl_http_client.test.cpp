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

#include "src/taskcache/cache/remote/curl_http_client.hpp"

#include <chrono>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/cache/cancellation.hpp"
#include "src/taskcache/cache/remote/http_client.hpp"

TEST_CASE("Curl client without a server", "[curl_http_client]") {
    CurlHttpClient client{};
    REQUIRE(client.IsInitialized());
    HttpRequest request{.method = HttpMethod::Head,
                        .url = "http://127.0.0.1:1/v8/artifacts/abc",
                        .headers = {{"Authorization", "Bearer token"}},
                        .body = {},
                        .timeout = std::chrono::seconds{5}};

    SECTION("cancelled before sending") {
        CancellationToken cancel{};
        cancel.Cancel();
        auto response = client.Send(request, cancel);
        REQUIRE_FALSE(response);
        CHECK(response.error().kind == TransportErrorKind::Cancelled);
    }
    SECTION("refused connection") {
        auto response = client.Send(request, CancellationToken{});
        REQUIRE_FALSE(response);
        CHECK(response.error().kind == TransportErrorKind::Network);
        CHECK_FALSE(response.error().message.empty());
    }
}
