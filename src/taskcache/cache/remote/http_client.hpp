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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_HTTP_CLIENT_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/taskcache/cache/cancellation.hpp"
#include "src/utils/cpp/expected.hpp"

enum class HttpMethod : std::uint8_t { Get, Put, Head };

[[nodiscard]] static inline auto ToString(HttpMethod method) -> std::string {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Head:
            return "HEAD";
    }
    return "GET";
}

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::seconds timeout{20};
};

struct HttpResponse {
    long status{};
    /// \brief Header names are stored in lower case.
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto Header(std::string const& name) const
        -> std::optional<std::string> {
        if (auto it = headers.find(name); it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

enum class TransportErrorKind : std::uint8_t {
    Network,
    Timeout,
    TlsVerification,
    Cancelled
};

/// \brief Failure below the HTTP layer: no status code was received.
struct TransportError {
    TransportErrorKind kind{TransportErrorKind::Network};
    std::string message;
};

/// \brief Minimal blocking HTTP transport used by the remote store.
class IHttpClient {
  public:
    IHttpClient() = default;
    IHttpClient(IHttpClient const&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    auto operator=(IHttpClient const&) -> IHttpClient& = delete;
    auto operator=(IHttpClient&&) -> IHttpClient& = delete;
    virtual ~IHttpClient() noexcept = default;

    /// \brief Perform a single request. Must return promptly with
    /// TransportErrorKind::Cancelled once \p cancel is triggered.
    /// Thread-safe: the same client serves concurrent requests.
    [[nodiscard]] virtual auto Send(HttpRequest const& request,
                                    CancellationToken const& cancel) noexcept
        -> expected<HttpResponse, TransportError> = 0;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_HTTP_CLIENT_HPP
