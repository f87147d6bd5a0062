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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_CURL_HTTP_CLIENT_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_CURL_HTTP_CLIENT_HPP

#include <cstddef>
#include <string>

#include "src/taskcache/cache/remote/http_client.hpp"

/// \brief HTTP transport on top of libcurl. Every request uses its own easy
/// handle, so one instance can be shared between worker threads.
/// Owns the libcurl global state for its lifetime; create at most one
/// instance at a time.
class CurlHttpClient final : public IHttpClient {
  public:
    CurlHttpClient() noexcept;
    CurlHttpClient(CurlHttpClient const&) = delete;
    CurlHttpClient(CurlHttpClient&&) = delete;
    auto operator=(CurlHttpClient const&) -> CurlHttpClient& = delete;
    auto operator=(CurlHttpClient&&) -> CurlHttpClient& = delete;
    ~CurlHttpClient() noexcept final;

    [[nodiscard]] auto IsInitialized() const noexcept -> bool {
        return initialized_;
    }

    [[nodiscard]] auto Send(HttpRequest const& request,
                            CancellationToken const& cancel) noexcept
        -> expected<HttpResponse, TransportError> final;

  private:
    bool initialized_{false};

    static auto WriteToString(char* data,
                              std::size_t size,
                              std::size_t nmemb,
                              void* userptr) -> std::size_t;

    static auto CollectHeader(char* data,
                              std::size_t size,
                              std::size_t nmemb,
                              void* userptr) -> std::size_t;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_CURL_HTTP_CLIENT_HPP
