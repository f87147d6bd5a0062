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

#ifndef INCLUDED_SRC_TEST_UTILS_REMOTE_FAKE_HTTP_CLIENT_HPP
#define INCLUDED_SRC_TEST_UTILS_REMOTE_FAKE_HTTP_CLIENT_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/taskcache/cache/remote/http_client.hpp"

/// \brief Scripted transport. Replies are consumed in order; once the script
/// is exhausted, requests are served from an in-memory artifact store keyed
/// by URL path (PUT stores, GET/HEAD read, 404 if absent).
class FakeHttpClient final : public IHttpClient {
  public:
    using Reply = expected<HttpResponse, TransportError>;

    void Script(Reply reply) {
        std::lock_guard lock{mutex_};
        script_.emplace_back(std::move(reply));
    }

    void ScriptStatus(long status, std::string body = {}) {
        Script(HttpResponse{.status = status, .headers = {}, .body = body});
    }

    void ScriptTransportError(TransportErrorKind kind) {
        Script(unexpected{TransportError{.kind = kind,
                                         .message = "scripted failure"}});
    }

    /// \brief Answer every request with a network error.
    void SetOffline(bool offline) {
        std::lock_guard lock{mutex_};
        offline_ = offline;
    }

    [[nodiscard]] auto Requests() const -> std::vector<HttpRequest> {
        std::lock_guard lock{mutex_};
        return requests_;
    }

    [[nodiscard]] auto RequestCount() const -> std::size_t {
        std::lock_guard lock{mutex_};
        return requests_.size();
    }

    [[nodiscard]] auto Stored(std::string const& path) const
        -> std::optional<HttpResponse> {
        std::lock_guard lock{mutex_};
        if (auto it = store_.find(path); it != store_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto Send(HttpRequest const& request,
                            CancellationToken const& cancel) noexcept
        -> expected<HttpResponse, TransportError> final {
        std::lock_guard lock{mutex_};
        requests_.push_back(request);
        if (cancel.IsCancelled()) {
            return unexpected{TransportError{
                .kind = TransportErrorKind::Cancelled, .message = "cancelled"}};
        }
        if (offline_) {
            return unexpected{TransportError{
                .kind = TransportErrorKind::Network, .message = "offline"}};
        }
        if (not script_.empty()) {
            auto reply = std::move(script_.front());
            script_.pop_front();
            return reply;
        }
        return Serve(request);
    }

  private:
    mutable std::mutex mutex_;
    std::deque<Reply> script_;
    std::vector<HttpRequest> requests_;
    std::map<std::string, HttpResponse> store_;
    bool offline_{false};

    [[nodiscard]] static auto Path(std::string const& url) -> std::string {
        return url.substr(0, url.find('?'));
    }

    [[nodiscard]] auto Serve(HttpRequest const& request) -> HttpResponse {
        auto const path = Path(request.url);
        if (request.method == HttpMethod::Put) {
            HttpResponse stored{.status = 200, .headers = {}, .body = {}};
            for (auto const& [name, value] : request.headers) {
                if (name.starts_with("x-artifact-")) {
                    stored.headers[name] = value;
                }
            }
            stored.body = request.body;
            store_.insert_or_assign(path, std::move(stored));
            return HttpResponse{.status = 202, .headers = {}, .body = {}};
        }
        auto it = store_.find(path);
        if (it == store_.end()) {
            return HttpResponse{.status = 404, .headers = {}, .body = {}};
        }
        if (request.method == HttpMethod::Head) {
            return HttpResponse{
                .status = 200, .headers = it->second.headers, .body = {}};
        }
        return it->second;
    }
};

#endif  // INCLUDED_SRC_TEST_UTILS_REMOTE_FAKE_HTTP_CLIENT_HPP
