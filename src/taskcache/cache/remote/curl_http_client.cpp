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

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

extern "C" {
#include <curl/curl.h>
}

namespace {

void curl_easy_closer(gsl::owner<CURL*> curl) {
    curl_easy_cleanup(curl);
}

void curl_slist_closer(gsl::owner<curl_slist*> list) {
    curl_slist_free_all(list);
}

/// \brief Abort the transfer once the token is cancelled.
auto ProgressCallback(void* clientp,
                      curl_off_t /*dltotal*/,
                      curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/,
                      curl_off_t /*ulnow*/) -> int {
    auto const* cancel = static_cast<CancellationToken const*>(clientp);
    return cancel->IsCancelled() ? 1 : 0;
}

[[nodiscard]] auto ClassifyError(CURLcode code) noexcept -> TransportErrorKind {
    switch (code) {
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
            return TransportErrorKind::TlsVerification;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportErrorKind::Cancelled;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportErrorKind::Timeout;
        default:
            return TransportErrorKind::Network;
    }
}

[[nodiscard]] auto Trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto const last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

CurlHttpClient::CurlHttpClient() noexcept {
    // NOLINTNEXTLINE(hicpp-signed-bitwise)
    if (not(initialized_ = (curl_global_init(CURL_GLOBAL_DEFAULT) == 0))) {
        Logger::Log(LogLevel::Error, "initializing libcurl failed");
    }
}

CurlHttpClient::~CurlHttpClient() noexcept {
    if (initialized_) {
        curl_global_cleanup();
    }
}

auto CurlHttpClient::WriteToString(char* data,
                                   std::size_t size,
                                   std::size_t nmemb,
                                   void* userptr) -> std::size_t {
    auto const actual_size = size * nmemb;
    static_cast<std::string*>(userptr)->append(data, actual_size);
    return actual_size;
}

auto CurlHttpClient::CollectHeader(char* data,
                                   std::size_t size,
                                   std::size_t nmemb,
                                   void* userptr) -> std::size_t {
    auto const actual_size = size * nmemb;
    auto line = std::string_view{data, actual_size};
    auto const colon = line.find(':');
    if (colon != std::string_view::npos) {
        auto name = std::string{Trim(line.substr(0, colon))};
        std::transform(name.begin(), name.end(), name.begin(), [](char c) {
            return static_cast<char>(
                std::tolower(static_cast<unsigned char>(c)));
        });
        static_cast<std::map<std::string, std::string>*>(userptr)
            ->insert_or_assign(std::move(name),
                               std::string{Trim(line.substr(colon + 1))});
    }
    return actual_size;
}

auto CurlHttpClient::Send(HttpRequest const& request,
                          CancellationToken const& cancel) noexcept
    -> expected<HttpResponse, TransportError> {
    if (not initialized_) {
        return unexpected{TransportError{TransportErrorKind::Network,
                                         "libcurl is not initialized"}};
    }
    if (cancel.IsCancelled()) {
        return unexpected{TransportError{TransportErrorKind::Cancelled,
                                         "request cancelled"}};
    }
    try {
        std::unique_ptr<CURL, decltype(&curl_easy_closer)> handle{
            curl_easy_init(), curl_easy_closer};
        if (handle == nullptr) {
            return unexpected{TransportError{TransportErrorKind::Network,
                                             "creating curl handle failed"}};
        }
        auto* curl = handle.get();

        std::unique_ptr<curl_slist, decltype(&curl_slist_closer)> headers{
            nullptr, curl_slist_closer};
        for (auto const& [name, value] : request.headers) {
            auto line = fmt::format("{}: {}", name, value);
            auto* appended = curl_slist_append(headers.get(), line.c_str());
            if (appended == nullptr) {
                return unexpected{TransportError{
                    TransportErrorKind::Network, "building headers failed"}};
            }
            static_cast<void>(headers.release());
            headers.reset(appended);
        }

        HttpResponse response{};
        // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl,
                         CURLOPT_TIMEOUT_MS,
                         static_cast<long>(
                             std::chrono::duration_cast<
                                 std::chrono::milliseconds>(request.timeout)
                                 .count()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
        curl_easy_setopt(
            curl, CURLOPT_WRITEDATA, static_cast<void*>(&response.body));
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CollectHeader);
        curl_easy_setopt(
            curl, CURLOPT_HEADERDATA, static_cast<void*>(&response.headers));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
        curl_easy_setopt(curl,
                         CURLOPT_XFERINFODATA,
                         const_cast<CancellationToken*>(&cancel));
        switch (request.method) {
            case HttpMethod::Get:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::Head:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::Put:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
                curl_easy_setopt(
                    curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl,
                                 CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        auto const res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            return unexpected{TransportError{
                ClassifyError(res),
                fmt::format("{} {} failed: {}",
                            ToString(request.method),
                            request.url,
                            curl_easy_strerror(res))}};
        }
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        // NOLINTEND(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
        return response;
    } catch (std::exception const& ex) {
        return unexpected{TransportError{
            TransportErrorKind::Network,
            fmt::format("curl request failed with:\n{}", ex.what())}};
    }
}
