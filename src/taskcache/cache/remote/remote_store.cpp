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

#include <charconv>
#include <system_error>
#include <thread>

#include "fmt/core.h"
#include "src/taskcache/logging/log_level.hpp"

namespace {

constexpr long kStatusOk = 200;
constexpr long kStatusForbidden = 403;
constexpr long kStatusNotFound = 404;
constexpr long kStatusTooManyRequests = 429;
constexpr long kStatusServerError = 500;
constexpr long kStatusNotImplemented = 501;

constexpr auto kDurationHeader = "x-artifact-duration";
constexpr auto kTagHeader = "x-artifact-tag";

constexpr auto kSleepSlice = std::chrono::milliseconds{100};

[[nodiscard]] auto IsSuccess(long status) noexcept -> bool {
    return status >= kStatusOk and status < 300;  // NOLINT
}

[[nodiscard]] auto ParseDuration(std::optional<std::string> const& value)
    -> expected<std::uint64_t, CacheError> {
    if (not value or value->empty()) {
        return std::uint64_t{0};
    }
    std::uint64_t duration{};
    auto const* end = value->data() + value->size();  // NOLINT
    auto [ptr, ec] = std::from_chars(value->data(), end, duration);
    if (ec != std::errc{} or ptr != end) {
        return MakeCacheError(CacheErrorKind::Remote,
                              "invalid {} header: {}",
                              kDurationHeader,
                              *value);
    }
    return duration;
}

[[nodiscard]] auto StatusError(HttpRequest const& request, long status)
    -> CacheError {
    if (status == kStatusForbidden) {
        return CacheError::Create(CacheErrorKind::Forbidden,
                                  "{} {}: access to the remote cache was "
                                  "denied (HTTP 403)",
                                  ToString(request.method),
                                  request.url);
    }
    return CacheError::Create(CacheErrorKind::Remote,
                              "{} {}: unexpected HTTP status {}",
                              ToString(request.method),
                              request.url,
                              status);
}

}  // namespace

auto IsRetryableStatus(long status) noexcept -> bool {
    return status == 0 or status == kStatusTooManyRequests or
           (status >= kStatusServerError and status != kStatusNotImplemented);
}

RemoteStore::RemoteStore(RemoteStoreOptions options,
                         gsl::not_null<std::shared_ptr<IHttpClient>> client,
                         gsl::not_null<std::shared_ptr<RunState>> run_state,
                         RetryConfig retry_config,
                         SleepFunction sleep)
    : options_{std::move(options)},
      client_{std::move(client)},
      run_state_{std::move(run_state)},
      retry_config_{retry_config},
      sleep_{std::move(sleep)} {
    while (not options_.api_url.empty() and options_.api_url.back() == '/') {
        options_.api_url.pop_back();
    }
    if (options_.signature) {
        signature_.emplace(options_.team_id, options_.signature_key);
    }
}

auto RemoteStore::ArtifactUrl(std::string const& hash) const -> std::string {
    auto url = fmt::format("{}/v8/artifacts/{}", options_.api_url, hash);
    char separator = '?';
    if (options_.team_id.starts_with("team_")) {
        url += fmt::format("{}teamId={}", separator, options_.team_id);
        separator = '&';
    }
    if (not options_.team_slug.empty()) {
        url += fmt::format("{}slug={}", separator, options_.team_slug);
    }
    return url;
}

auto RemoteStore::Headers() const
    -> std::vector<std::pair<std::string, std::string>> {
    return {{"Authorization", "Bearer " + options_.token},
            {"User-Agent", options_.user_agent}};
}

auto RemoteStore::Sleeper(CancellationToken const& cancel) const
    -> SleepFunction {
    if (sleep_) {
        return sleep_;
    }
    return [cancel](std::chrono::seconds duration) {
        auto const deadline = std::chrono::steady_clock::now() + duration;
        while (not cancel.IsCancelled() and
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kSleepSlice);
        }
    };
}

auto RemoteStore::Send(HttpRequest const& request,
                       CancellationToken const& cancel) const
    -> expected<HttpResponse, CacheError> {
    if (run_state_->IsRemoteTripped()) {
        return MakeCacheError(CacheErrorKind::TooManyFailures,
                              "skipping remote cache after {} failed requests",
                              run_state_->RemoteFailures());
    }
    std::optional<HttpResponse> response{};
    std::optional<CacheError> error{};
    auto attempt = [&]() -> RetryResponse {
        if (cancel.IsCancelled()) {
            error = CacheError::Create(CacheErrorKind::Cancelled,
                                       "{} {} cancelled",
                                       ToString(request.method),
                                       request.url);
            return RetryResponse{.exit_retry_loop = true};
        }
        if (run_state_->IsRemoteTripped()) {
            error = CacheError::Create(CacheErrorKind::TooManyFailures,
                                       "giving up on remote cache after {} "
                                       "failed requests",
                                       run_state_->RemoteFailures());
            return RetryResponse{.exit_retry_loop = true};
        }
        auto result = client_->Send(request, cancel);
        if (not result) {
            static_cast<void>(run_state_->RecordRemoteFailure());
            auto const& failure = result.error();
            switch (failure.kind) {
                case TransportErrorKind::Cancelled:
                    error = CacheError::Create(CacheErrorKind::Cancelled,
                                               "{}",
                                               failure.message);
                    return RetryResponse{.exit_retry_loop = true};
                case TransportErrorKind::TlsVerification:
                    error = CacheError::Create(CacheErrorKind::Remote,
                                               "{}",
                                               failure.message);
                    return RetryResponse{.exit_retry_loop = true,
                                         .error_msg = failure.message};
                case TransportErrorKind::Network:
                case TransportErrorKind::Timeout:
                    break;
            }
            error = CacheError::Create(
                CacheErrorKind::Remote, "{}", failure.message);
            return RetryResponse{.error_msg = failure.message};
        }
        if (IsRetryableStatus(result->status)) {
            static_cast<void>(run_state_->RecordRemoteFailure());
            error = StatusError(request, result->status);
            return RetryResponse{.error_msg = error->message};
        }
        error.reset();
        response = *std::move(result);
        return RetryResponse{.ok = true};
    };

    if (not WithRetry(attempt,
                      retry_config_,
                      logger_,
                      Sleeper(cancel),
                      LogLevel::Debug) or
        not response) {
        return unexpected{error.value_or(CacheError::Create(
            CacheErrorKind::Remote,
            "{} {} failed",
            ToString(request.method),
            request.url))};
    }
    return *std::move(response);
}

auto RemoteStore::Put(std::string const& hash,
                      std::string const& artifact,
                      std::uint64_t duration_ms,
                      CancellationToken const& cancel) const
    -> std::optional<CacheError> {
    HttpRequest request{.method = HttpMethod::Put,
                        .url = ArtifactUrl(hash),
                        .headers = Headers(),
                        .body = artifact,
                        .timeout = options_.upload_timeout};
    request.headers.emplace_back("Content-Type", "application/octet-stream");
    request.headers.emplace_back(kDurationHeader, std::to_string(duration_ms));
    if (signature_) {
        auto tag = signature_->GenerateTag(hash, artifact);
        if (not tag) {
            return CacheError::Create(CacheErrorKind::Signature,
                                      "signing artifact {} failed: {}",
                                      hash,
                                      tag.error());
        }
        request.headers.emplace_back(kTagHeader, *std::move(tag));
    }

    auto response = Send(request, cancel);
    if (not response) {
        return std::move(response).error();
    }
    if (not IsSuccess(response->status)) {
        return StatusError(request, response->status);
    }
    logger_.Emit(LogLevel::Debug,
                 "uploaded artifact {} ({} bytes)",
                 hash,
                 artifact.size());
    return std::nullopt;
}

auto RemoteStore::Fetch(std::string const& hash,
                        CancellationToken const& cancel) const
    -> expected<std::optional<RemoteArtifact>, CacheError> {
    HttpRequest request{.method = HttpMethod::Get,
                        .url = ArtifactUrl(hash),
                        .headers = Headers(),
                        .timeout = options_.timeout};
    auto response = Send(request, cancel);
    if (not response) {
        return unexpected{std::move(response).error()};
    }
    if (response->status == kStatusNotFound) {
        return std::optional<RemoteArtifact>{};
    }
    if (response->status != kStatusOk) {
        return unexpected{StatusError(request, response->status)};
    }

    auto duration = ParseDuration(response->Header(kDurationHeader));
    if (not duration) {
        return unexpected{std::move(duration).error()};
    }
    auto tag = response->Header(kTagHeader);
    if (signature_) {
        if (not tag or tag->empty()) {
            return MakeCacheError(CacheErrorKind::Signature,
                                  "artifact verification failed: downloaded "
                                  "artifact {} is missing required {} header",
                                  hash,
                                  kTagHeader);
        }
        auto valid = signature_->Validate(hash, response->body, *tag);
        if (not valid) {
            return MakeCacheError(CacheErrorKind::Signature,
                                  "artifact verification failed: {}",
                                  valid.error());
        }
        if (not *valid) {
            return MakeCacheError(CacheErrorKind::Signature,
                                  "artifact verification failed: artifact "
                                  "tag does not match expected tag {}",
                                  *tag);
        }
    }
    return std::optional<RemoteArtifact>{
        RemoteArtifact{.bytes = std::move(response->body),
                       .duration_ms = *duration,
                       .tag = std::move(tag)}};
}

auto RemoteStore::Exists(std::string const& hash,
                         CancellationToken const& cancel) const
    -> expected<std::optional<CacheHitMetadata>, CacheError> {
    HttpRequest request{.method = HttpMethod::Head,
                        .url = ArtifactUrl(hash),
                        .headers = Headers(),
                        .timeout = options_.timeout};
    auto response = Send(request, cancel);
    if (not response) {
        return unexpected{std::move(response).error()};
    }
    if (response->status == kStatusNotFound) {
        return std::optional<CacheHitMetadata>{};
    }
    if (response->status != kStatusOk) {
        return unexpected{StatusError(request, response->status)};
    }
    auto duration = ParseDuration(response->Header(kDurationHeader));
    if (not duration) {
        return unexpected{std::move(duration).error()};
    }
    return std::optional<CacheHitMetadata>{
        CacheHitMetadata{.source = CacheSource::Remote,
                         .duration_ms = *duration}};
}
