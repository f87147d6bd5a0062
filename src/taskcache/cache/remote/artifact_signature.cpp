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

#include "src/taskcache/cache/remote/artifact_signature.hpp"

#include <cstdlib>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"

extern "C" {
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
}

namespace {

[[nodiscard]] auto EncodeBase64(std::string const& raw) -> std::string {
    // 4 output characters per 3 input bytes, plus terminating NUL
    std::string encoded(((raw.size() + 2) / 3) * 4 + 1, '\0');
    auto const len = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),      // NOLINT
        reinterpret_cast<unsigned char const*>(raw.data()),  // NOLINT
        gsl::narrow<int>(raw.size()));
    encoded.resize(gsl::narrow<std::size_t>(len));
    return encoded;
}

[[nodiscard]] auto DecodeBase64(std::string const& encoded)
    -> std::optional<std::string> {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string decoded((encoded.size() / 4) * 3, '\0');
    auto const len = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(decoded.data()),          // NOLINT
        reinterpret_cast<unsigned char const*>(encoded.data()),  // NOLINT
        gsl::narrow<int>(encoded.size()));
    if (len < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the bytes produced by padding
    auto padding = std::size_t{0};
    for (auto it = encoded.rbegin(); it != encoded.rend() and *it == '=';
         ++it) {
        ++padding;
    }
    decoded.resize(gsl::narrow<std::size_t>(len) - padding);
    return decoded;
}

}  // namespace

auto ArtifactSignature::SecretKey() const
    -> expected<std::string, std::string> {
    if (secret_key_) {
        return *secret_key_;
    }
    if (auto const* value = std::getenv(kSignatureKeyEnvVar)) {
        return std::string{value};
    }
    return unexpected{fmt::format(
        "signature secret key not found, set {}", kSignatureKeyEnvVar)};
}

auto ArtifactSignature::Digest(std::string_view hash,
                               std::string_view artifact) const
    -> expected<std::string, std::string> {
    auto key = SecretKey();
    if (not key) {
        return unexpected{std::move(key).error()};
    }
    std::string message{};
    message.reserve(hash.size() + team_id_.size() + artifact.size());
    message.append(hash).append(team_id_).append(artifact);

    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int digest_len{};
    auto const* result = HMAC(
        EVP_sha256(),
        key->data(),
        gsl::narrow<int>(key->size()),
        reinterpret_cast<unsigned char const*>(message.data()),  // NOLINT
        message.size(),
        reinterpret_cast<unsigned char*>(digest.data()),  // NOLINT
        &digest_len);
    if (result == nullptr) {
        return unexpected{std::string{"computing HMAC-SHA256 failed"}};
    }
    digest.resize(digest_len);
    return digest;
}

auto ArtifactSignature::GenerateTag(std::string_view hash,
                                    std::string_view artifact) const
    -> expected<std::string, std::string> {
    auto digest = Digest(hash, artifact);
    if (not digest) {
        return unexpected{std::move(digest).error()};
    }
    return EncodeBase64(*digest);
}

auto ArtifactSignature::Validate(std::string_view hash,
                                 std::string_view artifact,
                                 std::string const& tag) const
    -> expected<bool, std::string> {
    auto expected_digest = DecodeBase64(tag);
    if (not expected_digest) {
        return unexpected{"artifact tag " + tag + " is not valid base64"};
    }
    auto digest = Digest(hash, artifact);
    if (not digest) {
        return unexpected{std::move(digest).error()};
    }
    return digest->size() == expected_digest->size() and
           CRYPTO_memcmp(
               digest->data(), expected_digest->data(), digest->size()) == 0;
}
