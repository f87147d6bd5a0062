// Copyright 2022 Huawei Cloud Computing Technology Co., Ltd.
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

#include "src/taskcache/crypto/hasher.hpp"

#include <array>
#include <cstddef>
#include <exception>

#include "gsl/gsl"
#include "openssl/evp.h"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

namespace {
inline constexpr int kOpenSslTrue = 1;

struct EvpContextCloser {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

[[nodiscard]] auto ToEvpDigest(Hasher::HashType type) noexcept
    -> EVP_MD const* {
    switch (type) {
        case Hasher::HashType::SHA1:
            return EVP_sha1();
        case Hasher::HashType::SHA256:
            return EVP_sha256();
    }
    return nullptr;  // make gcc happy
}
}  // namespace

// EVP_MD_CTX is an opaque OpenSSL type, so the header only sees this
// forward-declared wrapper.
struct Hasher::Context final {
    std::unique_ptr<EVP_MD_CTX, EvpContextCloser> md_ctx;
    EVP_MD const* digest;
};

Hasher::Hasher(std::unique_ptr<Context> ctx) noexcept : ctx_{std::move(ctx)} {}

// Explicitly declared and then defaulted dtor and move ctor/operator are needed
// to compile std::unique_ptr of an incomplete type.
Hasher::Hasher(Hasher&& other) noexcept = default;
auto Hasher::operator=(Hasher&& other) noexcept -> Hasher& = default;
Hasher::~Hasher() noexcept = default;

auto Hasher::Create(HashType type) noexcept -> std::optional<Hasher> {
    auto const* digest = ToEvpDigest(type);
    if (digest == nullptr) {
        return std::nullopt;
    }
    auto md_ctx =
        std::unique_ptr<EVP_MD_CTX, EvpContextCloser>{EVP_MD_CTX_new()};
    if (md_ctx == nullptr or
        EVP_DigestInit_ex(md_ctx.get(), digest, nullptr) != kOpenSslTrue) {
        Logger::Log(LogLevel::Error, "Hasher: initializing digest failed");
        return std::nullopt;
    }
    try {
        return std::optional<Hasher>{Hasher{std::unique_ptr<Context>{
            new Context{std::move(md_ctx), digest}}}};
    } catch (std::exception const& e) {
        Logger::Log(
            LogLevel::Error, "Hasher: creating context failed:\n{}", e.what());
        return std::nullopt;
    }
}

auto Hasher::HexDigest(HashType type, std::string_view data) noexcept
    -> std::optional<std::string> {
    auto hasher = Create(type);
    if (not hasher or not hasher->Update(data)) {
        return std::nullopt;
    }
    auto digest = std::move(*hasher).Finalize();
    if (not digest) {
        return std::nullopt;
    }
    try {
        return digest->HexString();
    } catch (std::exception const& e) {
        Logger::Log(
            LogLevel::Error, "Hasher: rendering digest failed:\n{}", e.what());
        return std::nullopt;
    }
}

auto Hasher::Update(std::string_view data) noexcept -> bool {
    Expects(ctx_ != nullptr);
    return EVP_DigestUpdate(ctx_->md_ctx.get(), data.data(), data.size()) ==
           kOpenSslTrue;
}

auto Hasher::Finalize() && noexcept -> std::optional<HashDigest> {
    Expects(ctx_ != nullptr);
    auto out = std::array<unsigned char, EVP_MAX_MD_SIZE>{};
    unsigned int length{};
    if (EVP_DigestFinal_ex(ctx_->md_ctx.get(), out.data(), &length) !=
        kOpenSslTrue) {
        Logger::Log(LogLevel::Error, "Hasher: failed to compute hash.");
        return std::nullopt;
    }
    try {
        return HashDigest{std::string{
            out.begin(),
            out.begin() + static_cast<std::ptrdiff_t>(length)}};
    } catch (std::exception const& e) {
        Logger::Log(
            LogLevel::Error, "Hasher: storing digest failed:\n{}", e.what());
        return std::nullopt;
    }
}

auto Hasher::GetHashLength() const noexcept -> std::size_t {
    Expects(ctx_ != nullptr);
    constexpr std::size_t kCharsPerByte = 2;
    return static_cast<std::size_t>(EVP_MD_get_size(ctx_->digest)) *
           kCharsPerByte;
}
