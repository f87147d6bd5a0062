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

#ifndef INCLUDED_SRC_TASKCACHE_CRYPTO_HASHER_HPP
#define INCLUDED_SRC_TASKCACHE_CRYPTO_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>  // std::move

#include "src/utils/cpp/hex_string.hpp"

/// \brief Incremental cryptographic hasher on top of OpenSSL's EVP digests.
class Hasher final {
  public:
    /// \brief Digests used by the cache: SHA1 for file fingerprints
    /// (git blob ids), SHA256 for masking secret values.
    enum class HashType : std::uint8_t { SHA1, SHA256 };

    struct Context;

    /// \brief Raw digest bytes with hex rendering.
    class HashDigest final {
        friend Hasher;

      public:
        [[nodiscard]] auto Bytes() const& noexcept -> std::string const& {
            return bytes_;
        }

        [[nodiscard]] auto Bytes() && noexcept -> std::string {
            return std::move(bytes_);
        }

        /// \brief Lowercase hexadecimal string, twice as long as the bytes.
        [[nodiscard]] auto HexString() const -> std::string {
            return ToHexString(bytes_);
        }

        [[nodiscard]] auto Length() const noexcept -> std::size_t {
            return bytes_.size();
        }

      private:
        std::string bytes_;

        explicit HashDigest(std::string bytes) : bytes_{std::move(bytes)} {}
    };

    /// \brief Create and initialize a hasher
    /// \return An initialized hasher on success or std::nullopt on failure.
    [[nodiscard]] static auto Create(HashType type) noexcept
        -> std::optional<Hasher>;

    /// \brief One-shot hex digest of \p data.
    [[nodiscard]] static auto HexDigest(HashType type,
                                        std::string_view data) noexcept
        -> std::optional<std::string>;

    Hasher(Hasher&& other) noexcept;
    auto operator=(Hasher&& other) noexcept -> Hasher&;

    Hasher(Hasher const& other) noexcept = delete;
    auto operator=(Hasher const& other) noexcept -> Hasher& = delete;
    ~Hasher() noexcept;

    /// \brief Feed data to the hasher.
    auto Update(std::string_view data) noexcept -> bool;

    /// \brief Finalize hash. The hasher must not be used afterwards.
    [[nodiscard]] auto Finalize() && noexcept -> std::optional<HashDigest>;

    /// \brief Length of the resulting hex string.
    [[nodiscard]] auto GetHashLength() const noexcept -> std::size_t;

  private:
    std::unique_ptr<Context> ctx_;

    explicit Hasher(std::unique_ptr<Context> ctx) noexcept;
};

#endif  // INCLUDED_SRC_TASKCACHE_CRYPTO_HASHER_HPP
