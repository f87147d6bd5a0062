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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_ARTIFACT_SIGNATURE_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_ARTIFACT_SIGNATURE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "src/utils/cpp/expected.hpp"

inline constexpr auto kSignatureKeyEnvVar = "TURBO_REMOTE_CACHE_SIGNATURE_KEY";

/// \brief Signs and verifies remote artifacts with HMAC-SHA256 over the
/// artifact hash, the team id and the artifact bytes. Tags are base64.
class ArtifactSignature {
  public:
    /// \param team_id      Team the artifacts belong to.
    /// \param secret_key   Key to use; if unset, the key is read from the
    ///                     environment variable on every use.
    explicit ArtifactSignature(
        std::string team_id,
        std::optional<std::string> secret_key = std::nullopt) noexcept
        : team_id_{std::move(team_id)}, secret_key_{std::move(secret_key)} {}

    [[nodiscard]] auto GenerateTag(std::string_view hash,
                                   std::string_view artifact) const
        -> expected<std::string, std::string>;

    /// \returns Whether \p tag belongs to the artifact, or an error if the
    /// key is missing or the tag is not valid base64.
    [[nodiscard]] auto Validate(std::string_view hash,
                                std::string_view artifact,
                                std::string const& tag) const
        -> expected<bool, std::string>;

  private:
    std::string team_id_;
    std::optional<std::string> secret_key_;

    [[nodiscard]] auto SecretKey() const -> expected<std::string, std::string>;

    [[nodiscard]] auto Digest(std::string_view hash,
                              std::string_view artifact) const
        -> expected<std::string, std::string>;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_REMOTE_ARTIFACT_SIGNATURE_HPP
