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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ITEM_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ITEM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class CacheSource : std::uint8_t { Local, Remote };

[[nodiscard]] static inline auto ToString(CacheSource source) -> std::string {
    return source == CacheSource::Local ? "LOCAL" : "REMOTE";
}

/// \brief What is known about a cached artifact without restoring it.
struct CacheHitMetadata {
    CacheSource source{CacheSource::Local};
    std::uint64_t duration_ms{};
};

/// \brief Result of a successful fetch. \ref files are the restored paths,
/// relative to the anchor, in archive order.
struct CacheHit {
    CacheSource source{CacheSource::Local};
    std::uint64_t duration_ms{};
    std::vector<std::string> files;
};

/// \brief Raw artifact as transferred by the remote store.
struct RemoteArtifact {
    std::string bytes;
    std::uint64_t duration_ms{};
    std::optional<std::string> tag;
};

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ITEM_HPP
