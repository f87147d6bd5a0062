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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_HASH_ENGINE_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_HASH_ENGINE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "src/taskcache/crypto/file_fingerprinter.hpp"
#include "src/taskcache/hashing/hashable.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Turns hash ingredients into fingerprints. All hashes are XXH64
/// with seed 0 over the canonical serialization, rendered as 16 lowercase
/// hex characters.
class HashEngine {
  public:
    [[nodiscard]] static auto SerializeGlobal(GlobalHashable const& hashable)
        -> expected<std::string, std::string>;

    [[nodiscard]] static auto SerializeTask(TaskHashable const& hashable)
        -> expected<std::string, std::string>;

    /// \brief Called once per run.
    [[nodiscard]] static auto ComputeGlobalHash(GlobalHashable const& hashable)
        -> expected<std::string, std::string>;

    /// \brief Called once per task, after all tasks it depends on are
    /// hashed.
    [[nodiscard]] static auto ComputeTaskHash(TaskHashable const& hashable)
        -> expected<std::string, std::string>;

    /// \brief Hash of a path to file hash map, independent of the order the
    /// files were found in.
    [[nodiscard]] static auto HashFileHashes(FileHashes const& hashes)
        -> std::string;

    /// \brief Hash of the external dependency closure. Packages are sorted
    /// by key, then version.
    [[nodiscard]] static auto HashLockfilePackages(
        std::vector<LockfilePackage> packages) -> std::string;

    [[nodiscard]] static auto HashData(std::string_view data) noexcept
        -> std::string;
};

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_HASH_ENGINE_HPP
