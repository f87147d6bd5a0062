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

#include "src/taskcache/crypto/file_fingerprinter.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/taskcache/crypto/hasher.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/path.hpp"

namespace {
[[nodiscard]] auto CreateGitBlobTag(std::uintmax_t size) -> std::string {
    return std::string("blob ") + std::to_string(size) + '\0';
}

[[nodiscard]] auto FinalizeHex(Hasher&& hasher)
    -> expected<FileHash, std::string> {
    auto digest = std::move(hasher).Finalize();
    if (not digest) {
        return unexpected<std::string>{"finalizing SHA1 digest failed"};
    }
    return digest->HexString();
}
}  // namespace

auto FileFingerprinter::HashBlob(std::string const& data) noexcept
    -> expected<FileHash, std::string> {
    try {
        auto hasher = Hasher::Create(Hasher::HashType::SHA1);
        if (not hasher or not hasher->Update(CreateGitBlobTag(data.size())) or
            not hasher->Update(data)) {
            return unexpected<std::string>{"SHA1 hashing failed"};
        }
        return FinalizeHex(*std::move(hasher));
    } catch (std::exception const& e) {
        return unexpected{fmt::format("hashing blob failed: {}", e.what())};
    }
}

auto FileFingerprinter::HashFile(std::filesystem::path const& path) noexcept
    -> expected<FileHash, std::string> {
    static constexpr std::size_t kChunkSize{4096};
    try {
        auto const status = std::filesystem::symlink_status(path);
        if (std::filesystem::is_symlink(status)) {
            auto target = FileSystemManager::ReadSymlink(path);
            if (not target) {
                return unexpected{
                    fmt::format("could not read symlink {}", path.string())};
            }
            return HashBlob(ToUnixPath(*target));
        }
        if (not std::filesystem::is_regular_file(status)) {
            return unexpected{fmt::format(
                "{} is not a regular file or symlink", path.string())};
        }

        auto const size = std::filesystem::file_size(path);
        auto hasher = Hasher::Create(Hasher::HashType::SHA1);
        if (not hasher or not hasher->Update(CreateGitBlobTag(size))) {
            return unexpected<std::string>{"SHA1 hashing failed"};
        }

        std::ifstream reader(path, std::ios::binary);
        if (not reader.is_open()) {
            return unexpected{
                fmt::format("cannot open file {}", path.string())};
        }
        std::string chunk(kChunkSize, '\0');
        std::uintmax_t total{};
        while (reader.good()) {
            reader.read(chunk.data(),
                        gsl::narrow<std::streamsize>(chunk.size()));
            auto const count = gsl::narrow<std::size_t>(reader.gcount());
            if (count > 0 and not hasher->Update(std::string_view{
                                  chunk.data(), count})) {
                return unexpected<std::string>{"SHA1 hashing failed"};
            }
            total += count;
        }
        if (reader.bad()) {
            return unexpected{
                fmt::format("reading file {} failed", path.string())};
        }
        if (total != size) {
            return unexpected{fmt::format(
                "file {} changed while being hashed", path.string())};
        }
        return FinalizeHex(*std::move(hasher));
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "hashing file {} failed: {}", path.string(), e.what())};
    }
}

auto FileFingerprinter::HashFiles(std::filesystem::path const& root,
                                  std::vector<std::string> const& files,
                                  bool allow_missing) noexcept
    -> expected<FileHashes, std::string> {
    try {
        FileHashes hashes{};
        for (auto const& file : files) {
            auto const path = root / file;
            if (allow_missing and not FileSystemManager::Exists(path)) {
                Logger::Log(LogLevel::Debug,
                            "skipping missing file {}",
                            path.string());
                continue;
            }
            auto hash = HashFile(path);
            if (not hash) {
                return unexpected{std::move(hash).error()};
            }
            hashes.insert_or_assign(ToUnixPath(file), *std::move(hash));
        }
        return hashes;
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("hashing files failed: {}", e.what())};
    }
}
