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

#include "src/taskcache/cache/archive_codec.hpp"

#include <cstddef>
#include <exception>
#include <fstream>
#include <functional>
#include <map>
#include <tuple>
#include <utility>

#include "gsl/gsl"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/file_system/object_type.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/utils/cpp/path.hpp"

extern "C" {
#include <archive.h>
#include <archive_entry.h>
}

namespace {

/// \brief Block size for writing and reading archives.
constexpr int kArchiveBlockSize = 1024 * 1024;

/// \brief Buffer size for copying file content.
constexpr std::size_t kCopyBufferSize = 64 * 1024;

/// \brief Permissions restored from an archive. Setuid, setgid and sticky
/// bits are dropped.
constexpr std::uint32_t kPermissionBits = 0777;

/// \brief Clean-up function for archive entry objects.
void archive_entry_cleanup(archive_entry* entry) {
    if (entry != nullptr) {
        archive_entry_free(entry);
    }
}

/// \brief Clean-up function for archive objects open for reading.
void archive_read_closer(archive* a_in) {
    if (a_in != nullptr) {
        archive_read_close(a_in);  // libarchive handles non-openness
        archive_read_free(a_in);   // also do cleanup!
    }
}

[[nodiscard]] auto ArchiveErrorString(archive* a) -> std::string {
    auto const* msg = archive_error_string(a);
    return msg == nullptr ? std::string{"unknown libarchive error"}
                          : std::string{msg};
}

[[nodiscard]] auto ArchiveFailure(archive* a, std::string const& what)
    -> CacheError {
    return CacheError::Create(
        CacheErrorKind::Archive, "{}: {}", what, ArchiveErrorString(a));
}

/// \brief Refuse to write through parent directories that resolve outside of
/// the anchor, e.g. via a symlink restored earlier.
[[nodiscard]] auto CheckParentConfined(std::filesystem::path const& anchor,
                                       std::filesystem::path const& dest)
    -> std::optional<CacheError> {
    auto const parent = std::filesystem::weakly_canonical(dest.parent_path());
    if (not PathIsWithin(anchor, parent)) {
        return CacheError::Create(
            CacheErrorKind::InvalidPath,
            "refusing to restore {}: parent directory resolves to {}, which "
            "is outside of {}",
            dest.string(),
            parent.string(),
            anchor.string());
    }
    return std::nullopt;
}

[[nodiscard]] auto RestoreDirectory(std::filesystem::path const& dest,
                                    std::uint32_t mode)
    -> std::optional<CacheError> {
    auto type = FileSystemManager::Type(dest);
    if (type and not IsDirectoryObject(*type) and
        not FileSystemManager::RemoveFile(dest)) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not replace {}", dest.string());
    }
    if (not FileSystemManager::CreateDirectory(dest) or
        not FileSystemManager::SetPermissions(dest, mode)) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not create directory {}", dest.string());
    }
    return std::nullopt;
}

[[nodiscard]] auto RestoreRegularFile(archive* a_in,
                                      std::filesystem::path const& dest,
                                      std::uint32_t mode)
    -> std::optional<CacheError> {
    if (not FileSystemManager::CreateDirectory(dest.parent_path()) or
        not FileSystemManager::RemoveFile(dest)) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not prepare {}", dest.string());
    }
    std::ofstream out{dest, std::ios::binary | std::ios::trunc};
    if (not out.is_open()) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not open {}", dest.string());
    }
    std::string buffer(kCopyBufferSize, '\0');
    while (true) {
        auto const count =
            archive_read_data(a_in, buffer.data(), buffer.size());
        if (count == 0) {
            break;
        }
        if (count < 0) {
            return ArchiveFailure(a_in, "reading " + dest.string());
        }
        out.write(buffer.data(), gsl::narrow<std::streamsize>(count));
    }
    out.close();
    if (not out.good()) {
        return CacheError::Create(
            CacheErrorKind::Io, "writing {} failed", dest.string());
    }
    if (not FileSystemManager::SetPermissions(dest, mode)) {
        return CacheError::Create(CacheErrorKind::Io,
                                  "setting permissions of {} failed",
                                  dest.string());
    }
    return std::nullopt;
}

[[nodiscard]] auto RestoreSymlink(std::filesystem::path const& anchor,
                                  std::filesystem::path const& rel,
                                  std::string const& target)
    -> std::optional<CacheError> {
    auto const dest = anchor / rel;
    if (auto error = CheckParentConfined(anchor, dest)) {
        return error;
    }
    if (not FileSystemManager::CreateSymlink(target, dest)) {
        return CacheError::Create(CacheErrorKind::Io,
                                  "could not create symlink {} -> {}",
                                  dest.string(),
                                  target);
    }
    return std::nullopt;
}

/// \brief Symlink whose target did not exist when it was read.
struct DeferredLink {
    std::filesystem::path name;
    std::string target;
};

/// \brief Create deferred links so that a link pointing at another deferred
/// link comes after it.
[[nodiscard]] auto RestoreDeferredLinks(
    std::filesystem::path const& anchor,
    std::vector<DeferredLink> const& links) -> std::optional<CacheError> {
    std::map<std::filesystem::path, std::size_t> by_name{};
    for (std::size_t i = 0; i < links.size(); ++i) {
        by_name.insert_or_assign(links[i].name, i);
    }
    enum class Mark : std::uint8_t { None, Visiting, Done };
    std::vector<Mark> marks(links.size(), Mark::None);

    std::function<std::optional<CacheError>(std::size_t)> visit =
        [&](std::size_t index) -> std::optional<CacheError> {
        if (marks[index] == Mark::Done) {
            return std::nullopt;
        }
        if (marks[index] == Mark::Visiting) {
            return CacheError::Create(CacheErrorKind::InvalidPath,
                                      "symlinks in the archive form a cycle "
                                      "through {}",
                                      links[index].name.string());
        }
        marks[index] = Mark::Visiting;
        auto const& link = links[index];
        auto const target = std::filesystem::path{link.target};
        if (target.is_relative()) {
            auto const resolved =
                (link.name.parent_path() / target).lexically_normal();
            if (auto it = by_name.find(resolved); it != by_name.end()) {
                if (auto error = visit(it->second)) {
                    return error;
                }
            }
        }
        if (auto error = RestoreSymlink(anchor, link.name, link.target)) {
            return error;
        }
        marks[index] = Mark::Done;
        return std::nullopt;
    };

    for (std::size_t i = 0; i < links.size(); ++i) {
        if (auto error = visit(i)) {
            return error;
        }
    }
    return std::nullopt;
}

}  // namespace

auto CompressionFromPath(std::filesystem::path const& path)
    -> ArchiveCompression {
    return path.extension() == ".zst" ? ArchiveCompression::Zstd
                                      : ArchiveCompression::None;
}

void ArchiveWriter::ArchiveCloser::operator()(archive* a_out) const noexcept {
    if (a_out != nullptr) {
        archive_write_close(a_out);  // libarchive handles non-openness
        archive_write_free(a_out);   // also do cleanup!
    }
}

ArchiveWriter::ArchiveWriter(std::unique_ptr<archive, ArchiveCloser> archive,
                             std::filesystem::path target,
                             std::filesystem::path tmp_path) noexcept
    : archive_{std::move(archive)},
      target_{std::move(target)},
      tmp_path_{std::move(tmp_path)} {}

ArchiveWriter::~ArchiveWriter() noexcept {
    if (not finished_) {
        archive_.reset();
        if (not FileSystemManager::RemoveFile(tmp_path_)) {
            Logger::Log(LogLevel::Warning,
                        "could not remove unfinished archive {}",
                        tmp_path_.string());
        }
    }
}

auto ArchiveWriter::Create(std::filesystem::path const& target)
    -> expected<std::unique_ptr<ArchiveWriter>, CacheError> {
    if (not FileSystemManager::CreateDirectory(target.parent_path())) {
        return MakeCacheError(CacheErrorKind::Io,
                              "could not create directory {}",
                              target.parent_path().string());
    }
    auto tmp_path = FileSystemManager::TemporarySibling(target);
    if (not tmp_path) {
        return MakeCacheError(CacheErrorKind::Io,
                              "could not create temporary name for {}",
                              target.string());
    }
    std::unique_ptr<archive, ArchiveCloser> a_out{archive_write_new()};
    if (a_out == nullptr) {
        return MakeCacheError(CacheErrorKind::Archive,
                              "archive_write_new failed");
    }
    if (archive_write_set_format_gnutar(a_out.get()) != ARCHIVE_OK) {
        return unexpected{ArchiveFailure(a_out.get(), "setting tar format")};
    }
    if (CompressionFromPath(target) == ArchiveCompression::Zstd and
        archive_write_add_filter_zstd(a_out.get()) != ARCHIVE_OK) {
        return unexpected{
            ArchiveFailure(a_out.get(), "enabling zstd compression")};
    }
    if (archive_write_set_bytes_per_block(a_out.get(), kArchiveBlockSize) !=
            ARCHIVE_OK or
        archive_write_set_bytes_in_last_block(a_out.get(), 1) != ARCHIVE_OK) {
        return unexpected{ArchiveFailure(a_out.get(), "setting block size")};
    }
    if (archive_write_open_filename(a_out.get(), tmp_path->c_str()) !=
        ARCHIVE_OK) {
        return unexpected{ArchiveFailure(
            a_out.get(), "opening " + tmp_path->string() + " for writing")};
    }
    return std::unique_ptr<ArchiveWriter>{
        new ArchiveWriter{std::move(a_out), target, *std::move(tmp_path)}};
}

auto ArchiveWriter::AddFile(std::filesystem::path const& anchor,
                            std::filesystem::path const& path) noexcept
    -> std::optional<CacheError> {
    try {
        auto const source = anchor / path;
        auto const type = FileSystemManager::Type(source);
        auto const mode = FileSystemManager::ModeOf(source);
        if (not type or not mode) {
            return CacheError::Create(
                CacheErrorKind::Io, "could not stat {}", source.string());
        }
        if (*type == ObjectType::Special) {
            return CacheError::Create(
                CacheErrorKind::UnsupportedFileType,
                "attempted to create unsupported file type: {}",
                source.string());
        }

        std::unique_ptr<archive_entry, decltype(&archive_entry_cleanup)> entry{
            archive_entry_new(), archive_entry_cleanup};
        if (entry == nullptr) {
            return CacheError::Create(CacheErrorKind::Archive,
                                      "archive_entry_new failed");
        }
        auto name = ToUnixPath(path.lexically_normal());
        if (IsDirectoryObject(*type) and not name.ends_with('/')) {
            name.push_back('/');
        }
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_mode(entry.get(), static_cast<mode_t>(*mode));
        archive_entry_set_uid(entry.get(), 0);
        archive_entry_set_gid(entry.get(), 0);
        archive_entry_set_uname(entry.get(), "");
        archive_entry_set_gname(entry.get(), "");
        archive_entry_set_atime(entry.get(), 0, 0);
        archive_entry_set_mtime(entry.get(), 0, 0);
        archive_entry_set_ctime(entry.get(), 0, 0);
        archive_entry_set_size(entry.get(), 0);

        if (IsSymlinkObject(*type)) {
            auto target = FileSystemManager::ReadSymlink(source);
            if (not target) {
                return CacheError::Create(CacheErrorKind::Io,
                                          "could not read symlink {}",
                                          source.string());
            }
            archive_entry_set_symlink(entry.get(),
                                      ToUnixPath(*target).c_str());
        }
        else if (IsFileObject(*type)) {
            archive_entry_set_size(
                entry.get(),
                gsl::narrow<la_int64_t>(std::filesystem::file_size(source)));
        }

        if (archive_write_header(archive_.get(), entry.get()) != ARCHIVE_OK) {
            return ArchiveFailure(archive_.get(),
                                  "writing header of " + name);
        }
        if (IsFileObject(*type)) {
            return WriteContent(source);
        }
        return std::nullopt;
    } catch (std::exception const& e) {
        return CacheError::Create(CacheErrorKind::Archive,
                                  "adding {} to archive failed: {}",
                                  path.string(),
                                  e.what());
    }
}

auto ArchiveWriter::WriteContent(std::filesystem::path const& source)
    -> std::optional<CacheError> {
    std::ifstream in{source, std::ios::binary};
    if (not in.is_open()) {
        return CacheError::Create(
            CacheErrorKind::Io, "could not open {}", source.string());
    }
    std::string buffer(kCopyBufferSize, '\0');
    while (in.good()) {
        in.read(buffer.data(), gsl::narrow<std::streamsize>(buffer.size()));
        auto const count = gsl::narrow<std::size_t>(in.gcount());
        if (count > 0 and
            archive_write_data(archive_.get(), buffer.data(), count) < 0) {
            return ArchiveFailure(archive_.get(),
                                  "writing content of " + source.string());
        }
    }
    if (in.bad()) {
        return CacheError::Create(
            CacheErrorKind::Io, "reading {} failed", source.string());
    }
    return std::nullopt;
}

auto ArchiveWriter::Finish() noexcept -> std::optional<CacheError> {
    if (finished_) {
        return std::nullopt;
    }
    if (archive_write_close(archive_.get()) != ARCHIVE_OK) {
        return ArchiveFailure(archive_.get(), "closing archive");
    }
    archive_.reset();
    if (not FileSystemManager::Rename(tmp_path_, target_)) {
        return CacheError::Create(CacheErrorKind::Io,
                                  "could not move archive into place at {}",
                                  target_.string());
    }
    finished_ = true;
    return std::nullopt;
}

auto ArchiveReader::Restore(std::filesystem::path const& archive_path,
                            std::filesystem::path const& anchor)
    -> expected<std::vector<std::string>, CacheError> {
    try {
        if (not FileSystemManager::CreateDirectory(anchor)) {
            return MakeCacheError(CacheErrorKind::Io,
                                  "could not create directory {}",
                                  anchor.string());
        }
        auto const root = std::filesystem::canonical(anchor);

        std::unique_ptr<archive, decltype(&archive_read_closer)> a_in{
            archive_read_new(), archive_read_closer};
        if (a_in == nullptr) {
            return MakeCacheError(CacheErrorKind::Archive,
                                  "archive_read_new failed");
        }
        // the filter is detected from the content, uncompressed tar included
        if (archive_read_support_format_tar(a_in.get()) != ARCHIVE_OK or
            archive_read_support_filter_zstd(a_in.get()) != ARCHIVE_OK) {
            return unexpected{
                ArchiveFailure(a_in.get(), "enabling archive format")};
        }
        if (archive_read_open_filename(a_in.get(),
                                       archive_path.c_str(),
                                       kArchiveBlockSize) != ARCHIVE_OK) {
            return unexpected{ArchiveFailure(
                a_in.get(), "opening " + archive_path.string())};
        }

        std::vector<std::string> restored{};
        std::vector<DeferredLink> deferred{};
        archive_entry* entry{nullptr};
        while (true) {
            auto const r = archive_read_next_header(a_in.get(), &entry);
            if (r == ARCHIVE_EOF) {
                break;
            }
            if (r != ARCHIVE_OK and r != ARCHIVE_WARN) {
                return unexpected{
                    ArchiveFailure(a_in.get(), "reading next header")};
            }
            auto const* raw_name = archive_entry_pathname(entry);
            if (raw_name == nullptr) {
                return MakeCacheError(CacheErrorKind::Archive,
                                      "archive entry without name");
            }
            auto const name = std::filesystem::path{std::string{raw_name}};
            if (not PathIsNonUpwards(name)) {
                return MakeCacheError(
                    CacheErrorKind::InvalidPath,
                    "archive entry {} leaves the restore directory",
                    std::string{raw_name});
            }
            auto const rel = ToNormalPath(name);
            if (rel == ".") {
                continue;
            }
            auto const dest = root / rel;
            auto const mode = static_cast<std::uint32_t>(
                                  archive_entry_perm(entry)) &
                              kPermissionBits;

            if (archive_entry_hardlink(entry) != nullptr) {
                return MakeCacheError(CacheErrorKind::UnsupportedFileType,
                                      "unsupported hard link entry {}",
                                      rel.string());
            }
            switch (archive_entry_filetype(entry)) {
                case AE_IFDIR: {
                    if (auto error = CheckParentConfined(root, dest)) {
                        return unexpected{*std::move(error)};
                    }
                    if (auto error = RestoreDirectory(dest, mode)) {
                        return unexpected{*std::move(error)};
                    }
                } break;
                case AE_IFREG: {
                    if (auto error = CheckParentConfined(root, dest)) {
                        return unexpected{*std::move(error)};
                    }
                    if (auto error =
                            RestoreRegularFile(a_in.get(), dest, mode)) {
                        return unexpected{*std::move(error)};
                    }
                } break;
                case AE_IFLNK: {
                    auto const* raw_target = archive_entry_symlink(entry);
                    std::string target =
                        raw_target == nullptr ? "" : std::string{raw_target};
                    auto const target_path = std::filesystem::path{target};
                    auto const resolved = target_path.is_absolute()
                                              ? target_path
                                              : dest.parent_path() / target;
                    if (FileSystemManager::Exists(resolved)) {
                        if (auto error = RestoreSymlink(root, rel, target)) {
                            return unexpected{*std::move(error)};
                        }
                    }
                    else {
                        deferred.emplace_back(
                            DeferredLink{rel, std::move(target)});
                    }
                } break;
                default:
                    return MakeCacheError(
                        CacheErrorKind::UnsupportedFileType,
                        "attempted to restore unsupported file type: {}",
                        rel.string());
            }
            restored.emplace_back(ToUnixPath(rel));
        }
        if (auto error = RestoreDeferredLinks(root, deferred)) {
            return unexpected{*std::move(error)};
        }
        return restored;
    } catch (std::exception const& e) {
        return MakeCacheError(CacheErrorKind::Archive,
                              "restoring {} failed: {}",
                              archive_path.string(),
                              e.what());
    }
}

auto CreateArchive(std::filesystem::path const& target,
                   std::filesystem::path const& anchor,
                   std::vector<std::string> const& files)
    -> std::optional<CacheError> {
    auto writer = ArchiveWriter::Create(target);
    if (not writer) {
        return std::move(writer).error();
    }
    for (auto const& file : files) {
        if (auto error = (*writer)->AddFile(anchor, file)) {
            if (error->kind == CacheErrorKind::UnsupportedFileType) {
                Logger::Log(LogLevel::Warning, "{}", error->message);
                continue;
            }
            return error;
        }
    }
    return (*writer)->Finish();
}
