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

#ifndef INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
#define INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#ifdef __unix__
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/taskcache/file_system/object_type.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

/// \brief Implements primitive file system functionality.
/// Catches all exceptions for use with exception-free callers.
class FileSystemManager {
  public:
    /// \brief Returns true if the directory was created or existed before.
    [[nodiscard]] static auto CreateDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        try {
            if (dir.empty() or std::filesystem::is_directory(
                                   std::filesystem::symlink_status(dir))) {
                return true;
            }
            if (std::filesystem::create_directories(dir)) {
                return true;
            }
            // another thread might have created it in the meantime
            return std::filesystem::is_directory(
                std::filesystem::symlink_status(dir));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "creating directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Rename(std::filesystem::path const& src,
                                     std::filesystem::path const& dst) noexcept
        -> bool {
        try {
            std::filesystem::rename(src, dst);
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "renaming {} to {}:\n{}",
                        src.string(),
                        dst.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Remove a regular file or symlink. A missing path counts as
    /// removed.
    [[nodiscard]] static auto RemoveFile(
        std::filesystem::path const& file) noexcept -> bool {
        try {
            auto status = std::filesystem::symlink_status(file);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (std::filesystem::is_directory(status)) {
                return false;
            }
            return std::filesystem::remove(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing file from {}:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveDirectory(std::filesystem::path const& dir,
                                              bool recursively = false) noexcept
        -> bool {
        try {
            auto status = std::filesystem::symlink_status(dir);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_directory(status)) {
                return false;
            }
            if (recursively) {
                return (std::filesystem::remove_all(dir) !=
                        static_cast<std::uintmax_t>(-1));
            }
            return std::filesystem::remove(dir);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Exists(std::filesystem::path const& path) noexcept
        -> bool {
        try {
            return std::filesystem::exists(
                std::filesystem::symlink_status(path));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking for existence of path {}:\n{}",
                        path.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto IsFile(std::filesystem::path const& file) noexcept
        -> bool {
        try {
            return std::filesystem::is_regular_file(
                std::filesystem::symlink_status(file));
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking if path {} corresponds to a file:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Gets type of the entry at path without following symlinks.
    /// Returns nullopt for non-existing paths.
    [[nodiscard]] static auto Type(std::filesystem::path const& path) noexcept
        -> std::optional<ObjectType> {
        try {
            auto const status = std::filesystem::symlink_status(path);
            if (not std::filesystem::exists(status)) {
                Logger::Log(LogLevel::Trace,
                            "non-existing object path {}.",
                            path.string());
                return std::nullopt;
            }
            return ToObjectType(status);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "checking type of path {} failed with:\n{}",
                        path.string(),
                        e.what());
        }
        return std::nullopt;
    }

    [[nodiscard]] static auto ReadFile(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::string> {
        try {
            std::ifstream reader(file, std::ios::binary);
            if (not reader.is_open()) {
                Logger::Log(
                    LogLevel::Debug, "cannot open file {}", file.string());
                return std::nullopt;
            }
            std::string content{};
            std::string chunk(kChunkSize, '\0');
            auto const ssize = gsl::narrow<std::streamsize>(chunk.size());
            do {
                reader.read(chunk.data(), ssize);
                content.append(chunk.data(),
                               gsl::narrow<std::size_t>(reader.gcount()));
            } while (reader.good());
            if (reader.bad()) {
                Logger::Log(
                    LogLevel::Error, "reading file {} failed", file.string());
                return std::nullopt;
            }
            return content;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading file {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    [[nodiscard]] static auto ReadSymlink(
        std::filesystem::path const& link) noexcept
        -> std::optional<std::string> {
        try {
            if (std::filesystem::is_symlink(link)) {
                return std::filesystem::read_symlink(link).string();
            }
            Logger::Log(LogLevel::Debug,
                        "{} can not be read because it is not a symlink.",
                        link.string());
        } catch (std::exception const& ex) {
            Logger::Log(LogLevel::Error,
                        "reading symlink {} failed:\n{}",
                        link.string(),
                        ex.what());
        }
        return std::nullopt;
    }

    /// \brief Create symlink \p link pointing to \p to, replacing any file
    /// or symlink that is in the way. The target is stored verbatim.
    [[nodiscard]] static auto CreateSymlink(
        std::filesystem::path const& to,
        std::filesystem::path const& link,
        LogLevel log_failure_at = LogLevel::Error) noexcept -> bool {
        try {
            if (not CreateDirectory(link.parent_path())) {
                return false;
            }
            if (not RemoveFile(link)) {
                Logger::Log(
                    log_failure_at, "can not remove file {}", link.string());
                return false;
            }
            std::filesystem::create_directory_symlink(to, link);
            return std::filesystem::is_symlink(link);
        } catch (std::exception const& e) {
            Logger::Log(log_failure_at,
                        "symlinking {} to {}\n{}",
                        to.string(),
                        link.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Write file, replacing existing content. Parent directories are
    /// created as needed.
    [[nodiscard]] static auto WriteFile(
        std::string const& content,
        std::filesystem::path const& file) noexcept -> bool {
        if (not CreateDirectory(file.parent_path())) {
            Logger::Log(LogLevel::Error,
                        "can not create directory {}",
                        file.parent_path().string());
            return false;
        }
        if (not RemoveFile(file)) {
            Logger::Log(
                LogLevel::Error, "can not remove file {}", file.string());
            return false;
        }
        try {
            std::ofstream writer{file, std::ios::binary};
            if (not writer.is_open()) {
                Logger::Log(
                    LogLevel::Error, "can not open file {}", file.string());
                return false;
            }
            writer.write(content.data(),
                         gsl::narrow<std::streamsize>(content.size()));
            writer.close();
            return writer.good();
        } catch (std::exception const& e) {
            Logger::Log(
                LogLevel::Error, "writing to {}:\n{}", file.string(), e.what());
            return false;
        }
    }

    /// \brief Write file under a unique temporary sibling name and rename it
    /// into place, so readers never observe partial content.
    [[nodiscard]] static auto WriteFileAtomically(
        std::string const& content,
        std::filesystem::path const& file) noexcept -> bool {
        auto tmp = TemporarySibling(file);
        if (not tmp) {
            return false;
        }
        if (WriteFile(content, *tmp) and Rename(*tmp, file)) {
            return true;
        }
        if (not RemoveFile(*tmp)) {
            Logger::Log(LogLevel::Warning,
                        "leaving stale temporary file {}",
                        tmp->string());
        }
        return false;
    }

    /// \brief Unique name `.<name>.<pid>.<counter>.tmp` in the directory of
    /// \p file. Unique per process and call.
    [[nodiscard]] static auto TemporarySibling(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::filesystem::path> {
        static std::atomic<std::uint64_t> counter{};
        try {
            return file.parent_path() /
                   fmt::format(".{}.{}.{}.tmp",
                               file.filename().string(),
                               ::getpid(),
                               counter++);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "creating temporary name for {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Set the permission bits (lowest 12 bits of \p mode) of a file
    /// or directory. Symlinks are left untouched.
    [[nodiscard]] static auto SetPermissions(std::filesystem::path const& path,
                                             std::uint32_t mode) noexcept
        -> bool {
        try {
            if (std::filesystem::is_symlink(path)) {
                return true;
            }
            std::filesystem::permissions(
                path,
                static_cast<std::filesystem::perms>(mode & kPermissionMask),
                std::filesystem::perm_options::replace);
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "setting permissions of {}:\n{}",
                        path.string(),
                        e.what());
            return false;
        }
    }

    /// \brief Mode bits as reported by lstat, including the file type bits.
    [[nodiscard]] static auto ModeOf(std::filesystem::path const& path) noexcept
        -> std::optional<std::uint32_t> {
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            Logger::Log(LogLevel::Debug, "lstat failed for {}", path.string());
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(st.st_mode);
    }

  private:
    static constexpr std::size_t kChunkSize{4096};
    static constexpr std::uint32_t kPermissionMask{07777};

    [[nodiscard]] static auto ToObjectType(
        std::filesystem::file_status const& status) noexcept -> ObjectType {
        namespace fs = std::filesystem;
        if (fs::is_regular_file(status)) {
            constexpr auto kExecFlags = fs::perms::owner_exec bitor
                                        fs::perms::group_exec bitor
                                        fs::perms::others_exec;
            return (status.permissions() bitand kExecFlags) != fs::perms::none
                       ? ObjectType::Executable
                       : ObjectType::File;
        }
        if (fs::is_directory(status)) {
            return ObjectType::Directory;
        }
        if (fs::is_symlink(status)) {
            return ObjectType::Symlink;
        }
        return ObjectType::Special;
    }
};

#endif  // INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
