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

#include <sys/stat.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "test/utils/test_env.hpp"

extern "C" {
#include <archive.h>
#include <archive_entry.h>
}

namespace {

/// \brief Entry of a hand-crafted archive. A non-empty \p link_target
/// makes it a symlink, otherwise it is a regular file.
struct RawEntry {
    std::string name;
    std::string content;
    std::string link_target;
    unsigned int perm{0644};
};

/// \brief Hand-craft a tar archive from \p entries, bypassing all checks of
/// the writer.
void WriteRawTar(std::filesystem::path const& target,
                 std::vector<RawEntry> const& entries) {
    auto* a_out = archive_write_new();
    REQUIRE(a_out != nullptr);
    REQUIRE(archive_write_set_format_gnutar(a_out) == ARCHIVE_OK);
    REQUIRE(archive_write_open_filename(a_out, target.c_str()) == ARCHIVE_OK);
    for (auto const& raw : entries) {
        auto* entry = archive_entry_new();
        archive_entry_set_pathname(entry, raw.name.c_str());
        archive_entry_set_perm(entry, raw.perm);
        if (not raw.link_target.empty()) {
            archive_entry_set_filetype(entry, AE_IFLNK);
            archive_entry_set_symlink(entry, raw.link_target.c_str());
            archive_entry_set_size(entry, 0);
            REQUIRE(archive_write_header(a_out, entry) == ARCHIVE_OK);
        }
        else {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_size(
                entry, static_cast<la_int64_t>(raw.content.size()));
            REQUIRE(archive_write_header(a_out, entry) == ARCHIVE_OK);
            REQUIRE(archive_write_data(
                        a_out, raw.content.data(), raw.content.size()) ==
                    static_cast<la_ssize_t>(raw.content.size()));
        }
        archive_entry_free(entry);
    }
    REQUIRE(archive_write_close(a_out) == ARCHIVE_OK);
    archive_write_free(a_out);
}

class ArchiveFixture {
  public:
    ScratchDir scratch{"archive"};

    ArchiveFixture() {
        REQUIRE(scratch.Valid());
        auto const src = Source();
        REQUIRE(FileSystemManager::WriteFile("hello\n", src / "dist/a.txt"));
        REQUIRE(FileSystemManager::WriteFile("", src / "dist/empty.txt"));
        REQUIRE(FileSystemManager::WriteFile("#!/bin/sh\n",
                                             src / "dist/bin/run.sh"));
        REQUIRE(FileSystemManager::SetPermissions(src / "dist/bin/run.sh",
                                                  0755));
        REQUIRE(FileSystemManager::CreateSymlink("a.txt",
                                                 src / "dist/link.txt"));
    }

    [[nodiscard]] auto Source() const -> std::filesystem::path {
        return scratch.GetPath() / "src";
    }

    [[nodiscard]] auto Dest() const -> std::filesystem::path {
        return scratch.GetPath() / "dest";
    }

    [[nodiscard]] static auto Files() -> std::vector<std::string> {
        return {"dist",
                "dist/a.txt",
                "dist/bin",
                "dist/bin/run.sh",
                "dist/empty.txt",
                "dist/link.txt"};
    }
};

}  // namespace

TEST_CASE("Compression follows the file name", "[archive_codec]") {
    CHECK(CompressionFromPath("x/abc.tar.zst") == ArchiveCompression::Zstd);
    CHECK(CompressionFromPath("x/abc.tar") == ArchiveCompression::None);
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Archives restore their entries",
                 "[archive_codec]") {
    auto const archive = scratch.GetPath() / "out.tar.zst";
    REQUIRE_FALSE(CreateArchive(archive, Source(), Files()));
    REQUIRE(FileSystemManager::IsFile(archive));

    auto restored = ArchiveReader::Restore(archive, Dest());
    REQUIRE(restored);
    CHECK(*restored == Files());

    CHECK(FileSystemManager::ReadFile(Dest() / "dist/a.txt") == "hello\n");
    CHECK(FileSystemManager::ReadFile(Dest() / "dist/empty.txt") == "");
    CHECK(FileSystemManager::ReadFile(Dest() / "dist/bin/run.sh") ==
          "#!/bin/sh\n");
    auto mode = FileSystemManager::ModeOf(Dest() / "dist/bin/run.sh");
    REQUIRE(mode);
    CHECK((*mode & 07777U) == 0755U);
    CHECK(FileSystemManager::Type(Dest() / "dist/link.txt") ==
          ObjectType::Symlink);
    CHECK(FileSystemManager::ReadSymlink(Dest() / "dist/link.txt") ==
          std::string{"a.txt"});
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Uncompressed archives are supported",
                 "[archive_codec]") {
    auto const archive = scratch.GetPath() / "out.tar";
    REQUIRE_FALSE(CreateArchive(archive, Source(), Files()));
    auto restored = ArchiveReader::Restore(archive, Dest());
    REQUIRE(restored);
    CHECK(restored->size() == Files().size());
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Equal inputs give byte-identical archives",
                 "[archive_codec]") {
    auto const first = scratch.GetPath() / "first.tar.zst";
    auto const second = scratch.GetPath() / "second.tar.zst";
    REQUIRE_FALSE(CreateArchive(first, Source(), Files()));
    // touching the files must not change the archive
    std::filesystem::last_write_time(
        Source() / "dist/a.txt", std::filesystem::file_time_type::clock::now());
    REQUIRE_FALSE(CreateArchive(second, Source(), Files()));

    auto a = FileSystemManager::ReadFile(first);
    auto b = FileSystemManager::ReadFile(second);
    REQUIRE(a);
    REQUIRE(b);
    CHECK(*a == *b);
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Symlinks to later entries are restored",
                 "[archive_codec]") {
    REQUIRE(FileSystemManager::CreateSymlink("z.txt", Source() / "a-link"));
    REQUIRE(FileSystemManager::WriteFile("z", Source() / "z.txt"));
    auto const archive = scratch.GetPath() / "out.tar.zst";
    REQUIRE_FALSE(CreateArchive(archive, Source(), {"a-link", "z.txt"}));

    auto restored = ArchiveReader::Restore(archive, Dest());
    REQUIRE(restored);
    CHECK(FileSystemManager::ReadFile(Dest() / "a-link") == "z");
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Unsupported entries are skipped",
                 "[archive_codec]") {
    auto const fifo = Source() / "dist/pipe";
    REQUIRE(::mkfifo(fifo.c_str(), 0644) == 0);
    auto files = Files();
    files.emplace_back("dist/pipe");

    auto const archive = scratch.GetPath() / "out.tar.zst";
    REQUIRE_FALSE(CreateArchive(archive, Source(), files));
    auto restored = ArchiveReader::Restore(archive, Dest());
    REQUIRE(restored);
    CHECK(*restored == Files());
    CHECK_FALSE(FileSystemManager::Exists(Dest() / "dist/pipe"));
}

TEST_CASE_METHOD(ArchiveFixture,
                 "Missing inputs fail the archive",
                 "[archive_codec]") {
    auto const archive = scratch.GetPath() / "out.tar.zst";
    auto error = CreateArchive(archive, Source(), {"does/not/exist"});
    REQUIRE(error);
    CHECK(error->kind == CacheErrorKind::Io);
    CHECK_FALSE(FileSystemManager::Exists(archive));
}

TEST_CASE("Entries leaving the restore directory are rejected",
          "[archive_codec]") {
    ScratchDir scratch{"archive"};
    REQUIRE(scratch.Valid());
    auto const archive = scratch.GetPath() / "evil.tar";
    auto const dest = scratch.GetPath() / "dest";

    SECTION("upwards path") {
        WriteRawTar(archive, {{.name = "../evil.txt", .content = "gotcha"}});
        auto restored = ArchiveReader::Restore(archive, dest);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().kind == CacheErrorKind::InvalidPath);
        CHECK_FALSE(FileSystemManager::Exists(scratch.GetPath() / "evil.txt"));
    }
    SECTION("absolute path") {
        WriteRawTar(archive, {{.name = "/tmp/evil.txt", .content = "gotcha"}});
        auto restored = ArchiveReader::Restore(archive, dest);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().kind == CacheErrorKind::InvalidPath);
    }
    SECTION("upwards path below a directory") {
        WriteRawTar(archive,
                    {{.name = "dist/../../evil.txt", .content = "gotcha"}});
        auto restored = ArchiveReader::Restore(archive, dest);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().kind == CacheErrorKind::InvalidPath);
        CHECK_FALSE(FileSystemManager::Exists(scratch.GetPath() / "evil.txt"));
    }
    SECTION("file below a symlink pointing outside") {
        auto const outside = scratch.GetPath() / "outside";
        REQUIRE(FileSystemManager::CreateDirectory(outside));
        WriteRawTar(archive,
                    {{.name = "link", .link_target = "../outside"},
                     {.name = "link/evil.txt", .content = "gotcha"}});
        auto restored = ArchiveReader::Restore(archive, dest);
        REQUIRE_FALSE(restored);
        CHECK(restored.error().kind == CacheErrorKind::InvalidPath);
        CHECK_FALSE(FileSystemManager::Exists(outside / "evil.txt"));
    }
}

TEST_CASE("Restored permissions drop special bits", "[archive_codec]") {
    ScratchDir scratch{"archive"};
    REQUIRE(scratch.Valid());
    auto const archive = scratch.GetPath() / "suid.tar";
    auto const dest = scratch.GetPath() / "dest";
    WriteRawTar(archive,
                {{.name = "tool", .content = "#!/bin/sh\n", .perm = 06755}});

    auto restored = ArchiveReader::Restore(archive, dest);
    REQUIRE(restored);
    auto mode = FileSystemManager::ModeOf(dest / "tool");
    REQUIRE(mode);
    CHECK((*mode & 07777U) == 0755U);
}
