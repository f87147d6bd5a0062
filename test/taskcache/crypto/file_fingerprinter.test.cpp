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

#include "src/taskcache/crypto/file_fingerprinter.hpp"

#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "test/utils/test_env.hpp"

namespace {

// same as: git hash-object --stdin </dev/null
constexpr auto kEmptyBlob = "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391";
// same as: echo hello | git hash-object --stdin
constexpr auto kHelloBlob = "ce013625030ba8dba906f756967f9e9ca394464a";

}  // namespace

TEST_CASE("Blob ids match git", "[file_fingerprinter]") {
    CHECK(FileFingerprinter::HashBlob("").value() == kEmptyBlob);
    CHECK(FileFingerprinter::HashBlob("hello\n").value() == kHelloBlob);
}

TEST_CASE("Fingerprint files", "[file_fingerprinter]") {
    ScratchDir scratch{"fingerprint"};
    REQUIRE(scratch.Valid());
    auto const root = scratch.GetPath();
    REQUIRE(FileSystemManager::WriteFile("hello\n", root / "pkg/hello.txt"));
    REQUIRE(FileSystemManager::WriteFile("", root / "pkg/empty.txt"));

    SECTION("regular files") {
        CHECK(FileFingerprinter::HashFile(root / "pkg/hello.txt").value() ==
              kHelloBlob);
        CHECK(FileFingerprinter::HashFile(root / "pkg/empty.txt").value() ==
              kEmptyBlob);
    }
    SECTION("symlinks are hashed by their target") {
        REQUIRE(FileSystemManager::CreateSymlink("hello.txt",
                                                 root / "pkg/link"));
        auto hash = FileFingerprinter::HashFile(root / "pkg/link");
        REQUIRE(hash);
        CHECK(*hash == FileFingerprinter::HashBlob("hello.txt").value());
        CHECK(*hash != kHelloBlob);
    }
    SECTION("directories are rejected") {
        CHECK_FALSE(FileFingerprinter::HashFile(root / "pkg"));
    }
    SECTION("hash a file set") {
        std::vector<std::string> const files{"pkg/hello.txt",
                                             "pkg/empty.txt"};
        auto hashes = FileFingerprinter::HashFiles(root, files, false);
        REQUIRE(hashes);
        CHECK(*hashes == FileHashes{{"pkg/empty.txt", kEmptyBlob},
                                    {"pkg/hello.txt", kHelloBlob}});
    }
    SECTION("missing files") {
        std::vector<std::string> const files{"pkg/hello.txt", "pkg/gone"};
        CHECK_FALSE(FileFingerprinter::HashFiles(root, files, false));
        auto hashes = FileFingerprinter::HashFiles(root, files, true);
        REQUIRE(hashes);
        CHECK(*hashes == FileHashes{{"pkg/hello.txt", kHelloBlob}});
    }
}
