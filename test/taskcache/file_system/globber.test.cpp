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

#include "src/taskcache/file_system/globber.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "test/utils/test_env.hpp"

namespace {

class GlobberFixture {
  public:
    ScratchDir scratch{"globber"};

    GlobberFixture() {
        REQUIRE(scratch.Valid());
        for (auto const* file : {"pkg/package.json",
                                 "pkg/src/index.ts",
                                 "pkg/src/util/strings.ts",
                                 "pkg/src/util/strings.test.ts",
                                 "pkg/dist/index.js",
                                 "pkg/dist/maps/index.js.map",
                                 "pkg/node_modules/dep/index.js",
                                 "other/README.md"}) {
            REQUIRE(FileSystemManager::WriteFile("x", Root() / file));
        }
    }

    [[nodiscard]] auto Root() const -> std::filesystem::path {
        return scratch.GetPath();
    }

    [[nodiscard]] auto Walk(std::vector<std::string> inclusions,
                            std::vector<std::string> exclusions = {},
                            WalkType type = WalkType::Files) const
        -> std::vector<std::string> {
        auto result = Globber::Walk(
            Root(),
            Root() / "pkg",
            GlobSpec{.inclusions = std::move(inclusions),
                     .exclusions = std::move(exclusions)},
            type);
        REQUIRE(result);
        return *std::move(result);
    }
};

using Paths = std::vector<std::string>;

}  // namespace

TEST_CASE_METHOD(GlobberFixture, "Walk with wildcards", "[globber]") {
    CHECK(Walk({"src/**/*.ts"}) == Paths{"src/index.ts",
                                         "src/util/strings.test.ts",
                                         "src/util/strings.ts"});
    CHECK(Walk({"src/*.ts"}) == Paths{"src/index.ts"});
    CHECK(Walk({"src/**/*.ts"}, {"**/*.test.ts"}) ==
          Paths{"src/index.ts", "src/util/strings.ts"});
}

TEST_CASE_METHOD(GlobberFixture,
                 "No inclusions means everything",
                 "[globber]") {
    CHECK(Walk({}, {"node_modules/**", "dist/**"}) ==
          Paths{"package.json",
                "src/index.ts",
                "src/util/strings.test.ts",
                "src/util/strings.ts"});
}

TEST_CASE_METHOD(GlobberFixture, "Directory boundaries", "[globber]") {
    SECTION("a literal directory names only itself") {
        CHECK(Walk({"dist"}, {}, WalkType::All) == Paths{"dist"});
        CHECK(Walk({"dist"}).empty());
    }
    SECTION("a trailing double star names only the contents") {
        CHECK(Walk({"dist/**"}, {}, WalkType::All) ==
              Paths{"dist/index.js", "dist/maps", "dist/maps/index.js.map"});
        CHECK(Walk({"dist/**"}) ==
              Paths{"dist/index.js", "dist/maps/index.js.map"});
    }
    SECTION("excluded subtrees are skipped") {
        CHECK(Walk({"dist/**"}, {"dist/maps/**"}, WalkType::All) ==
              Paths{"dist/index.js", "dist/maps"});
    }
}

TEST_CASE_METHOD(GlobberFixture, "Results are de-duplicated", "[globber]") {
    CHECK(Walk({"package.json", "*.json", "package.json"}) ==
          Paths{"package.json"});
}

TEST_CASE_METHOD(GlobberFixture, "Missing literals are ignored", "[globber]") {
    CHECK(Walk({"does-not-exist", "nope/**"}).empty());
}

TEST_CASE_METHOD(GlobberFixture,
                 "Patterns may reach other packages inside the repository",
                 "[globber]") {
    CHECK(Walk({"../other/**"}) == Paths{"../other/README.md"});
}

TEST_CASE_METHOD(GlobberFixture,
                 "Patterns leaving the repository are errors",
                 "[globber]") {
    auto result = Globber::Walk(Root(),
                                Root() / "pkg",
                                GlobSpec{.inclusions = {"../../outside/**"},
                                         .exclusions = {}},
                                WalkType::Files);
    CHECK_FALSE(result);
}

TEST_CASE_METHOD(GlobberFixture,
                 "Symlinked directories are not followed",
                 "[globber]") {
    REQUIRE(FileSystemManager::CreateSymlink("src", Root() / "pkg/alias"));
    CHECK(Walk({"alias/**"}).empty());
    CHECK(Walk({"alias"}) == Paths{"alias"});
}
