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

#include "src/taskcache/hashing/package_file_hashes.hpp"

#include <iterator>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/file_system/git_ignore.hpp"
#include "src/taskcache/file_system/globber.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

namespace {

[[nodiscard]] auto ToGlobSpec(std::vector<std::string> const& globs)
    -> GlobSpec {
    GlobSpec spec{};
    for (auto const& glob : globs) {
        if (not glob.empty() and glob.front() == '!') {
            spec.exclusions.emplace_back(glob.substr(1));
        }
        else {
            spec.inclusions.emplace_back(glob);
        }
    }
    return spec;
}

}  // namespace

auto GetPackageFileHashes(std::filesystem::path const& repo_root,
                          std::filesystem::path const& package_dir,
                          std::vector<std::string> const& inputs)
    -> expected<FileHashes, std::string> {
    auto const package_root = repo_root / package_dir;
    auto spec = ToGlobSpec(inputs);
    if (spec.inclusions.empty()) {
        // all files of the package that version control would track
        spec.exclusions.emplace_back("node_modules/**");
        spec.exclusions.emplace_back(".turbo/**");
        auto ignored = ReadGitIgnoreExclusions(repo_root, package_root);
        spec.exclusions.insert(spec.exclusions.end(),
                               std::make_move_iterator(ignored.begin()),
                               std::make_move_iterator(ignored.end()));
    }
    auto files = Globber::Walk(repo_root, package_root, spec, WalkType::Files);
    if (not files) {
        return unexpected{
            fmt::format("globbing inputs of package {} failed: {}",
                        package_dir.string(),
                        std::move(files).error())};
    }
    auto hashes = FileFingerprinter::HashFiles(
        package_root, *files, /*allow_missing=*/false);
    if (not hashes) {
        return unexpected{
            fmt::format("hashing inputs of package {} failed: {}",
                        package_dir.string(),
                        std::move(hashes).error())};
    }
    Logger::Log(LogLevel::Debug,
                "hashed {} input files of package {}",
                hashes->size(),
                package_dir.string());
    return hashes;
}

auto GetGlobalFileHashes(std::filesystem::path const& repo_root,
                         std::vector<std::string> const& globs)
    -> expected<FileHashes, std::string> {
    if (globs.empty()) {
        return FileHashes{};
    }
    auto spec = ToGlobSpec(globs);
    spec.exclusions.emplace_back("**/node_modules/**");
    auto files = Globber::Walk(repo_root, repo_root, spec, WalkType::Files);
    if (not files) {
        return unexpected{fmt::format("globbing global dependencies failed: {}",
                                      std::move(files).error())};
    }
    return FileFingerprinter::HashFiles(
        repo_root, *files, /*allow_missing=*/true);
}
