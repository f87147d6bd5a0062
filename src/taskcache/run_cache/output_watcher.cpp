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

#include "src/taskcache/run_cache/output_watcher.hpp"

#include <exception>
#include <mutex>

#include "fmt/core.h"
#include "src/taskcache/file_system/globber.hpp"

auto SnapshotOutputWatcher::Fingerprint(
    std::string const& glob,
    std::vector<std::string> const& exclusions) const
    -> expected<FileHashes, std::string> {
    auto files = Globber::Walk(repo_root_,
                               repo_root_,
                               GlobSpec{.inclusions = {glob},
                                        .exclusions = exclusions},
                               WalkType::Files);
    if (not files) {
        return unexpected{std::move(files).error()};
    }
    return FileFingerprinter::HashFiles(
        repo_root_, *files, /*allow_missing=*/true);
}

auto SnapshotOutputWatcher::GetChangedOutputs(
    std::string const& hash,
    std::vector<std::string> const& globs) noexcept
    -> expected<std::vector<std::string>, std::string> {
    try {
        std::optional<Snapshot> snapshot{};
        {
            std::shared_lock lock{mutex_};
            if (auto it = snapshots_.find(hash); it != snapshots_.end()) {
                snapshot = it->second;
            }
        }
        if (not snapshot) {
            return globs;
        }
        std::vector<std::string> changed{};
        for (auto const& glob : globs) {
            auto known = snapshot->matches.find(glob);
            if (known == snapshot->matches.end()) {
                changed.emplace_back(glob);
                continue;
            }
            auto current = Fingerprint(glob, snapshot->exclusions);
            if (not current) {
                return unexpected{std::move(current).error()};
            }
            if (*current != known->second) {
                changed.emplace_back(glob);
            }
        }
        return changed;
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("checking outputs of {} failed: {}", hash, e.what())};
    }
}

auto SnapshotOutputWatcher::NotifyOutputsWritten(
    std::string const& hash,
    TaskOutputs const& globs) noexcept -> std::optional<std::string> {
    try {
        Snapshot snapshot{.exclusions = globs.exclusions, .matches = {}};
        for (auto const& glob : globs.inclusions) {
            auto current = Fingerprint(glob, globs.exclusions);
            if (not current) {
                return std::move(current).error();
            }
            snapshot.matches.emplace(glob, *std::move(current));
        }
        std::unique_lock lock{mutex_};
        snapshots_.insert_or_assign(hash, std::move(snapshot));
        return std::nullopt;
    } catch (std::exception const& e) {
        return fmt::format(
            "recording outputs of {} failed: {}", hash, e.what());
    }
}
