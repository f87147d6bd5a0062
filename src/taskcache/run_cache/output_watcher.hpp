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

#ifndef INCLUDED_SRC_TASKCACHE_RUN_CACHE_OUTPUT_WATCHER_HPP
#define INCLUDED_SRC_TASKCACHE_RUN_CACHE_OUTPUT_WATCHER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "src/taskcache/common/task_definition.hpp"
#include "src/taskcache/crypto/file_fingerprinter.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Keeps track of whether the outputs of a task are known to be
/// unchanged on disk since they were last written or restored.
class IOutputWatcher {
  public:
    IOutputWatcher() noexcept = default;
    IOutputWatcher(IOutputWatcher const&) = delete;
    IOutputWatcher(IOutputWatcher&&) = delete;
    auto operator=(IOutputWatcher const&) -> IOutputWatcher& = delete;
    auto operator=(IOutputWatcher&&) -> IOutputWatcher& = delete;
    virtual ~IOutputWatcher() noexcept = default;

    /// \brief Repository relative output globs of task \p hash which changed
    /// since the last notification for \p hash.
    [[nodiscard]] virtual auto GetChangedOutputs(
        std::string const& hash,
        std::vector<std::string> const& globs) noexcept
        -> expected<std::vector<std::string>, std::string> = 0;

    /// \brief Record that the outputs matched by \p globs were written or
    /// restored for task \p hash.
    [[nodiscard]] virtual auto NotifyOutputsWritten(
        std::string const& hash,
        TaskOutputs const& globs) noexcept -> std::optional<std::string> = 0;
};

/// \brief Watcher that knows nothing: every glob always counts as changed.
class NoOpOutputWatcher final : public IOutputWatcher {
  public:
    [[nodiscard]] auto GetChangedOutputs(
        std::string const& /*hash*/,
        std::vector<std::string> const& globs) noexcept
        -> expected<std::vector<std::string>, std::string> final {
        return globs;
    }

    [[nodiscard]] auto NotifyOutputsWritten(
        std::string const& /*hash*/,
        TaskOutputs const& /*globs*/) noexcept
        -> std::optional<std::string> final {
        return std::nullopt;
    }
};

/// \brief Watcher comparing fingerprints of the files an output glob
/// matches against a snapshot taken at the last notification.
/// The entire class is thread-safe.
class SnapshotOutputWatcher final : public IOutputWatcher {
  public:
    explicit SnapshotOutputWatcher(std::filesystem::path repo_root) noexcept
        : repo_root_{std::move(repo_root)} {}

    [[nodiscard]] auto GetChangedOutputs(
        std::string const& hash,
        std::vector<std::string> const& globs) noexcept
        -> expected<std::vector<std::string>, std::string> final;

    [[nodiscard]] auto NotifyOutputsWritten(
        std::string const& hash,
        TaskOutputs const& globs) noexcept -> std::optional<std::string> final;

  private:
    struct Snapshot {
        std::vector<std::string> exclusions;
        std::map<std::string, FileHashes> matches;  // glob -> fingerprints
    };

    std::filesystem::path repo_root_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Snapshot> snapshots_;

    [[nodiscard]] auto Fingerprint(
        std::string const& glob,
        std::vector<std::string> const& exclusions) const
        -> expected<FileHashes, std::string>;
};

#endif  // INCLUDED_SRC_TASKCACHE_RUN_CACHE_OUTPUT_WATCHER_HPP
