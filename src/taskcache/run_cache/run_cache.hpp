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

#ifndef INCLUDED_SRC_TASKCACHE_RUN_CACHE_RUN_CACHE_HPP
#define INCLUDED_SRC_TASKCACHE_RUN_CACHE_RUN_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gsl/gsl"
#include "src/taskcache/cache/cache.hpp"
#include "src/taskcache/cache/cache_error.hpp"
#include "src/taskcache/cache/cancellation.hpp"
#include "src/taskcache/common/output_mode.hpp"
#include "src/taskcache/common/task_definition.hpp"
#include "src/taskcache/common/task_id.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/taskcache/run_cache/output_watcher.hpp"
#include "src/taskcache/run_cache/task_output.hpp"
#include "src/taskcache/run_cache/task_output_writer.hpp"
#include "src/utils/cpp/expected.hpp"

struct RunCacheOpts {
    bool skip_reads{false};   ///< --force
    bool skip_writes{false};  ///< --no-cache
    std::optional<OutputMode> task_output_mode_override{};
    LogReplayer log_replayer{};  ///< defaults to ReplayLogFile
    std::shared_ptr<IOutputWatcher> output_watcher{};  ///< defaults to no-op
};

/// \brief Log file of \p task, relative to its package directory.
[[nodiscard]] auto TaskLogFile(std::string const& task)
    -> std::filesystem::path;

class RunCache;

/// \brief Access of a single task to the cache of the run. Decides whether
/// to restore or to execute, and saves the outputs after execution.
/// Instances are cheap to copy and must not outlive their RunCache.
class TaskCache {
  public:
    TaskCache(gsl::not_null<RunCache const*> const& run_cache,
              TaskId task_id,
              TaskOutputs repo_relative_globs,
              std::string hash,
              OutputMode output_mode,
              bool caching_disabled,
              std::filesystem::path log_file) noexcept;

    /// \brief Try to restore the outputs of this task.
    /// \returns True on a hit. A cache error is returned to the caller,
    /// which is expected to report it and execute the task.
    [[nodiscard]] auto RestoreOutputs(gsl::not_null<ITaskOutput*> const& output,
                                      CancellationToken const& cancel) const
        -> expected<bool, CacheError>;

    /// \brief Sink for the output of the task's command. Opens the log file
    /// right away unless nothing is going to be cached.
    /// \param console  Live output, or nullptr to write the log file only.
    [[nodiscard]] auto OutputWriter(ITaskOutput* console) const
        -> expected<std::unique_ptr<TaskOutputWriter>, std::string>;

    /// \brief Store the outputs of the finished task. Watcher failures are
    /// only reported.
    /// \returns Repository relative paths that were cached.
    [[nodiscard]] auto SaveOutputs(std::uint64_t duration_ms,
                                   gsl::not_null<ITaskOutput*> const& output,
                                   CancellationToken const& cancel) const
        -> expected<std::vector<std::string>, CacheError>;

    /// \brief Called when the task failed. Replays the log in errors-only
    /// mode, where it was not shown live.
    void OnError(gsl::not_null<ITaskOutput*> const& output) const;

    [[nodiscard]] auto Hash() const noexcept -> std::string const& {
        return hash_;
    }

    [[nodiscard]] auto GetTaskId() const noexcept -> TaskId const& {
        return task_id_;
    }

    [[nodiscard]] auto LogFile() const noexcept
        -> std::filesystem::path const& {
        return log_file_;
    }

    [[nodiscard]] auto GetOutputMode() const noexcept -> OutputMode {
        return output_mode_;
    }

    [[nodiscard]] auto IsCachingDisabled() const noexcept -> bool {
        return caching_disabled_;
    }

    [[nodiscard]] auto RepoRelativeGlobs() const noexcept
        -> TaskOutputs const& {
        return repo_relative_globs_;
    }

  private:
    gsl::not_null<RunCache const*> run_cache_;
    TaskId task_id_;
    TaskOutputs repo_relative_globs_;
    std::string hash_;
    OutputMode output_mode_;
    bool caching_disabled_;
    std::filesystem::path log_file_;

    [[nodiscard]] auto ReadsDisabled() const noexcept -> bool;
    [[nodiscard]] auto WritesDisabled() const noexcept -> bool;

    void NotifyOutputsWritten(gsl::not_null<ITaskOutput*> const& output) const;
    void ReplayLog(gsl::not_null<ITaskOutput*> const& output) const;
};

/// \brief Cache of a single run, shared by all of its tasks.
/// The entire class is thread-safe.
class RunCache {
    friend class TaskCache;

  public:
    RunCache(gsl::not_null<std::shared_ptr<Cache>> cache,
             std::filesystem::path repo_root,
             RunCacheOpts opts);

    /// \brief Cache access of \p task_id, whose package lives at
    /// \p package_dir relative to the repository root.
    [[nodiscard]] auto ForTask(TaskId const& task_id,
                               std::filesystem::path const& package_dir,
                               TaskDefinition const& definition,
                               std::string hash) const -> TaskCache;

    /// \brief True once the remote cache has been given up for this run,
    /// for a final warning to the user.
    [[nodiscard]] auto IsRemoteTripped() const noexcept -> bool {
        return cache_->IsRemoteTripped();
    }

    [[nodiscard]] auto RepoRoot() const noexcept
        -> std::filesystem::path const& {
        return repo_root_;
    }

  private:
    std::shared_ptr<Cache> cache_;
    std::filesystem::path repo_root_;
    bool reads_disabled_;
    bool writes_disabled_;
    std::optional<OutputMode> task_output_mode_override_;
    LogReplayer log_replayer_;
    std::shared_ptr<IOutputWatcher> output_watcher_;
    Logger logger_{"RunCache"};
};

#endif  // INCLUDED_SRC_TASKCACHE_RUN_CACHE_RUN_CACHE_HPP
