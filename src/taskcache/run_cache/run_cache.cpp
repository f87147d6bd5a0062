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

#include "src/taskcache/run_cache/run_cache.hpp"

#include <utility>

#include "fmt/core.h"
#include "nlohmann/json.hpp"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/file_system/globber.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/utils/cpp/path.hpp"

namespace {

[[nodiscard]] auto ShowsStatus(OutputMode mode) noexcept -> bool {
    return mode != OutputMode::None and mode != OutputMode::ErrorsOnly;
}

[[nodiscard]] auto ToRepoRelative(std::filesystem::path const& package_dir,
                                  std::vector<std::string> const& globs)
    -> std::vector<std::string> {
    std::vector<std::string> result{};
    result.reserve(globs.size());
    for (auto const& glob : globs) {
        result.emplace_back(ToUnixPath(package_dir / glob));
    }
    return result;
}

}  // namespace

auto TaskLogFile(std::string const& task) -> std::filesystem::path {
    // ':' is not allowed in file names on every platform
    std::string name{};
    for (auto c : task) {
        if (c == ':') {
            name.append("$colon$");
        }
        else {
            name.push_back(c);
        }
    }
    return std::filesystem::path{".turbo"} / fmt::format("turbo-{}.log", name);
}

TaskCache::TaskCache(gsl::not_null<RunCache const*> const& run_cache,
                     TaskId task_id,
                     TaskOutputs repo_relative_globs,
                     std::string hash,
                     OutputMode output_mode,
                     bool caching_disabled,
                     std::filesystem::path log_file) noexcept
    : run_cache_{run_cache},
      task_id_{std::move(task_id)},
      repo_relative_globs_{std::move(repo_relative_globs)},
      hash_{std::move(hash)},
      output_mode_{output_mode},
      caching_disabled_{caching_disabled},
      log_file_{std::move(log_file)} {}

auto TaskCache::ReadsDisabled() const noexcept -> bool {
    return caching_disabled_ or run_cache_->reads_disabled_;
}

auto TaskCache::WritesDisabled() const noexcept -> bool {
    return caching_disabled_ or run_cache_->writes_disabled_;
}

void TaskCache::NotifyOutputsWritten(
    gsl::not_null<ITaskOutput*> const& output) const {
    if (auto error = run_cache_->output_watcher_->NotifyOutputsWritten(
            hash_, repo_relative_globs_)) {
        auto const msg =
            fmt::format("Failed to mark outputs as cached for {}: {}",
                        task_id_.ToString(),
                        *error);
        run_cache_->logger_.Emit(LogLevel::Warning, "{}", msg);
        output->Warn(msg);
    }
}

void TaskCache::ReplayLog(gsl::not_null<ITaskOutput*> const& output) const {
    run_cache_->logger_.Emit(
        LogLevel::Debug, "log file {}", log_file_.string());
    if (FileSystemManager::IsFile(log_file_)) {
        run_cache_->log_replayer_(log_file_, output.get());
    }
}

auto TaskCache::RestoreOutputs(gsl::not_null<ITaskOutput*> const& output,
                               CancellationToken const& cancel) const
    -> expected<bool, CacheError> {
    if (ReadsDisabled()) {
        if (ShowsStatus(output_mode_)) {
            output->Output(
                fmt::format("cache bypass, force executing {}", hash_));
        }
        return false;
    }

    auto changed = run_cache_->output_watcher_->GetChangedOutputs(
        hash_, repo_relative_globs_.inclusions);
    if (not changed) {
        auto const msg = fmt::format(
            "Failed to check if we can skip restoring outputs for {}: {}. "
            "Proceeding to check cache",
            task_id_.ToString(),
            changed.error());
        run_cache_->logger_.Emit(LogLevel::Warning, "{}", msg);
        output->Warn(msg);
        changed = repo_relative_globs_.inclusions;
    }

    if (not changed->empty()) {
        auto hit = run_cache_->cache_->Fetch(
            run_cache_->repo_root_, hash_, cancel);
        if (not hit) {
            return unexpected{std::move(hit).error()};
        }
        if (not *hit) {
            if (ShowsStatus(output_mode_)) {
                output->Output(fmt::format("cache miss, executing {}", hash_));
            }
            return false;
        }
        run_cache_->logger_.Emit(LogLevel::Debug,
                                 "restored {} entries of {} from {} cache",
                                 (*hit)->files.size(),
                                 task_id_.ToString(),
                                 ToString((*hit)->source));
        NotifyOutputsWritten(output);
    }
    else {
        output->Warn(fmt::format(
            "Skipping cache check for {}, outputs have not changed since "
            "previous run.",
            task_id_.ToString()));
    }

    switch (output_mode_) {
        case OutputMode::NewOnly:
        case OutputMode::HashOnly:
            output->Info(
                fmt::format("cache hit, suppressing output {}", hash_));
            break;
        case OutputMode::Full:
            output->Info(fmt::format("cache hit, replaying output {}", hash_));
            ReplayLog(output);
            break;
        case OutputMode::None:
        case OutputMode::ErrorsOnly:
            break;
    }
    return true;
}

auto TaskCache::OutputWriter(ITaskOutput* console) const
    -> expected<std::unique_ptr<TaskOutputWriter>, std::string> {
    if (WritesDisabled()) {
        return TaskOutputWriter::Create(std::nullopt, console);
    }
    bool const file_only = output_mode_ == OutputMode::None or
                           output_mode_ == OutputMode::HashOnly or
                           output_mode_ == OutputMode::ErrorsOnly;
    return TaskOutputWriter::Create(log_file_, file_only ? nullptr : console);
}

auto TaskCache::SaveOutputs(std::uint64_t duration_ms,
                            gsl::not_null<ITaskOutput*> const& output,
                            CancellationToken const& cancel) const
    -> expected<std::vector<std::string>, CacheError> {
    if (WritesDisabled()) {
        return std::vector<std::string>{};
    }
    run_cache_->logger_.Emit(LogLevel::Debug, [&] {
        return fmt::format(
            "caching output of {}: {}, excluding {}",
            task_id_.ToString(),
            nlohmann::json(repo_relative_globs_.inclusions).dump(),
            nlohmann::json(repo_relative_globs_.exclusions).dump());
    });

    auto const& root = run_cache_->repo_root_;
    auto files = Globber::Walk(root,
                               root,
                               GlobSpec{.inclusions =
                                            repo_relative_globs_.inclusions,
                                        .exclusions =
                                            repo_relative_globs_.exclusions},
                               WalkType::All);
    if (not files) {
        return MakeCacheError(CacheErrorKind::InvalidPath,
                              "resolving outputs of {} failed: {}",
                              task_id_.ToString(),
                              files.error());
    }
    if (auto error =
            run_cache_->cache_->Put(root, hash_, duration_ms, *files, cancel)) {
        return unexpected{*std::move(error)};
    }
    NotifyOutputsWritten(output);
    return *std::move(files);
}

void TaskCache::OnError(gsl::not_null<ITaskOutput*> const& output) const {
    if (output_mode_ == OutputMode::ErrorsOnly) {
        ReplayLog(output);
    }
}

RunCache::RunCache(gsl::not_null<std::shared_ptr<Cache>> cache,
                   std::filesystem::path repo_root,
                   RunCacheOpts opts)
    : cache_{std::move(cache)},
      repo_root_{std::move(repo_root)},
      reads_disabled_{opts.skip_reads},
      writes_disabled_{opts.skip_writes},
      task_output_mode_override_{opts.task_output_mode_override},
      log_replayer_{std::move(opts.log_replayer)},
      output_watcher_{std::move(opts.output_watcher)} {
    if (not log_replayer_) {
        log_replayer_ = [](std::filesystem::path const& log_file,
                           ITaskOutput* output) {
            static_cast<void>(ReplayLogFile(log_file, output));
        };
    }
    if (output_watcher_ == nullptr) {
        output_watcher_ = std::make_shared<NoOpOutputWatcher>();
    }
}

auto RunCache::ForTask(TaskId const& task_id,
                       std::filesystem::path const& package_dir,
                       TaskDefinition const& definition,
                       std::string hash) const -> TaskCache {
    auto const log_file = package_dir / TaskLogFile(task_id.task);
    auto outputs = definition.HashableOutputs();
    TaskOutputs globs{
        .inclusions = ToRepoRelative(package_dir, outputs.inclusions),
        .exclusions = ToRepoRelative(package_dir, outputs.exclusions)};
    // the log is replayed from the cache as well
    globs.inclusions.emplace_back(ToUnixPath(log_file));

    return TaskCache{this,
                     task_id,
                     std::move(globs),
                     std::move(hash),
                     task_output_mode_override_.value_or(
                         definition.output_mode),
                     not definition.IsCacheable(),
                     repo_root_ / log_file};
}
