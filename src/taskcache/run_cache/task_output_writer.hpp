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

#ifndef INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_WRITER_HPP
#define INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_WRITER_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "src/taskcache/run_cache/task_output.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Sink for the stdout and stderr of a running task. Tees the raw
/// bytes into the task's log file and complete lines to the console.
/// The entire class is thread-safe.
class TaskOutputWriter {
  public:
    /// \brief Create a writer. The log file (and its parent directory) is
    /// created immediately, so a crashing task still leaves a partial log.
    /// \param log_file Log file to write, or nullopt for console only.
    /// \param console  Console output, or nullptr for log file only.
    [[nodiscard]] static auto Create(
        std::optional<std::filesystem::path> const& log_file,
        ITaskOutput* console) noexcept
        -> expected<std::unique_ptr<TaskOutputWriter>, std::string>;

    TaskOutputWriter(TaskOutputWriter const&) = delete;
    TaskOutputWriter(TaskOutputWriter&&) = delete;
    auto operator=(TaskOutputWriter const&) -> TaskOutputWriter& = delete;
    auto operator=(TaskOutputWriter&&) -> TaskOutputWriter& = delete;
    ~TaskOutputWriter() noexcept;

    /// \brief Append \p data, which need not end at a line boundary.
    [[nodiscard]] auto Write(std::string_view data) noexcept -> bool;

    /// \brief Flush pending output and close the log file.
    [[nodiscard]] auto Close() noexcept -> std::optional<std::string>;

  private:
    std::mutex mutex_;
    std::optional<std::ofstream> log_;
    std::optional<std::filesystem::path> log_path_;
    ITaskOutput* console_;
    std::string pending_line_;
    bool closed_{false};

    TaskOutputWriter(std::optional<std::ofstream> log,
                     std::optional<std::filesystem::path> log_path,
                     ITaskOutput* console) noexcept;

    void EmitLine(std::string line) const noexcept;
};

#endif  // INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_WRITER_HPP
