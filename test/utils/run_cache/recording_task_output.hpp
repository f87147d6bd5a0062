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

#ifndef INCLUDED_SRC_TEST_UTILS_RUN_CACHE_RECORDING_TASK_OUTPUT_HPP
#define INCLUDED_SRC_TEST_UTILS_RUN_CACHE_RECORDING_TASK_OUTPUT_HPP

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"
#include "src/taskcache/run_cache/task_output.hpp"

/// \brief Task output keeping all lines in memory, per channel.
class RecordingTaskOutput final : public ITaskOutput {
  public:
    void Output(std::string const& line) noexcept final {
        Record(&output_, line);
    }
    void Info(std::string const& line) noexcept final { Record(&info_, line); }
    void Warn(std::string const& line) noexcept final { Record(&warn_, line); }
    void Error(std::string const& line) noexcept final {
        Record(&error_, line);
    }

    [[nodiscard]] auto Outputs() const -> std::vector<std::string> {
        std::lock_guard lock{mutex_};
        return output_;
    }
    [[nodiscard]] auto Infos() const -> std::vector<std::string> {
        std::lock_guard lock{mutex_};
        return info_;
    }
    [[nodiscard]] auto Warnings() const -> std::vector<std::string> {
        std::lock_guard lock{mutex_};
        return warn_;
    }
    [[nodiscard]] auto Errors() const -> std::vector<std::string> {
        std::lock_guard lock{mutex_};
        return error_;
    }

    /// \brief True if any line of any channel contains \p text.
    [[nodiscard]] auto Contains(std::string const& text) const -> bool {
        std::lock_guard lock{mutex_};
        auto has = [&text](std::vector<std::string> const& lines) {
            return std::any_of(
                lines.begin(), lines.end(), [&text](auto const& line) {
                    return line.find(text) != std::string::npos;
                });
        };
        return has(output_) or has(info_) or has(warn_) or has(error_);
    }

    void Clear() {
        std::lock_guard lock{mutex_};
        output_.clear();
        info_.clear();
        warn_.clear();
        error_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> output_;
    std::vector<std::string> info_;
    std::vector<std::string> warn_;
    std::vector<std::string> error_;

    void Record(std::vector<std::string>* lines,
                std::string const& line) noexcept {
        try {
            std::lock_guard lock{mutex_};
            lines->push_back(line);
        } catch (std::exception const& e) {
            Logger::Log(
                LogLevel::Error, "recording output failed: {}", e.what());
        }
    }
};

#endif  // INCLUDED_SRC_TEST_UTILS_RUN_CACHE_RECORDING_TASK_OUTPUT_HPP
