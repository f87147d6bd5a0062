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

#include "src/taskcache/run_cache/task_output_writer.hpp"

#include <cstddef>
#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/taskcache/file_system/file_system_manager.hpp"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

TaskOutputWriter::TaskOutputWriter(
    std::optional<std::ofstream> log,
    std::optional<std::filesystem::path> log_path,
    ITaskOutput* console) noexcept
    : log_{std::move(log)}, log_path_{std::move(log_path)}, console_{console} {}

TaskOutputWriter::~TaskOutputWriter() noexcept {
    if (auto error = Close()) {
        Logger::Log(LogLevel::Warning, "{}", *error);
    }
}

auto TaskOutputWriter::Create(
    std::optional<std::filesystem::path> const& log_file,
    ITaskOutput* console) noexcept
    -> expected<std::unique_ptr<TaskOutputWriter>, std::string> {
    try {
        std::optional<std::ofstream> log{};
        if (log_file) {
            if (not FileSystemManager::CreateDirectory(
                    log_file->parent_path())) {
                return unexpected{
                    fmt::format("could not create directory for log file {}",
                                log_file->string())};
            }
            log.emplace(*log_file,
                        std::ios::out | std::ios::trunc | std::ios::binary);
            if (not log->is_open()) {
                return unexpected{fmt::format("could not open log file {}",
                                              log_file->string())};
            }
        }
        return std::unique_ptr<TaskOutputWriter>(
            new TaskOutputWriter(std::move(log), log_file, console));
    } catch (std::exception const& e) {
        return unexpected{fmt::format("creating task output writer failed: {}",
                                      e.what())};
    }
}

void TaskOutputWriter::EmitLine(std::string line) const noexcept {
    if (not line.empty() and line.back() == '\r') {
        line.pop_back();
    }
    console_->Output(line);
}

auto TaskOutputWriter::Write(std::string_view data) noexcept -> bool {
    try {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return false;
        }
        if (log_) {
            log_->write(data.data(), static_cast<std::streamsize>(data.size()));
            if (not log_->good()) {
                return false;
            }
        }
        if (console_ != nullptr) {
            std::size_t pos{};
            while (pos < data.size()) {
                auto const newline = data.find('\n', pos);
                if (newline == std::string_view::npos) {
                    pending_line_.append(data.substr(pos));
                    break;
                }
                pending_line_.append(data.substr(pos, newline - pos));
                EmitLine(std::move(pending_line_));
                pending_line_.clear();
                pos = newline + 1;
            }
        }
        return true;
    } catch (std::exception const& e) {
        Logger::Log(
            LogLevel::Error, "writing task output failed with:\n{}", e.what());
        return false;
    }
}

auto TaskOutputWriter::Close() noexcept -> std::optional<std::string> {
    try {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return std::nullopt;
        }
        closed_ = true;
        if (console_ != nullptr and not pending_line_.empty()) {
            EmitLine(std::move(pending_line_));
            pending_line_.clear();
        }
        if (log_) {
            log_->close();
            if (log_->fail()) {
                return fmt::format("could not write log file {}",
                                   log_path_->string());
            }
        }
        return std::nullopt;
    } catch (std::exception const& e) {
        return fmt::format("closing task output failed: {}", e.what());
    }
}
