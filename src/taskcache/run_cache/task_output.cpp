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

#include "src/taskcache/run_cache/task_output.hpp"

#include <exception>
#include <fstream>
#include <mutex>

#include "fmt/color.h"
#include "fmt/core.h"
#include "src/taskcache/logging/log_level.hpp"
#include "src/taskcache/logging/logger.hpp"

void PrefixedTaskOutput::Print(std::FILE* stream,
                               std::string const& line,
                               Style style) const noexcept {
    static std::mutex mutex{};
    try {
        std::string body{line};
        if (colored_) {
            switch (style) {
                case Style::Dim:
                    body = fmt::format(fmt::emphasis::faint, "{}", line);
                    break;
                case Style::Red:
                    body = fmt::format(fmt::fg(fmt::color::red), "{}", line);
                    break;
                case Style::Plain:
                    break;
            }
        }
        std::lock_guard lock{mutex};
        fmt::print(stream, "{}{}\n", prefix_, body);
        std::fflush(stream);
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "printing task output failed with:\n{}",
                    e.what());
    }
}

void PrefixedTaskOutput::Output(std::string const& line) noexcept {
    Print(out_, line, Style::Plain);
}

void PrefixedTaskOutput::Info(std::string const& line) noexcept {
    Print(out_, line, Style::Plain);
}

void PrefixedTaskOutput::Warn(std::string const& line) noexcept {
    Print(err_, line, Style::Dim);
}

void PrefixedTaskOutput::Error(std::string const& line) noexcept {
    Print(err_, line, Style::Red);
}

auto ReplayLogFile(std::filesystem::path const& log_file,
                   gsl::not_null<ITaskOutput*> const& output) noexcept
    -> bool {
    try {
        Logger::Log(
            LogLevel::Debug, "start replaying logs {}", log_file.string());
        std::ifstream in{log_file, std::ios::in | std::ios::binary};
        if (not in.is_open()) {
            auto const msg =
                fmt::format("error reading logs: could not open {}",
                            log_file.string());
            output->Warn(msg);
            Logger::Log(LogLevel::Error, "{}", msg);
            return false;
        }
        std::string line{};
        while (std::getline(in, line)) {
            if (not line.empty() and line.back() == '\r') {
                line.pop_back();
            }
            output->Output(line);
        }
        if (in.bad()) {
            auto const msg = fmt::format(
                "error reading logs: reading {} failed", log_file.string());
            output->Warn(msg);
            Logger::Log(LogLevel::Error, "{}", msg);
            return false;
        }
        Logger::Log(LogLevel::Debug, "finish replaying logs");
        return true;
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "replaying logs {} failed with:\n{}",
                    log_file.string(),
                    e.what());
        return false;
    }
}
