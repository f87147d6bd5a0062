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

#ifndef INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_HPP
#define INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include "gsl/gsl"

/// \brief Line oriented, user facing output of a single task.
class ITaskOutput {
  public:
    ITaskOutput() noexcept = default;
    ITaskOutput(ITaskOutput const&) noexcept = delete;
    ITaskOutput(ITaskOutput&&) noexcept = delete;
    auto operator=(ITaskOutput const&) noexcept -> ITaskOutput& = delete;
    auto operator=(ITaskOutput&&) noexcept -> ITaskOutput& = delete;
    virtual ~ITaskOutput() noexcept = default;

    /// \brief Line produced by the task itself.
    virtual void Output(std::string const& line) noexcept = 0;

    /// \brief Status line, such as cache hits.
    virtual void Info(std::string const& line) noexcept = 0;

    virtual void Warn(std::string const& line) noexcept = 0;

    virtual void Error(std::string const& line) noexcept = 0;
};

/// \brief Prints every line with a fixed prefix, e.g. `app:build: `.
/// Output and status lines go to \p out, warnings and errors to \p err.
/// Lines of different tasks never interleave.
class PrefixedTaskOutput final : public ITaskOutput {
  public:
    PrefixedTaskOutput(std::string prefix,
                       gsl::not_null<std::FILE*> out,
                       gsl::not_null<std::FILE*> err,
                       bool colored = false) noexcept
        : prefix_{std::move(prefix)}, out_{out}, err_{err}, colored_{colored} {}

    ~PrefixedTaskOutput() noexcept final = default;
    PrefixedTaskOutput(PrefixedTaskOutput const&) noexcept = delete;
    PrefixedTaskOutput(PrefixedTaskOutput&&) noexcept = delete;
    auto operator=(PrefixedTaskOutput const&) noexcept
        -> PrefixedTaskOutput& = delete;
    auto operator=(PrefixedTaskOutput&&) noexcept
        -> PrefixedTaskOutput& = delete;

    void Output(std::string const& line) noexcept final;
    void Info(std::string const& line) noexcept final;
    void Warn(std::string const& line) noexcept final;
    void Error(std::string const& line) noexcept final;

  private:
    enum class Style : std::uint8_t { Plain, Dim, Red };

    std::string prefix_;
    gsl::not_null<std::FILE*> out_;
    gsl::not_null<std::FILE*> err_;
    bool colored_;

    void Print(std::FILE* stream,
               std::string const& line,
               Style style) const noexcept;
};

/// \brief Replays the log file of a task to its output.
using LogReplayer =
    std::function<void(std::filesystem::path const&, ITaskOutput*)>;

/// \brief Replay \p log_file line by line. Empty lines are kept, a trailing
/// carriage return is dropped.
/// \returns False if the log could not be read.
auto ReplayLogFile(std::filesystem::path const& log_file,
                   gsl::not_null<ITaskOutput*> const& output) noexcept -> bool;

#endif  // INCLUDED_SRC_TASKCACHE_RUN_CACHE_TASK_OUTPUT_HPP
