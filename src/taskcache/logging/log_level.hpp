// Copyright 2022 Huawei Cloud Computing Technology Co., Ltd.
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

#ifndef INCLUDED_SRC_TASKCACHE_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_TASKCACHE_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel {
    Error,    ///< Error messages, fatal errors
    Warning,  ///< Recoverable cache failures, degraded remote cache
    Info,     ///< Informative messages, such as run statistics
    Progress,     ///< Progress of remote transfers and retries
    Performance,  ///< Information about performance issues
    Debug,        ///< Cache misses, resolved inputs, hash ingredients
    Trace         ///< Verbose details such as transport dumps
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;

[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) -> LogLevel {
    return std::min(std::max(static_cast<LogLevel>(level), kFirstLogLevel),
                    kLastLogLevel);
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Progress:
            return "PROG";
        case LogLevel::Performance:
            return "PERF";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

/// \brief Parse a level given either by name (case-insensitive, as printed
/// by LogLevelToString or spelled out) or by its numeric value.
[[nodiscard]] static inline auto ParseLogLevel(std::string const& text)
    -> std::optional<LogLevel> {
    if (text.empty()) {
        return std::nullopt;
    }
    if (std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        try {
            using level_t = std::underlying_type_t<LogLevel>;
            return ToLogLevel(gsl::narrow<level_t>(std::stoul(text)));
        } catch (std::exception const&) {
            return std::nullopt;
        }
    }
    std::string upper{};
    upper.reserve(text.size());
    std::transform(text.begin(),
                   text.end(),
                   std::back_inserter(upper),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper == "WARNING") {
        return LogLevel::Warning;
    }
    if (upper == "PROGRESS") {
        return LogLevel::Progress;
    }
    if (upper == "PERFORMANCE") {
        return LogLevel::Performance;
    }
    for (auto level = static_cast<int>(kFirstLogLevel);
         level <= static_cast<int>(kLastLogLevel);
         ++level) {
        if (LogLevelToString(static_cast<LogLevel>(level)) == upper) {
            return static_cast<LogLevel>(level);
        }
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_TASKCACHE_LOGGING_LOG_LEVEL_HPP
