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

#ifndef INCLUDED_SRC_TASKCACHE_COMMON_OUTPUT_MODE_HPP
#define INCLUDED_SRC_TASKCACHE_COMMON_OUTPUT_MODE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "gsl/gsl"

/// \brief What a task shows of its logs, live and when replayed from cache.
enum class OutputMode : std::uint8_t {
    Full,       ///< everything
    None,       ///< nothing
    HashOnly,   ///< status line only
    NewOnly,    ///< live output, status line on cache hit
    ErrorsOnly  ///< output only when the task fails
};

[[nodiscard]] static inline auto ToString(OutputMode mode) -> std::string {
    switch (mode) {
        case OutputMode::Full:
            return "full";
        case OutputMode::None:
            return "none";
        case OutputMode::HashOnly:
            return "hash-only";
        case OutputMode::NewOnly:
            return "new-only";
        case OutputMode::ErrorsOnly:
            return "errors-only";
    }
    Ensures(false);  // unreachable
}

[[nodiscard]] static inline auto ParseOutputMode(std::string const& text)
    -> std::optional<OutputMode> {
    for (auto mode : {OutputMode::Full,
                      OutputMode::None,
                      OutputMode::HashOnly,
                      OutputMode::NewOnly,
                      OutputMode::ErrorsOnly}) {
        if (ToString(mode) == text) {
            return mode;
        }
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_TASKCACHE_COMMON_OUTPUT_MODE_HPP
