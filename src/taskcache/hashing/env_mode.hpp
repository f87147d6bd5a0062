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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_ENV_MODE_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_ENV_MODE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "gsl/gsl"

/// \brief How the environment of a task is composed.
enum class EnvMode : std::uint8_t {
    Infer,  ///< not decided yet, must be resolved before hashing
    Loose,  ///< full environment, pass-through names do not join the hash
    Strict  ///< only declared variables, pass-through names join the hash
};

[[nodiscard]] static inline auto ToString(EnvMode mode) -> std::string {
    switch (mode) {
        case EnvMode::Infer:
            return "infer";
        case EnvMode::Loose:
            return "loose";
        case EnvMode::Strict:
            return "strict";
    }
    Ensures(false);  // unreachable
}

[[nodiscard]] static inline auto ParseEnvMode(std::string const& text)
    -> std::optional<EnvMode> {
    if (text == "infer") {
        return EnvMode::Infer;
    }
    if (text == "loose") {
        return EnvMode::Loose;
    }
    if (text == "strict") {
        return EnvMode::Strict;
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_ENV_MODE_HPP
