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

#ifndef INCLUDED_SRC_UTILS_CPP_JSON_HPP
#define INCLUDED_SRC_UTILS_CPP_JSON_HPP

#include <exception>
#include <functional>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Read \p key of the object \p j as \p ValueT.
/// \returns nullopt if the key is missing or has another type; the reason is
/// passed to \p logger.
template <typename ValueT>
auto ExtractValueAs(
    nlohmann::json const& j,
    std::string const& key,
    std::function<void(std::string const& error)>&& logger =
        [](std::string const& /*unused*/) -> void {}) noexcept
    -> std::optional<ValueT> {
    try {
        auto it = j.find(key);
        if (it == j.end()) {
            logger("key " + key + " cannot be found in JSON object");
            return std::nullopt;
        }
        return it.value().template get<ValueT>();
    } catch (std::exception& e) {
        logger(e.what());
        return std::nullopt;
    }
}

/// \brief Parse \p text, reporting syntax errors instead of throwing.
[[nodiscard]] static inline auto ParseJson(std::string const& text) noexcept
    -> expected<nlohmann::json, std::string> {
    try {
        return nlohmann::json::parse(text);
    } catch (std::exception const& e) {
        return unexpected{std::string{e.what()}};
    }
}

#endif  // INCLUDED_SRC_UTILS_CPP_JSON_HPP
