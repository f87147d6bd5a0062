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

#ifndef INCLUDED_SRC_TASKCACHE_COMMON_TASK_ID_HPP
#define INCLUDED_SRC_TASKCACHE_COMMON_TASK_ID_HPP

#include <compare>
#include <optional>
#include <string>
#include <string_view>

#include "fmt/core.h"

/// \brief Package name of the workspace root.
inline constexpr std::string_view kRootPackageName = "//";

/// \brief A task of a package, rendered as `package#task`.
struct TaskId {
    std::string package{};
    std::string task{};

    [[nodiscard]] auto ToString() const -> std::string {
        return fmt::format("{}#{}", package, task);
    }

    [[nodiscard]] auto IsRootTask() const noexcept -> bool {
        return package == kRootPackageName;
    }

    [[nodiscard]] auto operator<=>(TaskId const&) const = default;
};

/// \brief Node of the task graph. The synthetic root node, which every
/// task without dependencies hangs off, is represented by nullopt.
using TaskNode = std::optional<TaskId>;

#endif  // INCLUDED_SRC_TASKCACHE_COMMON_TASK_ID_HPP
