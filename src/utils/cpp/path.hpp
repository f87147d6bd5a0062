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

#ifndef INCLUDED_SRC_UTILS_CPP_PATH_HPP
#define INCLUDED_SRC_UTILS_CPP_PATH_HPP

#include <algorithm>
#include <filesystem>
#include <string>

[[nodiscard]] static inline auto ToNormalPath(
    std::filesystem::path const& p) noexcept -> std::filesystem::path {
    auto n = p.lexically_normal();
    if (not n.has_filename()) {
        n = n.parent_path();
    }
    if (n.empty()) {
        return std::filesystem::path{"."};
    }
    return n;
}

/// \brief Perform a non-upwards condition check on the given path.
/// A path is non-upwards if it is relative and it never references any other
/// path on a higher level in the directory tree than itself.
[[nodiscard]] static inline auto PathIsNonUpwards(
    std::filesystem::path const& path) noexcept -> bool {
    if (path.is_absolute()) {
        return false;
    }
    return *path.lexically_normal().begin() != "..";
}

/// \brief Check whether a relative path, applied from the directory holding
/// \p applied_to, stays non-upwards. Models resolving a symlink inside a
/// tree.
[[nodiscard]] static inline auto PathIsConfined(
    std::filesystem::path const& path,
    std::filesystem::path const& applied_to) noexcept -> bool {
    if (path.is_absolute()) {
        return false;
    }
    return PathIsNonUpwards(applied_to.parent_path() / path);
}

/// \brief Check whether an absolute \p path lies in or below the absolute
/// directory \p root after lexical normalization.
[[nodiscard]] static inline auto PathIsWithin(
    std::filesystem::path const& root,
    std::filesystem::path const& path) noexcept -> bool {
    auto const n_root = ToNormalPath(root);
    auto const n_path = ToNormalPath(path);
    auto const diverge = std::mismatch(
        n_root.begin(), n_root.end(), n_path.begin(), n_path.end());
    return diverge.first == n_root.end();
}

/// \brief Render a path with forward slashes regardless of the host
/// separator.
[[nodiscard]] static inline auto ToUnixPath(std::filesystem::path const& p)
    -> std::string {
    auto s = p.generic_string();
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

#endif  // INCLUDED_SRC_UTILS_CPP_PATH_HPP
