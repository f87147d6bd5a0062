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

#ifndef INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_OBJECT_TYPE_HPP
#define INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_OBJECT_TYPE_HPP

#include <cstdint>
#include <string>

#include "gsl/gsl"

/// \brief File system entry kinds a cache artifact can represent. Anything
/// else (fifo, socket, device) is reported as Special.
enum class ObjectType : std::int8_t {
    File,
    Executable,
    Directory,
    Symlink,
    Special
};

[[nodiscard]] constexpr auto IsFileObject(ObjectType type) noexcept -> bool {
    return type == ObjectType::Executable or type == ObjectType::File;
}

[[nodiscard]] constexpr auto IsDirectoryObject(ObjectType type) noexcept
    -> bool {
    return type == ObjectType::Directory;
}

[[nodiscard]] constexpr auto IsSymlinkObject(ObjectType type) noexcept -> bool {
    return type == ObjectType::Symlink;
}

/// \brief Entries whose content can be fingerprinted as a blob.
[[nodiscard]] static inline auto ToString(ObjectType type) -> std::string {
    switch (type) {
        case ObjectType::File:
            return "file";
        case ObjectType::Executable:
            return "executable";
        case ObjectType::Directory:
            return "directory";
        case ObjectType::Symlink:
            return "symlink";
        case ObjectType::Special:
            return "special file";
    }
    Ensures(false);  // unreachable
}

#endif  // INCLUDED_SRC_TASKCACHE_FILE_SYSTEM_OBJECT_TYPE_HPP
