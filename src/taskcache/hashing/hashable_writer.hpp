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

#ifndef INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_WRITER_HPP
#define INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_WRITER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt/core.h"

/// \brief Canonical, unambiguous serialization of hash ingredients.
/// Every value is written as `<tag><length>:<bytes>`, lists and maps carry
/// their element count, so no two distinct field sequences produce the same
/// output. The caller fixes the field order.
class HashableWriter {
  public:
    auto String(std::string_view value) -> HashableWriter& {
        Append('s', value);
        return *this;
    }

    auto Flag(bool value) -> HashableWriter& {
        Append('b', value ? "1" : "0");
        return *this;
    }

    /// \brief Absent values differ from empty ones.
    auto OptionalString(std::optional<std::string> const& value)
        -> HashableWriter& {
        if (value) {
            return String(*value);
        }
        out_.append("n;");
        return *this;
    }

    /// \brief Elements are written in the given order.
    auto List(std::vector<std::string> const& values) -> HashableWriter& {
        out_.append(fmt::format("l{}[", values.size()));
        for (auto const& value : values) {
            String(value);
        }
        out_.push_back(']');
        return *this;
    }

    auto OptionalList(std::optional<std::vector<std::string>> const& values)
        -> HashableWriter& {
        if (values) {
            return List(*values);
        }
        out_.append("n;");
        return *this;
    }

    /// \brief Entries are written sorted by key.
    auto Map(std::map<std::string, std::string> const& values)
        -> HashableWriter& {
        out_.append(fmt::format("m{}[", values.size()));
        for (auto const& [key, value] : values) {
            String(key);
            String(value);
        }
        out_.push_back(']');
        return *this;
    }

    [[nodiscard]] auto Data() const& noexcept -> std::string const& {
        return out_;
    }

    [[nodiscard]] auto Data() && noexcept -> std::string {
        return std::move(out_);
    }

  private:
    std::string out_{};

    void Append(char tag, std::string_view value) {
        out_.push_back(tag);
        out_.append(std::to_string(value.size()));
        out_.push_back(':');
        out_.append(value);
    }
};

#endif  // INCLUDED_SRC_TASKCACHE_HASHING_HASHABLE_WRITER_HPP
