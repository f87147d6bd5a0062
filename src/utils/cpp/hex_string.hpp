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

#ifndef INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
#define INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace detail {
inline constexpr std::array<char, 16> kHexDigits{'0', '1', '2', '3',
                                                 '4', '5', '6', '7',
                                                 '8', '9', 'a', 'b',
                                                 'c', 'd', 'e', 'f'};
}  // namespace detail

/// \brief Lowercase hex encoding of raw bytes, two characters per byte.
[[nodiscard]] static inline auto ToHexString(std::string const& bytes)
    -> std::string {
    std::string out{};
    out.reserve(bytes.size() * 2);
    for (auto const& b : bytes) {
        auto const c = static_cast<unsigned char>(b);
        out.push_back(detail::kHexDigits.at(c >> 4U));
        out.push_back(detail::kHexDigits.at(c & 0x0FU));  // NOLINT
    }
    return out;
}

/// \brief Big-endian hex rendering of a 64-bit value, zero padded to 16
/// characters.
[[nodiscard]] static inline auto ToHexString(std::uint64_t value)
    -> std::string {
    constexpr std::size_t kWidth = 16;
    std::string out(kWidth, '0');
    for (std::size_t i = kWidth; i > 0; --i) {
        out[i - 1] = detail::kHexDigits.at(value & 0x0FU);  // NOLINT
        value >>= 4U;
    }
    return out;
}

#endif  // INCLUDED_SRC_UTILS_CPP_HEX_STRING_HPP
