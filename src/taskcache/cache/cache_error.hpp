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

#ifndef INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ERROR_HPP
#define INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/utils/cpp/expected.hpp"

enum class CacheErrorKind : std::uint8_t {
    Io,
    Archive,
    UnsupportedFileType,
    InvalidPath,
    Remote,
    Forbidden,
    TooManyFailures,
    Signature,
    Cancelled
};

[[nodiscard]] static inline auto ToString(CacheErrorKind kind) -> std::string {
    switch (kind) {
        case CacheErrorKind::Io:
            return "io";
        case CacheErrorKind::Archive:
            return "archive";
        case CacheErrorKind::UnsupportedFileType:
            return "unsupported file type";
        case CacheErrorKind::InvalidPath:
            return "invalid path";
        case CacheErrorKind::Remote:
            return "remote";
        case CacheErrorKind::Forbidden:
            return "forbidden";
        case CacheErrorKind::TooManyFailures:
            return "too many failures";
        case CacheErrorKind::Signature:
            return "signature";
        case CacheErrorKind::Cancelled:
            return "cancelled";
    }
    Ensures(false);  // unreachable
}

/// \brief Failure of a cache operation. The kind lets callers tell a
/// degraded remote cache apart from real errors.
struct CacheError {
    CacheErrorKind kind{CacheErrorKind::Io};
    std::string message{};

    template <class... T_Args>
    [[nodiscard]] static auto Create(CacheErrorKind kind,
                                     std::string const& msg,
                                     T_Args const&... args) -> CacheError {
        if constexpr (sizeof...(T_Args) == 0) {
            return CacheError{kind, msg};
        }
        else {
            return CacheError{
                kind, fmt::vformat(msg, fmt::make_format_args(args...))};
        }
    }

    [[nodiscard]] auto ToString() const -> std::string {
        return fmt::format("{} error: {}", ::ToString(kind), message);
    }
};

/// \brief Short-hand for failing with a cache error.
template <class... T_Args>
[[nodiscard]] auto MakeCacheError(CacheErrorKind kind,
                                  std::string const& msg,
                                  T_Args const&... args)
    -> unexpected<CacheError> {
    return unexpected{CacheError::Create(kind, msg, args...)};
}

#endif  // INCLUDED_SRC_TASKCACHE_CACHE_CACHE_ERROR_HPP
