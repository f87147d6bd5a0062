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

#ifndef INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP
#define INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP

#ifdef __unix__
#include <unistd.h>
#endif

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

/// \brief Root for all files created by tests. Set by the test launcher.
[[nodiscard]] static inline auto ReadTestTmpDirFromEnv()
    -> std::filesystem::path {
    auto* tmp = std::getenv("TEST_TMPDIR");
    if (tmp == nullptr) {
        return std::filesystem::temp_directory_path() / "taskcache-tests";
    }
    return std::filesystem::path{std::string{tmp}};
}

/// \brief Unique directory below the test root which is removed with all
/// its content when going out of scope.
class ScratchDir final {
  public:
    explicit ScratchDir(std::string const& prefix = "scratch") {
        auto root = ReadTestTmpDirFromEnv() / ".test_build_root";
        std::filesystem::create_directories(root);
        std::string tmpl = (root / (prefix + ".XXXXXX")).string();
        if (::mkdtemp(tmpl.data()) != nullptr) {
            path_ = std::filesystem::canonical(tmpl);
        }
    }
    ScratchDir(ScratchDir const&) = delete;
    ScratchDir(ScratchDir&&) = delete;
    auto operator=(ScratchDir const&) -> ScratchDir& = delete;
    auto operator=(ScratchDir&&) -> ScratchDir& = delete;
    ~ScratchDir() noexcept {
        if (not path_.empty()) {
            std::error_code ec{};
            std::filesystem::remove_all(path_, ec);
        }
    }

    [[nodiscard]] auto Valid() const noexcept -> bool {
        return not path_.empty();
    }

    [[nodiscard]] auto GetPath() const& noexcept
        -> std::filesystem::path const& {
        return path_;
    }

  private:
    std::filesystem::path path_{};
};

/// \brief Set or unset an environment variable for the lifetime of the
/// guard, restoring the previous value afterwards.
class EnvGuard final {
  public:
    EnvGuard(std::string name, std::optional<std::string> const& value)
        : name_{std::move(name)} {
        if (auto* prev = std::getenv(name_.c_str())) {
            previous_ = std::string{prev};
        }
        if (value) {
            ::setenv(name_.c_str(), value->c_str(), /*overwrite=*/1);
        }
        else {
            ::unsetenv(name_.c_str());
        }
    }
    EnvGuard(EnvGuard const&) = delete;
    EnvGuard(EnvGuard&&) = delete;
    auto operator=(EnvGuard const&) -> EnvGuard& = delete;
    auto operator=(EnvGuard&&) -> EnvGuard& = delete;
    ~EnvGuard() noexcept {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), /*overwrite=*/1);
        }
        else {
            ::unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    std::optional<std::string> previous_{};
};

#endif  // INCLUDED_SRC_TEST_UTILS_TEST_ENV_HPP
