// Copyright 2025 Jonas Teuwen. All Rights Reserved.
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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_UTILITIES_TEMPORARY_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_UTILITIES_TEMPORARY_H_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "slidemask/status/status_macros.h"

namespace slidemask::utilities {

namespace fs = std::filesystem;

/// @brief Uniquely named scratch directory removed on destruction
class TemporaryDirectory {
 public:
  /// @brief Create a fresh directory below `parent`
  /// @param parent Parent directory; the system temp directory when empty
  /// @param keep_files Leave the directory in place on destruction
  static absl::StatusOr<TemporaryDirectory> Create(const fs::path& parent = {},
                                                   bool keep_files = false) {
    std::error_code ec;
    fs::path base = parent;
    if (base.empty()) {
      base = fs::temp_directory_path(ec);
      if (ec) {
        return MAKE_STATUS(absl::StatusCode::kUnavailable,
                           "No system temporary directory: " + ec.message());
      }
    }

    std::random_device random_device;
    std::mt19937_64 gen(random_device());
    const uint64_t unique_id = gen();
    const auto timestamp =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();

    std::stringstream name;
    name << "slidemask_" << std::hex << std::setfill('0') << std::setw(16)
         << timestamp << "_" << unique_id;

    fs::path path = base / name.str();
    if (!fs::create_directories(path, ec) || ec) {
      return MAKE_STATUS(absl::StatusCode::kPermissionDenied,
                         "Failed to create temporary directory " +
                             path.string() +
                             (ec ? ": " + ec.message() : std::string()));
    }
    return TemporaryDirectory(std::move(path), keep_files);
  }

  ~TemporaryDirectory() { Cleanup(); }

  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

  TemporaryDirectory(TemporaryDirectory&& other) noexcept
      : path_(std::exchange(other.path_, {})), keep_files_(other.keep_files_) {}

  TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept {
    if (this != &other) {
      Cleanup();
      path_ = std::exchange(other.path_, {});
      keep_files_ = other.keep_files_;
    }
    return *this;
  }

  [[nodiscard]] const fs::path& Path() const { return path_; }

  [[nodiscard]] bool IsKept() const { return keep_files_; }

 private:
  TemporaryDirectory(fs::path path, bool keep_files)
      : path_(std::move(path)), keep_files_(keep_files) {}

  void Cleanup() noexcept {
    if (keep_files_ || path_.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      LOG(WARNING) << "Failed to clean up temporary directory " << path_
                   << ": " << ec.message();
    }
  }

  fs::path path_;
  bool keep_files_;
};

}  // namespace slidemask::utilities

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_UTILITIES_TEMPORARY_H_
