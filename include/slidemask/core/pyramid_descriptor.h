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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_PYRAMID_DESCRIPTOR_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_PYRAMID_DESCRIPTOR_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/core/types.h"

/**
 * @file pyramid_descriptor.h
 * @brief Level structure of a multi-resolution raster
 *
 * A PyramidDescriptor is the read-only reflection of an opened pyramid:
 * how many levels it has, how large each level is and how far each level is
 * downsampled relative to level 0. Descriptors are validated on creation and
 * immutable afterwards.
 */

namespace slidemask {
namespace core {

/// @brief Pyramid level metadata
///
/// Describes a single level in the image pyramid including its dimensions
/// and downsample factor relative to the base level.
struct LevelInfo {
  Dimensions dimensions;           ///< Level dimensions in pixels
  double downsample_factor = 1.0;  ///< Downsample factor relative to level 0
};

/// @brief Validated level structure of a raster pyramid
///
/// Invariants (checked by Create()):
/// - at least one level, none of them empty;
/// - level 0 has downsample factor 1.0;
/// - downsample factors are finite and non-decreasing.
class PyramidDescriptor {
 public:
  /// @brief Validate a level list and build a descriptor
  /// @param levels Levels ordered from full resolution to coarsest
  /// @return Descriptor, or an UnreadablePyramid error
  static absl::StatusOr<PyramidDescriptor> Create(
      std::vector<LevelInfo> levels);

  /// @brief Build a descriptor deriving downsample factors from dimensions
  ///
  /// The factor of level i is the mean of the width and height ratios of
  /// level 0 against level i, which is how tiled TIFF pyramids are usually
  /// reflected.
  /// @param dimensions Level dimensions ordered from full resolution
  static absl::StatusOr<PyramidDescriptor> FromDimensions(
      const std::vector<Dimensions>& dimensions);

  PyramidDescriptor(const PyramidDescriptor&) = default;
  PyramidDescriptor& operator=(const PyramidDescriptor&) = default;
  PyramidDescriptor(PyramidDescriptor&&) noexcept = default;
  PyramidDescriptor& operator=(PyramidDescriptor&&) noexcept = default;

  [[nodiscard]] int level_count() const {
    return static_cast<int>(levels_.size());
  }

  /// @brief Dimensions of a level; level must be in [0, level_count())
  [[nodiscard]] const Dimensions& dimensions(int level) const {
    return levels_[static_cast<size_t>(level)].dimensions;
  }

  /// @brief Downsample factor of a level; level must be in [0, level_count())
  [[nodiscard]] double downsample(int level) const {
    return levels_[static_cast<size_t>(level)].downsample_factor;
  }

  [[nodiscard]] const std::vector<LevelInfo>& levels() const {
    return levels_;
  }

  /// @brief Check whether a level index exists
  [[nodiscard]] bool HasLevel(int level) const {
    return level >= 0 && level < level_count();
  }

  bool operator==(const PyramidDescriptor& other) const;

 private:
  explicit PyramidDescriptor(std::vector<LevelInfo> levels)
      : levels_(std::move(levels)) {}

  std::vector<LevelInfo> levels_;
};

}  // namespace core

using core::LevelInfo;
using core::PyramidDescriptor;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_PYRAMID_DESCRIPTOR_H_
