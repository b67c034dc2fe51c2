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

#include "slidemask/core/pyramid_descriptor.h"

#include <cmath>
#include <utility>
#include <vector>

#include "slidemask/status/errors.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace core {

absl::StatusOr<PyramidDescriptor> PyramidDescriptor::Create(
    std::vector<LevelInfo> levels) {
  if (levels.empty()) {
    return MAKE_ERROR(ErrorKind::kUnreadablePyramid,
                      "Pyramid exposes zero levels");
  }

  for (size_t i = 0; i < levels.size(); ++i) {
    const auto& level = levels[i];
    if (level.dimensions.IsEmpty()) {
      return MAKE_ERROR(
          ErrorKind::kUnreadablePyramid,
          slidemask::fmt::format("Level {} has empty dimensions {}x{}", i,
                                 level.dimensions.width,
                                 level.dimensions.height));
    }
    if (!std::isfinite(level.downsample_factor) ||
        level.downsample_factor <= 0.0) {
      return MAKE_ERROR(
          ErrorKind::kUnreadablePyramid,
          slidemask::fmt::format("Level {} has invalid downsample factor {}", i,
                                 level.downsample_factor));
    }
    if (i > 0 && level.downsample_factor < levels[i - 1].downsample_factor) {
      return MAKE_ERROR(
          ErrorKind::kUnreadablePyramid,
          slidemask::fmt::format(
              "Downsample factors are not monotonic: level {} has {} after {}",
              i, level.downsample_factor, levels[i - 1].downsample_factor));
    }
  }

  if (levels[0].downsample_factor != 1.0) {
    return MAKE_ERROR(
        ErrorKind::kUnreadablePyramid,
        slidemask::fmt::format("Level 0 must have downsample 1.0, got {}",
                               levels[0].downsample_factor));
  }

  return PyramidDescriptor(std::move(levels));
}

absl::StatusOr<PyramidDescriptor> PyramidDescriptor::FromDimensions(
    const std::vector<Dimensions>& dimensions) {
  std::vector<LevelInfo> levels;
  levels.reserve(dimensions.size());

  for (size_t i = 0; i < dimensions.size(); ++i) {
    const Dimensions& dims = dimensions[i];
    if (i == 0 || dims.IsEmpty()) {
      // Empty levels are rejected by Create()
      levels.push_back(LevelInfo{.dimensions = dims, .downsample_factor = 1.0});
      continue;
    }
    const Dimensions& base = dimensions[0];
    const double downsample =
        (static_cast<double>(base.width) / static_cast<double>(dims.width) +
         static_cast<double>(base.height) / static_cast<double>(dims.height)) /
        2.0;
    levels.push_back(
        LevelInfo{.dimensions = dims, .downsample_factor = downsample});
  }

  return Create(std::move(levels));
}

bool PyramidDescriptor::operator==(const PyramidDescriptor& other) const {
  if (levels_.size() != other.levels_.size()) {
    return false;
  }
  for (size_t i = 0; i < levels_.size(); ++i) {
    if (levels_[i].dimensions != other.levels_[i].dimensions ||
        levels_[i].downsample_factor != other.levels_[i].downsample_factor) {
      return false;
    }
  }
  return true;
}

}  // namespace core
}  // namespace slidemask
