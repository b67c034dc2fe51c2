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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TYPES_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TYPES_H_

#include <cstdint>
#include <ostream>

/**
 * @file types.h
 * @brief Plain value types shared by every stage of the pipeline
 *
 * These are aggregates so they can be built with designated initializers.
 */

namespace slidemask {
namespace core {

/// @brief Width and height of a raster level or tile, in pixels
struct Dimensions {
  uint32_t width = 0;
  uint32_t height = 0;

  /// @brief Number of pixels covered
  [[nodiscard]] uint64_t Area() const noexcept {
    return static_cast<uint64_t>(width) * height;
  }

  [[nodiscard]] bool IsEmpty() const noexcept {
    return width == 0 || height == 0;
  }

  bool operator==(const Dimensions& other) const = default;

  friend std::ostream& operator<<(std::ostream& os, const Dimensions& dims) {
    return os << dims.width << "x" << dims.height;
  }
};

/// @brief Axis-aligned pixel rectangle within one level
///
/// Coordinates are in the pixel space of the level the rectangle refers to.
struct PixelRect {
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t width = 0;
  uint32_t height = 0;

  [[nodiscard]] bool IsEmpty() const noexcept {
    return width == 0 || height == 0;
  }

  /// @brief Check whether the rectangle lies inside a level of given size
  [[nodiscard]] bool FitsWithin(const Dimensions& dims) const noexcept {
    return static_cast<uint64_t>(x) + width <= dims.width &&
           static_cast<uint64_t>(y) + height <= dims.height;
  }

  bool operator==(const PixelRect& other) const = default;

  friend std::ostream& operator<<(std::ostream& os, const PixelRect& rect) {
    return os << "(" << rect.x << ", " << rect.y << ") " << rect.width << "x"
              << rect.height;
  }
};

}  // namespace core

using core::Dimensions;
using core::PixelRect;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TYPES_H_
