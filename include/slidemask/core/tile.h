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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "slidemask/core/types.h"

namespace slidemask {
namespace core {

/// @brief Number of interleaved samples per pixel of each raster kind
inline constexpr uint32_t kMaskChannels = 1;
inline constexpr uint32_t kRGBChannels = 3;
inline constexpr uint32_t kRGBAChannels = 4;

/// @brief Mask sample values
inline constexpr uint8_t kTissue = 255;
inline constexpr uint8_t kBackground = 0;

/// @brief A window of 8-bit interleaved pixels of one pyramid level
///
/// Tiles are ephemeral: they are created, filled, consumed and released
/// within a single compositing or rasterization step. The pixel buffer is
/// row-major with `channels` samples per pixel and no row padding.
class Tile {
 public:
  Tile() = default;

  /// @brief Allocate a zero-filled tile covering `rect`
  Tile(const PixelRect& rect, uint32_t channels)
      : rect_(rect),
        channels_(channels),
        pixels_(static_cast<size_t>(rect.width) * rect.height * channels, 0) {}

  Tile(const Tile&) = delete;
  Tile& operator=(const Tile&) = delete;
  Tile(Tile&&) noexcept = default;
  Tile& operator=(Tile&&) noexcept = default;

  [[nodiscard]] const PixelRect& rect() const { return rect_; }
  [[nodiscard]] uint32_t x() const { return rect_.x; }
  [[nodiscard]] uint32_t y() const { return rect_.y; }
  [[nodiscard]] uint32_t width() const { return rect_.width; }
  [[nodiscard]] uint32_t height() const { return rect_.height; }
  [[nodiscard]] uint32_t channels() const { return channels_; }

  /// @brief Bytes in one row of the tile
  [[nodiscard]] size_t RowStride() const {
    return static_cast<size_t>(rect_.width) * channels_;
  }

  /// @brief Bytes the tile must hold for its declared bounds
  [[nodiscard]] size_t ExpectedSize() const {
    return RowStride() * rect_.height;
  }

  /// @brief Check that the buffer matches the declared bounds
  [[nodiscard]] bool IsConsistent() const {
    return pixels_.size() == ExpectedSize();
  }

  /// @brief Pointer to the first sample of pixel (col, row), tile-local
  [[nodiscard]] uint8_t* PixelAt(uint32_t col, uint32_t row) {
    return pixels_.data() + static_cast<size_t>(row) * RowStride() +
           static_cast<size_t>(col) * channels_;
  }

  [[nodiscard]] const uint8_t* PixelAt(uint32_t col, uint32_t row) const {
    return pixels_.data() + static_cast<size_t>(row) * RowStride() +
           static_cast<size_t>(col) * channels_;
  }

  [[nodiscard]] std::span<uint8_t> data() { return pixels_; }
  [[nodiscard]] std::span<const uint8_t> data() const { return pixels_; }

  /// @brief Mutable access to the raw buffer (for decoders that resize it)
  [[nodiscard]] std::vector<uint8_t>& buffer() { return pixels_; }

 private:
  PixelRect rect_;
  uint32_t channels_ = 0;
  std::vector<uint8_t> pixels_;
};

}  // namespace core

using core::Tile;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_H_
