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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_GRID_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_GRID_H_

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "slidemask/core/types.h"

namespace slidemask {
namespace core {

/// @brief Iterator over the windows of a tile grid, row-major
///
/// Each window starts on the tile grid and is clipped to the end of the
/// iterated region, so edge windows can be smaller than a tile. The iterator
/// holds no pixel data; restarting iteration is just calling begin() again.
class TileGridIterator {
 public:
  using iterator_category = std::forward_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = PixelRect;
  using pointer = const value_type*;
  using reference = const value_type&;

  /// @brief Constructor for iterating within bounds
  /// @param start_x Starting X coordinate (aligned to tile grid)
  /// @param start_y Starting Y coordinate (aligned to tile grid)
  /// @param end_x Ending X coordinate (exclusive)
  /// @param end_y Ending Y coordinate (exclusive)
  /// @param tile_width Tile width for stepping
  /// @param tile_height Tile height for stepping
  TileGridIterator(uint32_t start_x, uint32_t start_y, uint32_t end_x,
                   uint32_t end_y, uint32_t tile_width, uint32_t tile_height);

  /// @brief End iterator constructor
  TileGridIterator();

  reference operator*() const { return current_; }
  pointer operator->() const { return &current_; }

  TileGridIterator& operator++();
  TileGridIterator operator++(int);

  friend bool operator==(const TileGridIterator& a, const TileGridIterator& b);
  friend bool operator!=(const TileGridIterator& a, const TileGridIterator& b);

 private:
  void UpdateWindow();

  uint32_t current_x_, current_y_;
  uint32_t start_x_, end_x_, end_y_;
  uint32_t tile_width_, tile_height_;
  value_type current_;
  bool is_end_;
};

/// @brief Range of grid-aligned windows covering a region
class TileGrid {
 public:
  /// @brief Windows of the tiles intersecting `region`
  /// @param region Region to cover, in level pixel coordinates
  /// @param tile_dims Grid step; both sides must be positive
  TileGrid(const PixelRect& region, const Dimensions& tile_dims);

  /// @brief Windows covering a whole level
  TileGrid(const Dimensions& level, const Dimensions& tile_dims);

  [[nodiscard]] TileGridIterator begin() const;
  [[nodiscard]] TileGridIterator end() const;

  /// @brief Number of tile columns
  [[nodiscard]] uint32_t tiles_across() const;

  /// @brief Number of tile rows
  [[nodiscard]] uint32_t tiles_down() const;

  /// @brief Total number of windows
  [[nodiscard]] uint64_t size() const {
    return static_cast<uint64_t>(tiles_across()) * tiles_down();
  }

 private:
  uint32_t start_x_, start_y_, end_x_, end_y_;
  uint32_t tile_width_, tile_height_;
};

/// @brief Copy the intersection of a decoded tile with a region
///
/// @param tile_buffer Source tile buffer, full tile_width x tile_height
/// @param output_buffer Destination buffer of region_width x region_height
/// @param tile_width Tile width in pixels
/// @param tile_height Tile height in pixels
/// @param tile_x Tile X coordinate in image space
/// @param tile_y Tile Y coordinate in image space
/// @param region_x Region X coordinate in image space
/// @param region_y Region Y coordinate in image space
/// @param region_width Region width in pixels
/// @param region_height Region height in pixels
/// @param bytes_per_pixel Bytes per pixel
void CopyTileToBuffer(const uint8_t* tile_buffer, uint8_t* output_buffer,
                      uint32_t tile_width, uint32_t tile_height,
                      uint32_t tile_x, uint32_t tile_y, uint32_t region_x,
                      uint32_t region_y, uint32_t region_width,
                      uint32_t region_height, uint32_t bytes_per_pixel);

}  // namespace core

using core::TileGrid;
using core::TileGridIterator;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_TILE_GRID_H_
