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

#include "slidemask/core/tile_grid.h"

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace slidemask {
namespace core {

TileGridIterator::TileGridIterator(uint32_t start_x, uint32_t start_y,
                                   uint32_t end_x, uint32_t end_y,
                                   uint32_t tile_width, uint32_t tile_height)
    : current_x_(start_x),
      current_y_(start_y),
      start_x_(start_x),
      end_x_(end_x),
      end_y_(end_y),
      tile_width_(tile_width),
      tile_height_(tile_height),
      is_end_(start_y >= end_y || start_x >= end_x || tile_width == 0 ||
              tile_height == 0) {
  UpdateWindow();
}

TileGridIterator::TileGridIterator()
    : current_x_(0),
      current_y_(0),
      start_x_(0),
      end_x_(0),
      end_y_(0),
      tile_width_(0),
      tile_height_(0),
      is_end_(true) {}

void TileGridIterator::UpdateWindow() {
  if (is_end_) {
    current_ = PixelRect{};
    return;
  }
  current_ = PixelRect{
      .x = current_x_,
      .y = current_y_,
      .width = std::min(tile_width_, end_x_ - current_x_),
      .height = std::min(tile_height_, end_y_ - current_y_)};
}

TileGridIterator& TileGridIterator::operator++() {
  if (is_end_) {
    return *this;
  }

  // Step in 64 bits so grids ending near UINT32_MAX terminate
  const uint64_t next_x = static_cast<uint64_t>(current_x_) + tile_width_;
  if (next_x >= end_x_) {
    current_x_ = start_x_;
    const uint64_t next_y = static_cast<uint64_t>(current_y_) + tile_height_;
    if (next_y >= end_y_) {
      is_end_ = true;
      UpdateWindow();
      return *this;
    }
    current_y_ = static_cast<uint32_t>(next_y);
  } else {
    current_x_ = static_cast<uint32_t>(next_x);
  }
  UpdateWindow();
  return *this;
}

TileGridIterator TileGridIterator::operator++(int) {
  TileGridIterator tmp = *this;
  ++(*this);
  return tmp;
}

bool operator==(const TileGridIterator& a, const TileGridIterator& b) {
  if (a.is_end_ && b.is_end_) {
    return true;
  }
  if (a.is_end_ || b.is_end_) {
    return false;
  }
  return a.current_x_ == b.current_x_ && a.current_y_ == b.current_y_;
}

bool operator!=(const TileGridIterator& a, const TileGridIterator& b) {
  return !(a == b);
}

TileGrid::TileGrid(const PixelRect& region, const Dimensions& tile_dims)
    : start_x_(tile_dims.width == 0
                   ? region.x
                   : (region.x / tile_dims.width) * tile_dims.width),
      start_y_(tile_dims.height == 0
                   ? region.y
                   : (region.y / tile_dims.height) * tile_dims.height),
      end_x_(region.x + region.width),
      end_y_(region.y + region.height),
      tile_width_(tile_dims.width),
      tile_height_(tile_dims.height) {}

TileGrid::TileGrid(const Dimensions& level, const Dimensions& tile_dims)
    : TileGrid(PixelRect{.x = 0,
                         .y = 0,
                         .width = level.width,
                         .height = level.height},
               tile_dims) {}

TileGridIterator TileGrid::begin() const {
  return TileGridIterator(start_x_, start_y_, end_x_, end_y_, tile_width_,
                          tile_height_);
}

TileGridIterator TileGrid::end() const {
  return TileGridIterator();
}

uint32_t TileGrid::tiles_across() const {
  if (tile_width_ == 0 || end_x_ <= start_x_) {
    return 0;
  }
  return (end_x_ - start_x_ + tile_width_ - 1) / tile_width_;
}

uint32_t TileGrid::tiles_down() const {
  if (tile_height_ == 0 || end_y_ <= start_y_) {
    return 0;
  }
  return (end_y_ - start_y_ + tile_height_ - 1) / tile_height_;
}

void CopyTileToBuffer(const uint8_t* tile_buffer, uint8_t* output_buffer,
                      uint32_t tile_width, uint32_t tile_height,
                      uint32_t tile_x, uint32_t tile_y, uint32_t region_x,
                      uint32_t region_y, uint32_t region_width,
                      uint32_t region_height, uint32_t bytes_per_pixel) {
  const uint32_t x0 = std::max(region_x, tile_x);
  const uint32_t y0 = std::max(region_y, tile_y);
  const uint32_t x1 = std::min(region_x + region_width, tile_x + tile_width);
  const uint32_t y1 = std::min(region_y + region_height, tile_y + tile_height);

  if (x0 >= x1 || y0 >= y1) {
    return;  // No intersection
  }

  const size_t copy_bytes = size_t(x1 - x0) * bytes_per_pixel;
  const size_t tile_row_stride = size_t(tile_width) * bytes_per_pixel;
  const size_t out_row_stride = size_t(region_width) * bytes_per_pixel;

  const uint8_t* src = tile_buffer + size_t(y0 - tile_y) * tile_row_stride +
                       size_t(x0 - tile_x) * bytes_per_pixel;
  uint8_t* dst = output_buffer + size_t(y0 - region_y) * out_row_stride +
                 size_t(x0 - region_x) * bytes_per_pixel;

  for (uint32_t r = y0; r < y1; ++r) {
    std::memcpy(dst, src, copy_bytes);
    src += tile_row_stride;
    dst += out_row_stride;
  }
}

}  // namespace core
}  // namespace slidemask
