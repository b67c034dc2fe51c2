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

#include "slidemask/io/memory_pyramid.h"

#include <cstring>
#include <memory>
#include <utility>
#include <vector>

#include "slidemask/status/errors.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

absl::StatusOr<std::unique_ptr<MemoryPyramidSource>>
MemoryPyramidSource::Create(std::vector<MemoryLevel> levels,
                            uint32_t channels, Dimensions tile_size) {
  if (channels == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Channel count must be positive");
  }
  if (tile_size.IsEmpty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tile size must be positive");
  }

  std::vector<Dimensions> dimensions;
  dimensions.reserve(levels.size());
  for (size_t i = 0; i < levels.size(); ++i) {
    const auto& level = levels[i];
    const size_t expected = static_cast<size_t>(level.dimensions.Area()) *
                            channels;
    if (level.pixels.size() != expected) {
      return MAKE_ERROR(
          ErrorKind::kUnreadablePyramid,
          slidemask::fmt::format("Level {} holds {} bytes, expected {}", i,
                                 level.pixels.size(), expected));
    }
    dimensions.push_back(level.dimensions);
  }

  absl::StatusOr<PyramidDescriptor> descriptor =
      PyramidDescriptor::FromDimensions(dimensions);
  RETURN_IF_ERROR(descriptor.status(), "Invalid in-memory pyramid");

  return std::unique_ptr<MemoryPyramidSource>(new MemoryPyramidSource(
      *std::move(descriptor), std::move(levels), channels, tile_size));
}

MemoryPyramidSource::MemoryPyramidSource(PyramidDescriptor descriptor,
                                         std::vector<MemoryLevel> levels,
                                         uint32_t channels,
                                         Dimensions tile_size)
    : descriptor_(std::move(descriptor)),
      levels_(std::move(levels)),
      channels_(channels),
      tile_size_(tile_size) {}

absl::StatusOr<Tile> MemoryPyramidSource::ReadRegion(int level,
                                                     const PixelRect& region) {
  if (!descriptor_.HasLevel(level)) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidemask::fmt::format("Level {} out of range [0, {})", level,
                               descriptor_.level_count()));
  }
  const MemoryLevel& source = levels_[static_cast<size_t>(level)];
  if (region.IsEmpty() || !region.FitsWithin(source.dimensions)) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidemask::fmt::format(
            "Region ({}, {}) {}x{} is outside level {} of size {}x{}",
            region.x, region.y, region.width, region.height, level,
            source.dimensions.width, source.dimensions.height));
  }

  ++read_count_;

  Tile tile(region, channels_);
  const size_t src_stride =
      static_cast<size_t>(source.dimensions.width) * channels_;
  const size_t row_bytes = tile.RowStride();
  for (uint32_t row = 0; row < region.height; ++row) {
    const uint8_t* src = source.pixels.data() +
                         static_cast<size_t>(region.y + row) * src_stride +
                         static_cast<size_t>(region.x) * channels_;
    std::memcpy(tile.PixelAt(0, row), src, row_bytes);
  }
  return tile;
}

MemoryPyramidSink::MemoryPyramidSink(uint32_t channels, uint32_t tile_size)
    : channels_(channels), tile_size_(tile_size) {}

absl::Status MemoryPyramidSink::BeginLevel(const Dimensions& dimensions) {
  if (open_level_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "BeginLevel called while a level is open");
  }
  if (dimensions.IsEmpty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot begin an empty level");
  }
  open_level_ = MemoryLevel{
      .dimensions = dimensions,
      .pixels = std::vector<uint8_t>(
          static_cast<size_t>(dimensions.Area()) * channels_, 0)};
  next_tile_index_ = 0;
  return absl::OkStatus();
}

absl::Status MemoryPyramidSink::WriteTile(const Tile& tile) {
  if (!open_level_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "WriteTile called without an open level");
  }
  if (tile.channels() != channels_ || !tile.IsConsistent()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile at ({}, {}) has {} channels and {} "
                               "bytes, sink expects {} channels",
                               tile.x(), tile.y(), tile.channels(),
                               tile.data().size(), channels_));
  }

  const Dimensions& dims = open_level_->dimensions;
  const uint64_t tiles_across = (dims.width + tile_size_ - 1) / tile_size_;
  const uint64_t expected_x = (next_tile_index_ % tiles_across) * tile_size_;
  const uint64_t expected_y = (next_tile_index_ / tiles_across) * tile_size_;
  if (tile.x() != expected_x || tile.y() != expected_y) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile at ({}, {}) is out of order, expected "
                               "({}, {})",
                               tile.x(), tile.y(), expected_x, expected_y));
  }
  if (tile.width() > tile_size_ || tile.height() > tile_size_ ||
      !tile.rect().FitsWithin(dims)) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile {}x{} at ({}, {}) does not fit the "
                               "level grid",
                               tile.width(), tile.height(), tile.x(),
                               tile.y()));
  }

  const size_t dst_stride = static_cast<size_t>(dims.width) * channels_;
  for (uint32_t row = 0; row < tile.height(); ++row) {
    uint8_t* dst = open_level_->pixels.data() +
                   static_cast<size_t>(tile.y() + row) * dst_stride +
                   static_cast<size_t>(tile.x()) * channels_;
    std::memcpy(dst, tile.PixelAt(0, row), tile.RowStride());
  }
  ++next_tile_index_;
  return absl::OkStatus();
}

absl::Status MemoryPyramidSink::EndLevel() {
  if (!open_level_.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "EndLevel called without an open level");
  }
  const Dimensions& dims = open_level_->dimensions;
  const uint64_t tiles_across = (dims.width + tile_size_ - 1) / tile_size_;
  const uint64_t tiles_down = (dims.height + tile_size_ - 1) / tile_size_;
  if (next_tile_index_ != tiles_across * tiles_down) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        slidemask::fmt::format("Level ended after {} of {} tiles",
                               next_tile_index_, tiles_across * tiles_down));
  }
  levels_.push_back(std::move(*open_level_));
  open_level_.reset();
  return absl::OkStatus();
}

void MemoryPyramidSink::AbortLevel() {
  if (!open_level_.has_value()) {
    return;
  }
  open_level_.reset();
  next_tile_index_ = 0;
  ++aborted_levels_;
}

absl::StatusOr<std::unique_ptr<MemoryPyramidSource>>
MemoryPyramidSink::ToSource() const {
  return MemoryPyramidSource::Create(
      levels_, channels_,
      Dimensions{.width = tile_size_, .height = tile_size_});
}

}  // namespace io
}  // namespace slidemask
