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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_MEMORY_PYRAMID_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_MEMORY_PYRAMID_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidemask/core/pyramid_descriptor.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"
#include "slidemask/io/pyramid_sink.h"
#include "slidemask/io/pyramid_source.h"

/**
 * @file memory_pyramid.h
 * @brief Pyramid source and sink backed by heap buffers
 *
 * Used for small rasters and tests. Levels are stored as full
 * row-major interleaved planes.
 */

namespace slidemask {
namespace io {

/// @brief One fully materialized level
struct MemoryLevel {
  Dimensions dimensions;
  std::vector<uint8_t> pixels;  ///< width * height * channels bytes
};

/// @brief PyramidSource over in-memory levels
class MemoryPyramidSource : public PyramidSource {
 public:
  /// @brief Build a source, deriving downsample factors from level sizes
  /// @param levels Levels from full resolution downwards
  /// @param channels Samples per pixel of every level
  /// @param tile_size Reported native tile size
  static absl::StatusOr<std::unique_ptr<MemoryPyramidSource>> Create(
      std::vector<MemoryLevel> levels, uint32_t channels,
      Dimensions tile_size = Dimensions{.width = 256, .height = 256});

  [[nodiscard]] const PyramidDescriptor& descriptor() const override {
    return descriptor_;
  }
  [[nodiscard]] uint32_t channels() const override { return channels_; }
  [[nodiscard]] Dimensions tile_size() const override { return tile_size_; }

  absl::StatusOr<Tile> ReadRegion(int level, const PixelRect& region) override;

  /// @brief Number of ReadRegion calls served so far
  [[nodiscard]] int read_count() const { return read_count_; }

 private:
  MemoryPyramidSource(PyramidDescriptor descriptor,
                      std::vector<MemoryLevel> levels, uint32_t channels,
                      Dimensions tile_size);

  PyramidDescriptor descriptor_;
  std::vector<MemoryLevel> levels_;
  uint32_t channels_;
  Dimensions tile_size_;
  int read_count_ = 0;
};

/// @brief PyramidSink collecting levels in memory
///
/// Enforces the sink protocol: tiles must be grid aligned, must not exceed
/// the level bounds, must arrive in row-major order and must cover the whole
/// level before EndLevel().
class MemoryPyramidSink : public PyramidSink {
 public:
  MemoryPyramidSink(uint32_t channels, uint32_t tile_size);

  [[nodiscard]] uint32_t tile_size() const override { return tile_size_; }
  [[nodiscard]] int completed_levels() const override {
    return static_cast<int>(levels_.size());
  }

  absl::Status BeginLevel(const Dimensions& dimensions) override;
  absl::Status WriteTile(const Tile& tile) override;
  absl::Status EndLevel() override;
  void AbortLevel() override;

  [[nodiscard]] uint32_t channels() const { return channels_; }

  /// @brief Completed levels in the order they were ended
  [[nodiscard]] const std::vector<MemoryLevel>& levels() const {
    return levels_;
  }

  /// @brief Number of levels discarded through AbortLevel()
  [[nodiscard]] int aborted_levels() const { return aborted_levels_; }

  /// @brief Copy the completed levels into a readable source
  absl::StatusOr<std::unique_ptr<MemoryPyramidSource>> ToSource() const;

 private:
  uint32_t channels_;
  uint32_t tile_size_;
  std::vector<MemoryLevel> levels_;
  std::optional<MemoryLevel> open_level_;
  uint64_t next_tile_index_ = 0;
  int aborted_levels_ = 0;
};

}  // namespace io

using io::MemoryLevel;
using io::MemoryPyramidSink;
using io::MemoryPyramidSource;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_MEMORY_PYRAMID_H_
