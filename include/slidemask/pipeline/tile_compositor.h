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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TILE_COMPOSITOR_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TILE_COMPOSITOR_H_

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/core/level_plan.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"
#include "slidemask/io/pyramid_sink.h"
#include "slidemask/io/pyramid_source.h"

/**
 * @file tile_compositor.h
 * @brief Streaming RGBA compositing of an image pyramid with its mask
 *
 * For every selected level the compositor walks the output tile grid in
 * row-major order. Per tile it reads the image window, reads the mask window
 * covering the same area (scale-corrected), writes RGB from the image and a
 * binary alpha from the mask, and hands the tile to the sink. At most one
 * image, one mask and one output tile are alive at any time.
 */

namespace slidemask {
namespace pipeline {

struct CompositeOptions {
  /// Mask samples strictly above this value are tissue
  uint8_t mask_threshold = 128;
};

/// @brief Per-level outcome
struct CompositeLevelReport {
  int level = 0;
  Dimensions dimensions;
  uint64_t tiles = 0;
  uint64_t tissue_pixels = 0;  ///< Pixels written with alpha 255
  double seconds = 0.0;
};

struct CompositeReport {
  std::vector<CompositeLevelReport> levels;
  bool cancelled = false;  ///< Stopped at a level boundary on request

  [[nodiscard]] uint64_t total_tiles() const;
};

class TileCompositor {
 public:
  explicit TileCompositor(CompositeOptions options = {}) : options_(options) {}

  /// @brief Composite the selected levels into the sink
  /// @param image Image pyramid with 1, 3 or 4 channels
  /// @param mask Single-channel mask pyramid
  /// @param plans Level plans from AlignLevels()
  /// @param levels Ascending level indices, each present in `plans`
  /// @param sink RGBA sink; one level is written per selected index
  /// @param cancel Optional flag polled before every level
  /// @return Report, or TileIOError naming the level (and the tile, for
  ///         tile reads and writes) when a read, write, BeginLevel or
  ///         EndLevel fails; the failed level is aborted in the sink
  absl::StatusOr<CompositeReport> Compose(
      PyramidSource& image, PyramidSource& mask,
      const std::vector<LevelPlan>& plans, const std::vector<int>& levels,
      PyramidSink& sink, const std::atomic<bool>* cancel = nullptr) const;

  /// @brief Build one RGBA tile
  /// @param image_tile Image pixels of the output window
  /// @param mask_tile Mask pixels of `mask_tile.rect()`, or nullptr when
  ///        the window maps entirely outside the mask level
  /// @param scale_factor Mask-to-image scale of the level
  [[nodiscard]] Tile CompositeTile(const Tile& image_tile,
                                   const Tile* mask_tile,
                                   double scale_factor) const;

  /// @brief Mask window sampled by an image window, clipped to the mask
  static std::optional<PixelRect> MaskWindowFor(const PixelRect& image_window,
                                                double scale_factor,
                                                const Dimensions& mask_level);

 private:
  CompositeOptions options_;
};

}  // namespace pipeline

using pipeline::CompositeOptions;
using pipeline::CompositeReport;
using pipeline::TileCompositor;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TILE_COMPOSITOR_H_
