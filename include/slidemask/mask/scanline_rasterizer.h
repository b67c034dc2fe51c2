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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_MASK_SCANLINE_RASTERIZER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_MASK_SCANLINE_RASTERIZER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/core/geometry.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"

/**
 * @file scanline_rasterizer.h
 * @brief Point-sampled polygon fill with the non-zero winding rule
 *
 * A pixel (x, y) is tissue when its centre (x + 0.5, y + 0.5) has a
 * non-zero winding number with respect to the scaled geometry. Output
 * samples are exactly kTissue (255) or kBackground (0). Coverage is not
 * anti-aliased: a binary mask has no partial pixels.
 */

namespace slidemask {
namespace mask {

/// @brief Signed crossing of a scanline with a polygon edge
struct Crossing {
  double x;
  int winding;  ///< +1 for downward edges, -1 for upward edges
};

/// @brief Edge table of one pyramid level with per-band scanline cache
///
/// The geometry is scaled once into level pixel space. Edges are bucketed by
/// horizontal bands of `band_height` rows; crossings of every row of the
/// most recently used band are cached, so the tiles of one tile row share
/// their scanline work.
class ScanlineRasterizer {
 public:
  /// @param geometry Geometry in level-0 pixel coordinates
  /// @param scale Level-0 to level scale, 1 / downsample
  /// @param level Dimensions of the level being rasterized
  /// @param band_height Rows per bucket, normally the tile height
  ScanlineRasterizer(const Geometry& geometry, double scale,
                     const Dimensions& level, uint32_t band_height);

  /// @brief Fill one window of the level
  /// @param window Window inside the level
  /// @return Single-channel tile, or RasterizationError for bad bounds
  absl::StatusOr<Tile> RasterizeWindow(const PixelRect& window);

  [[nodiscard]] const Dimensions& level() const { return level_; }

  /// @brief Number of non-horizontal edges in the table
  [[nodiscard]] size_t edge_count() const { return edges_.size(); }

 private:
  struct Edge {
    double x0, y0, x1, y1;  ///< y0 < y1
    int winding;
  };

  const std::vector<std::vector<Crossing>>& BandCrossings(uint32_t band);

  Dimensions level_;
  uint32_t band_height_;
  std::vector<Edge> edges_;
  std::vector<std::vector<size_t>> bands_;  ///< Edge indices per band
  int64_t cached_band_ = -1;
  std::vector<std::vector<Crossing>> cached_rows_;
};

/// @brief Rasterize one window of one level from level-0 geometry
///
/// Pure convenience over ScanlineRasterizer for a single window.
/// @param geometry Normalized geometry in level-0 pixel coordinates
/// @param level_dimensions Size of the target level
/// @param level_scale Level-0 to level scale, 1 / downsample
/// @param window Window inside the level
absl::StatusOr<Tile> Rasterize(const Geometry& geometry,
                               const Dimensions& level_dimensions,
                               double level_scale, const PixelRect& window);

}  // namespace mask

using mask::Rasterize;
using mask::ScanlineRasterizer;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_MASK_SCANLINE_RASTERIZER_H_
