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

#include "slidemask/mask/mask_rasterizer.h"

#include <algorithm>
#include <chrono>

#include "absl/log/log.h"
#include "slidemask/core/tile_grid.h"
#include "slidemask/mask/scanline_rasterizer.h"
#include "slidemask/status/errors.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace mask {

absl::StatusOr<MaskPyramidReport> MaskRasterizer::BuildPyramid(
    const Geometry& geometry, const PyramidDescriptor& descriptor,
    PyramidSink& sink) const {
  MaskPyramidReport report;
  const uint32_t tile_size = sink.tile_size();
  const Dimensions tile_dims{.width = tile_size, .height = tile_size};

  int level_limit = descriptor.level_count();
  if (options_.max_levels > 0) {
    level_limit = std::min(level_limit, options_.max_levels);
  }

  for (int level = 0; level < level_limit; ++level) {
    if (options_.cancel != nullptr && options_.cancel->load()) {
      LOG(WARNING) << "Mask build cancelled before level " << level;
      report.cancelled = true;
      break;
    }

    const auto start = std::chrono::steady_clock::now();
    const Dimensions& dims = descriptor.dimensions(level);
    const double scale = 1.0 / descriptor.downsample(level);

    RETURN_IF_ERROR(sink.BeginLevel(dims),
                    slidemask::fmt::format("Mask level {}", level));

    ScanlineRasterizer rasterizer(geometry, scale, dims, tile_size);
    for (const PixelRect& window : TileGrid(dims, tile_dims)) {
      absl::StatusOr<Tile> tile = rasterizer.RasterizeWindow(window);
      if (!tile.ok()) {
        sink.AbortLevel();
        LOG(ERROR) << "Aborted mask level " << level << " at tile ("
                   << window.x << ", " << window.y
                   << "): " << tile.status().message();
        RETURN_IF_ERROR(tile.status(),
                        slidemask::fmt::format("Mask level {} tile ({}, {})",
                                               level, window.x, window.y));
      }

      if (level == 0) {
        const auto pixels = tile->data();
        report.tissue_pixels_level0 +=
            std::count(pixels.begin(), pixels.end(), core::kTissue);
      }

      absl::Status written = sink.WriteTile(*tile);
      if (!written.ok()) {
        sink.AbortLevel();
        LOG(ERROR) << "Aborted mask level " << level << ": failed to write "
                   << "tile (" << window.x << ", " << window.y << ")";
        return WithErrorKind(
            status::AddTrace(
                written, __func__, __FILE__, __LINE__,
                slidemask::fmt::format("Mask level {} tile ({}, {})", level,
                                       window.x, window.y)),
            ErrorKind::kTileIOError);
      }
      ++report.tiles_written;
    }

    RETURN_IF_ERROR(sink.EndLevel(),
                    slidemask::fmt::format("Mask level {}", level));
    ++report.levels_built;

    const auto elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();
    LOG(INFO) << "Mask level " << level << ": " << dims << " ("
              << rasterizer.edge_count() << " edges) in " << elapsed << "s";

    if (options_.stop_at_single_tile && dims.width <= tile_size &&
        dims.height <= tile_size) {
      break;
    }
  }

  return report;
}

}  // namespace mask
}  // namespace slidemask
