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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_MASK_MASK_RASTERIZER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_MASK_MASK_RASTERIZER_H_

#include <atomic>
#include <cstdint>

#include "absl/status/statusor.h"
#include "slidemask/core/geometry.h"
#include "slidemask/core/pyramid_descriptor.h"
#include "slidemask/io/pyramid_sink.h"

namespace slidemask {
namespace mask {

/// @brief Limits on the mask pyramid
struct MaskPyramidOptions {
  /// Maximum number of levels to build, 0 for no limit
  int max_levels = 0;
  /// Stop after the first level that fits in a single sink tile
  bool stop_at_single_tile = true;
  /// Polled before every level; a set flag ends the build early
  const std::atomic<bool>* cancel = nullptr;
};

/// @brief Outcome of a mask pyramid build
struct MaskPyramidReport {
  int levels_built = 0;
  uint64_t tiles_written = 0;
  uint64_t tissue_pixels_level0 = 0;  ///< Tissue pixel count of level 0
  bool cancelled = false;  ///< Stopped at a level boundary on request
};

/// @brief Builds a single-channel binary mask pyramid from vector geometry
///
/// Each level L of the image descriptor is rasterized directly from the
/// level-0 geometry scaled by 1 / downsample[L], so the mask levels have
/// exactly the image level dimensions. Tiles are produced one at a time in
/// row-major order and handed to the sink immediately.
class MaskRasterizer {
 public:
  explicit MaskRasterizer(MaskPyramidOptions options = {})
      : options_(options) {}

  /// @brief Rasterize every level into the sink
  /// @param geometry Normalized geometry, possibly empty
  /// @param descriptor Level structure of the image pyramid
  /// @param sink Single-channel pyramid sink
  /// @return Report, or the first error; a RasterizationError or write
  ///         failure aborts the level in progress and stops the build,
  ///         keeping the levels already completed in the sink
  absl::StatusOr<MaskPyramidReport> BuildPyramid(
      const Geometry& geometry, const PyramidDescriptor& descriptor,
      PyramidSink& sink) const;

 private:
  MaskPyramidOptions options_;
};

}  // namespace mask

using mask::MaskPyramidOptions;
using mask::MaskPyramidReport;
using mask::MaskRasterizer;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_MASK_MASK_RASTERIZER_H_
