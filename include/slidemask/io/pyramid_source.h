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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SOURCE_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SOURCE_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "slidemask/core/pyramid_descriptor.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"

namespace slidemask {
namespace io {

/// @brief Read side of a multi-resolution raster
///
/// Implementations own their underlying handle exclusively. ReadRegion may
/// change internal state (current directory, decode buffers), so a source is
/// not safe for concurrent use.
class PyramidSource {
 public:
  virtual ~PyramidSource() = default;

  /// @brief Level structure of the raster
  [[nodiscard]] virtual const PyramidDescriptor& descriptor() const = 0;

  /// @brief Interleaved 8-bit samples per pixel
  [[nodiscard]] virtual uint32_t channels() const = 0;

  /// @brief Native tile size of the storage, used as a read hint
  [[nodiscard]] virtual Dimensions tile_size() const = 0;

  /// @brief Read a window of a level into a new tile
  /// @param level Level index in [0, descriptor().level_count())
  /// @param region Window in the pixel space of that level; must lie inside it
  /// @return Tile with channels() samples per pixel covering exactly `region`
  virtual absl::StatusOr<Tile> ReadRegion(int level,
                                          const PixelRect& region) = 0;
};

}  // namespace io

using io::PyramidSource;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SOURCE_H_
