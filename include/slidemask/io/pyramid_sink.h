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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SINK_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SINK_H_

#include <cstdint>

#include "absl/status/status.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"

namespace slidemask {
namespace io {

/// @brief Write side of a multi-resolution raster
///
/// Levels are written one at a time:
///
///     BeginLevel(dims) -> WriteTile(tile)* -> EndLevel()
///
/// Tiles are aligned to the sink's tile grid and arrive in row-major order.
/// Edge tiles are clipped to the level bounds. A level that cannot be
/// completed is discarded with AbortLevel(); levels ended before it stay
/// valid.
class PyramidSink {
 public:
  virtual ~PyramidSink() = default;

  /// @brief Edge length of the square tile grid the sink expects
  [[nodiscard]] virtual uint32_t tile_size() const = 0;

  /// @brief Number of levels successfully ended so far
  [[nodiscard]] virtual int completed_levels() const = 0;

  /// @brief Start a new level of the given size
  virtual absl::Status BeginLevel(const Dimensions& dimensions) = 0;

  /// @brief Write one tile of the open level at its own origin
  virtual absl::Status WriteTile(const Tile& tile) = 0;

  /// @brief Finish the open level
  virtual absl::Status EndLevel() = 0;

  /// @brief Discard the open level; no-op when no level is open
  virtual void AbortLevel() = 0;
};

}  // namespace io

using io::PyramidSink;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_PYRAMID_SINK_H_
