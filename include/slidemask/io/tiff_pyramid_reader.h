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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_READER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_READER_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/core/pyramid_descriptor.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"
#include "slidemask/io/pyramid_source.h"
#include "slidemask/io/tiff_file.h"

/**
 * @file tiff_pyramid_reader.h
 * @brief PyramidSource over tiled pyramidal TIFF files
 *
 * Handles generic tiled pyramidal TIFF/BigTIFF and Aperio SVS. Every tiled
 * directory is a candidate level; stripped directories (the SVS thumbnail,
 * label and macro images) are skipped. Levels are ordered by area, largest
 * first, and their downsample factors are derived from their dimensions.
 */

namespace slidemask {
namespace io {

/// @brief Reads rectangular windows from the levels of a tiled TIFF pyramid
class TiffPyramidReader : public PyramidSource {
 public:
  /// @brief Open a pyramid and discover its levels
  /// @param filename TIFF, BigTIFF or SVS file
  /// @return Reader, or an UnreadablePyramid error when no usable level exists
  static absl::StatusOr<std::unique_ptr<TiffPyramidReader>> Open(
      const std::filesystem::path& filename);

  [[nodiscard]] const PyramidDescriptor& descriptor() const override {
    return descriptor_;
  }
  [[nodiscard]] uint32_t channels() const override { return channels_; }
  [[nodiscard]] Dimensions tile_size() const override {
    return levels_.front().tile_dims;
  }

  absl::StatusOr<Tile> ReadRegion(int level, const PixelRect& region) override;

  /// @brief TIFF directory backing a level
  [[nodiscard]] uint16_t GetDirectoryForLevel(int level) const {
    return levels_[static_cast<size_t>(level)].directory;
  }

 private:
  struct TiffLevel {
    uint16_t directory = 0;
    Dimensions dimensions;
    Dimensions tile_dims;
    bool is_jpeg = false;
  };

  TiffPyramidReader(TiffFile file, std::vector<TiffLevel> levels,
                    PyramidDescriptor descriptor, uint32_t channels);

  TiffFile file_;
  std::vector<TiffLevel> levels_;
  PyramidDescriptor descriptor_;
  uint32_t channels_;
  std::vector<uint8_t> tile_buffer_;  ///< Decode buffer for one native tile
};

}  // namespace io

using io::TiffPyramidReader;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_READER_H_
