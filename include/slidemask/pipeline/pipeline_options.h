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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_PIPELINE_OPTIONS_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_PIPELINE_OPTIONS_H_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "slidemask/io/tiff_file.h"

namespace slidemask {
namespace pipeline {

/// @brief Configuration of a tissue extraction run
struct PipelineOptions {
  std::filesystem::path input_path;        ///< Whole-slide image (TIFF/SVS)
  std::filesystem::path annotations_path;  ///< GeoJSON tissue annotations
  std::filesystem::path output_path;       ///< Pyramidal RGBA BigTIFF

  /// Parent of the scratch directory; system temp directory when empty
  std::filesystem::path temp_dir;
  bool keep_intermediates = false;

  TiffCompression compression = TiffCompression::LZW;
  uint32_t tile_size = 512;     ///< Output and mask tile edge
  uint8_t mask_threshold = 128;  ///< Mask samples above this are tissue
  int max_mask_levels = 0;      ///< 0 builds every level

  /// Level selection; prompt interactively when unset
  std::optional<std::string> levels;

  /// Continue with an all-background mask when no polygon survives
  bool allow_empty_geometry = true;

  /// @brief Check the option values, not the files they name
  absl::Status Validate() const;
};

}  // namespace pipeline

using pipeline::PipelineOptions;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_PIPELINE_OPTIONS_H_
