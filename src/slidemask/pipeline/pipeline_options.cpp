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

#include "slidemask/pipeline/pipeline_options.h"

#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace pipeline {

absl::Status PipelineOptions::Validate() const {
  if (input_path.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "An input slide is required");
  }
  if (annotations_path.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "An annotations file is required");
  }
  if (output_path.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "An output path is required");
  }
  if (tile_size == 0 || tile_size % 16 != 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile size {} is not a positive multiple of 16",
                               tile_size));
  }
  if (compression == TiffCompression::JPEG) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "JPEG output is not supported for RGBA tiles");
  }
  if (max_mask_levels < 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Maximum mask levels must be >= 0, got {}",
                               max_mask_levels));
  }
  return absl::OkStatus();
}

}  // namespace pipeline
}  // namespace slidemask
