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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_ALIGNER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_ALIGNER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/core/level_plan.h"
#include "slidemask/core/pyramid_descriptor.h"

namespace slidemask {
namespace pipeline {

/// @brief Number of levels present in both pyramids
[[nodiscard]] int MaxProcessableLevels(const PyramidDescriptor& image,
                                       const PyramidDescriptor& mask);

/// @brief Pair the levels of an image pyramid with those of its mask
///
/// Levels [0, min(N_image, N_mask)) are usable. For every usable level the
/// plan records both level sizes and the mask-to-image coordinate scale
/// downsample_mask / downsample_image. A warning is logged when the level
/// counts differ.
///
/// @return Plans in ascending level order, or NoUsableLevels
absl::StatusOr<std::vector<LevelPlan>> AlignLevels(
    const PyramidDescriptor& image, const PyramidDescriptor& mask);

}  // namespace pipeline

using pipeline::AlignLevels;
using pipeline::MaxProcessableLevels;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_ALIGNER_H_
