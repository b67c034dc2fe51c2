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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_LEVEL_PLAN_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_LEVEL_PLAN_H_

#include <ostream>

#include "slidemask/core/types.h"

namespace slidemask {
namespace core {

/// @brief Pairing of one image level with the mask level of the same index
struct LevelPlan {
  int level_index = 0;         ///< Index shared by image and mask level
  Dimensions image_dimensions;  ///< Size of the image level in pixels
  Dimensions mask_dimensions;   ///< Size of the mask level in pixels
  /// Mask-to-image coordinate scale: image = mask * scale_factor
  double scale_factor = 1.0;

  friend std::ostream& operator<<(std::ostream& os, const LevelPlan& plan) {
    return os << "level " << plan.level_index << " image "
              << plan.image_dimensions << " mask " << plan.mask_dimensions
              << " scale " << plan.scale_factor;
  }
};

}  // namespace core

using core::LevelPlan;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_LEVEL_PLAN_H_
