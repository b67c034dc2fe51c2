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

#include "slidemask/pipeline/level_aligner.h"

#include <algorithm>
#include <vector>

#include "absl/log/log.h"
#include "slidemask/status/errors.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace pipeline {

int MaxProcessableLevels(const PyramidDescriptor& image,
                         const PyramidDescriptor& mask) {
  return std::min(image.level_count(), mask.level_count());
}

absl::StatusOr<std::vector<LevelPlan>> AlignLevels(
    const PyramidDescriptor& image, const PyramidDescriptor& mask) {
  const int usable = MaxProcessableLevels(image, mask);
  if (usable <= 0) {
    return MAKE_ERROR(
        ErrorKind::kNoUsableLevels,
        slidemask::fmt::format("Image has {} level(s) and mask has {}; no "
                               "level is present in both",
                               image.level_count(), mask.level_count()));
  }

  if (image.level_count() != mask.level_count()) {
    LOG(WARNING) << "Image pyramid has " << image.level_count()
                 << " levels but mask pyramid has " << mask.level_count()
                 << "; only levels 0-" << usable - 1 << " can be processed";
  }

  std::vector<LevelPlan> plans;
  plans.reserve(static_cast<size_t>(usable));
  for (int level = 0; level < usable; ++level) {
    plans.push_back(LevelPlan{
        .level_index = level,
        .image_dimensions = image.dimensions(level),
        .mask_dimensions = mask.dimensions(level),
        .scale_factor = mask.downsample(level) / image.downsample(level)});
  }
  return plans;
}

}  // namespace pipeline
}  // namespace slidemask
