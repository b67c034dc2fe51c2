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

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "slidemask/status/errors.h"

namespace slidemask {
namespace pipeline {
namespace {

PyramidDescriptor HalvingPyramid(uint32_t width, uint32_t height, int levels) {
  std::vector<Dimensions> dims;
  for (int i = 0; i < levels; ++i) {
    dims.push_back(Dimensions{width >> i, height >> i});
  }
  return *PyramidDescriptor::FromDimensions(dims);
}

TEST(LevelAlignerTest, UsesCommonLevelRange) {
  const auto image = HalvingPyramid(1 << 14, 1 << 13, 11);
  const auto mask = HalvingPyramid(1 << 14, 1 << 13, 9);
  EXPECT_EQ(MaxProcessableLevels(image, mask), 9);

  auto plans = AlignLevels(image, mask);
  ASSERT_TRUE(plans.ok()) << plans.status();
  ASSERT_EQ(plans->size(), 9u);
  for (int level = 0; level < 9; ++level) {
    const LevelPlan& plan = (*plans)[level];
    EXPECT_EQ(plan.level_index, level);
    EXPECT_EQ(plan.image_dimensions, image.dimensions(level));
    EXPECT_EQ(plan.mask_dimensions, mask.dimensions(level));
    EXPECT_DOUBLE_EQ(plan.scale_factor, 1.0);
  }
}

TEST(LevelAlignerTest, RecordsScaleFactor) {
  auto image = PyramidDescriptor::Create(
      {LevelInfo{{1000, 1000}, 1.0}, LevelInfo{{500, 500}, 2.0}});
  auto mask = PyramidDescriptor::Create(
      {LevelInfo{{1000, 1000}, 1.0}, LevelInfo{{250, 250}, 4.0}});
  ASSERT_TRUE(image.ok() && mask.ok());

  auto plans = AlignLevels(*image, *mask);
  ASSERT_TRUE(plans.ok());
  ASSERT_EQ(plans->size(), 2u);
  EXPECT_DOUBLE_EQ((*plans)[0].scale_factor, 1.0);
  EXPECT_DOUBLE_EQ((*plans)[1].scale_factor, 2.0);
}

TEST(LevelAlignerTest, SameLevelCounts) {
  const auto image = HalvingPyramid(4096, 4096, 4);
  auto plans = AlignLevels(image, image);
  ASSERT_TRUE(plans.ok());
  EXPECT_EQ(plans->size(), 4u);
}

}  // namespace
}  // namespace pipeline
}  // namespace slidemask
