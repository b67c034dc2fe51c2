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

#include "slidemask/mask/mask_rasterizer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "slidemask/io/memory_pyramid.h"
#include "slidemask/status/errors.h"

namespace slidemask {
namespace mask {
namespace {

/// Memory sink that fails the n-th tile write of a given level
class FailingSink : public PyramidSink {
 public:
  FailingSink(uint32_t tile_size, int fail_level, int fail_tile)
      : inner_(core::kMaskChannels, tile_size),
        fail_level_(fail_level),
        fail_tile_(fail_tile) {}

  uint32_t tile_size() const override { return inner_.tile_size(); }
  int completed_levels() const override { return inner_.completed_levels(); }

  absl::Status BeginLevel(const Dimensions& dimensions) override {
    tiles_in_level_ = 0;
    return inner_.BeginLevel(dimensions);
  }

  absl::Status WriteTile(const Tile& tile) override {
    if (inner_.completed_levels() == fail_level_ &&
        tiles_in_level_++ == fail_tile_) {
      return absl::UnavailableError("disk full");
    }
    return inner_.WriteTile(tile);
  }

  absl::Status EndLevel() override { return inner_.EndLevel(); }
  void AbortLevel() override { inner_.AbortLevel(); }

  const MemoryPyramidSink& inner() const { return inner_; }

 private:
  MemoryPyramidSink inner_;
  int fail_level_;
  int fail_tile_;
  int tiles_in_level_ = 0;
};

/// Sink that raises a cancel flag once its first level is complete
class CancellingSink : public PyramidSink {
 public:
  CancellingSink(uint32_t tile_size, std::atomic<bool>* cancel)
      : inner_(core::kMaskChannels, tile_size), cancel_(cancel) {}

  uint32_t tile_size() const override { return inner_.tile_size(); }
  int completed_levels() const override { return inner_.completed_levels(); }
  absl::Status BeginLevel(const Dimensions& dimensions) override {
    return inner_.BeginLevel(dimensions);
  }
  absl::Status WriteTile(const Tile& tile) override {
    return inner_.WriteTile(tile);
  }
  absl::Status EndLevel() override {
    cancel_->store(true);
    return inner_.EndLevel();
  }
  void AbortLevel() override { inner_.AbortLevel(); }

 private:
  MemoryPyramidSink inner_;
  std::atomic<bool>* cancel_;
};

PyramidDescriptor ThreeLevels() {
  return *PyramidDescriptor::FromDimensions(
      {{100, 80}, {50, 40}, {25, 20}});
}

Geometry CentralSquare() {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{
      .exterior = {{20, 20}, {60, 20}, {60, 60}, {20, 60}, {20, 20}}});
  return geometry;
}

TEST(MaskRasterizerTest, LevelDimensionsMatchDescriptor) {
  const PyramidDescriptor desc = ThreeLevels();
  MemoryPyramidSink sink(core::kMaskChannels, 32);

  auto report = MaskRasterizer().BuildPyramid(CentralSquare(), desc, sink);
  ASSERT_TRUE(report.ok()) << report.status();
  ASSERT_EQ(report->levels_built, 3);
  ASSERT_EQ(sink.completed_levels(), 3);
  for (int level = 0; level < 3; ++level) {
    EXPECT_EQ(sink.levels()[level].dimensions, desc.dimensions(level));
  }
  EXPECT_EQ(report->tissue_pixels_level0, 40u * 40u);

  // Level 1 is rasterized from the geometry scaled by one half
  const auto& level1 = sink.levels()[1].pixels;
  EXPECT_EQ(std::count(level1.begin(), level1.end(), core::kTissue), 400);
}

TEST(MaskRasterizerTest, StopsAtSingleTileLevel) {
  MemoryPyramidSink sink(core::kMaskChannels, 64);
  auto report =
      MaskRasterizer().BuildPyramid(CentralSquare(), ThreeLevels(), sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->levels_built, 2);
  EXPECT_EQ(sink.levels().back().dimensions, (Dimensions{50, 40}));
}

TEST(MaskRasterizerTest, HonoursMaxLevels) {
  MemoryPyramidSink sink(core::kMaskChannels, 16);
  auto report = MaskRasterizer(MaskPyramidOptions{.max_levels = 1})
                    .BuildPyramid(CentralSquare(), ThreeLevels(), sink);
  ASSERT_TRUE(report.ok());
  EXPECT_EQ(report->levels_built, 1);
  EXPECT_EQ(report->tiles_written, 7u * 5u);
}

TEST(MaskRasterizerTest, EmptyGeometryGivesBackgroundLevels) {
  MemoryPyramidSink sink(core::kMaskChannels, 32);
  auto report = MaskRasterizer().BuildPyramid(Geometry{}, ThreeLevels(), sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->levels_built, 3);
  for (const auto& level : sink.levels()) {
    EXPECT_TRUE(std::all_of(level.pixels.begin(), level.pixels.end(),
                            [](uint8_t v) { return v == core::kBackground; }));
  }
}

TEST(MaskRasterizerTest, WriteFailureAbortsLevelAndKeepsCompleted) {
  FailingSink sink(32, /*fail_level=*/1, /*fail_tile=*/1);
  auto report =
      MaskRasterizer().BuildPyramid(CentralSquare(), ThreeLevels(), sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kTileIOError));
  EXPECT_NE(report.status().message().find("Mask level 1"),
            std::string::npos);
  EXPECT_EQ(sink.completed_levels(), 1);
  EXPECT_EQ(sink.inner().aborted_levels(), 1);
}

TEST(MaskRasterizerTest, CancellationStopsBetweenLevels) {
  std::atomic<bool> cancel{false};
  CancellingSink sink(32, &cancel);
  auto report = MaskRasterizer(MaskPyramidOptions{.cancel = &cancel})
                    .BuildPyramid(CentralSquare(), ThreeLevels(), sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_TRUE(report->cancelled);
  EXPECT_EQ(report->levels_built, 1);
  EXPECT_EQ(sink.completed_levels(), 1);
}

TEST(MaskRasterizerTest, CancelledBeforeStartBuildsNothing) {
  std::atomic<bool> cancel{true};
  MemoryPyramidSink sink(core::kMaskChannels, 32);
  auto report = MaskRasterizer(MaskPyramidOptions{.cancel = &cancel})
                    .BuildPyramid(CentralSquare(), ThreeLevels(), sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_TRUE(report->cancelled);
  EXPECT_EQ(report->levels_built, 0);
  EXPECT_EQ(sink.completed_levels(), 0);
}

}  // namespace
}  // namespace mask
}  // namespace slidemask
