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

#include "slidemask/pipeline/tile_compositor.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "slidemask/io/memory_pyramid.h"
#include "slidemask/pipeline/level_aligner.h"
#include "slidemask/status/errors.h"

namespace slidemask {
namespace pipeline {
namespace {

MemoryLevel RgbLevel(uint32_t width, uint32_t height) {
  MemoryLevel level{.dimensions = {width, height},
                    .pixels = std::vector<uint8_t>(width * height * 3)};
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      uint8_t* px = &level.pixels[(y * width + x) * 3];
      px[0] = static_cast<uint8_t>(x);
      px[1] = static_cast<uint8_t>(y);
      px[2] = static_cast<uint8_t>(x ^ y);
    }
  }
  return level;
}

/// Mask level whose left `tissue_columns` columns are tissue
MemoryLevel MaskLevel(uint32_t width, uint32_t height,
                      uint32_t tissue_columns) {
  MemoryLevel level{.dimensions = {width, height},
                    .pixels = std::vector<uint8_t>(width * height, 0)};
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < tissue_columns && x < width; ++x) {
      level.pixels[y * width + x] = core::kTissue;
    }
  }
  return level;
}

/// Source that fails reads of one level after a number of successes
class FlakySource : public PyramidSource {
 public:
  FlakySource(std::unique_ptr<MemoryPyramidSource> inner, int fail_level,
              int fail_after)
      : inner_(std::move(inner)),
        fail_level_(fail_level),
        fail_after_(fail_after) {}

  const PyramidDescriptor& descriptor() const override {
    return inner_->descriptor();
  }
  uint32_t channels() const override { return inner_->channels(); }
  Dimensions tile_size() const override { return inner_->tile_size(); }

  absl::StatusOr<Tile> ReadRegion(int level,
                                  const PixelRect& region) override {
    if (level == fail_level_ && reads_++ >= fail_after_) {
      return absl::DataLossError("corrupt tile");
    }
    return inner_->ReadRegion(level, region);
  }

 private:
  std::unique_ptr<MemoryPyramidSource> inner_;
  int fail_level_;
  int fail_after_;
  int reads_ = 0;
};

/// Sink that fails the Nth tile write, or the end, of one level
class FailingSink : public PyramidSink {
 public:
  FailingSink(int fail_level, int fail_tile, bool fail_end = false)
      : inner_(core::kRGBAChannels, 16),
        fail_level_(fail_level),
        fail_tile_(fail_tile),
        fail_end_(fail_end) {}

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

  absl::Status EndLevel() override {
    if (fail_end_ && inner_.completed_levels() == fail_level_) {
      return absl::InternalError("directory write failed");
    }
    return inner_.EndLevel();
  }

  void AbortLevel() override { inner_.AbortLevel(); }

  const MemoryPyramidSink& inner() const { return inner_; }

 private:
  MemoryPyramidSink inner_;
  int fail_level_;
  int fail_tile_;
  bool fail_end_;
  int tiles_in_level_ = 0;
};

class TileCompositorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto image = MemoryPyramidSource::Create(
        {RgbLevel(40, 24), RgbLevel(20, 12)}, core::kRGBChannels);
    ASSERT_TRUE(image.ok()) << image.status();
    image_ = *std::move(image);
  }

  std::unique_ptr<MemoryPyramidSource> Mask(uint32_t tissue_columns) {
    auto mask = MemoryPyramidSource::Create(
        {MaskLevel(40, 24, tissue_columns),
         MaskLevel(20, 12, tissue_columns / 2)},
        core::kMaskChannels);
    EXPECT_TRUE(mask.ok()) << mask.status();
    return mask.ok() ? *std::move(mask) : nullptr;
  }

  std::vector<LevelPlan> Plans(const PyramidSource& mask) const {
    return *AlignLevels(image_->descriptor(), mask.descriptor());
  }

  std::unique_ptr<MemoryPyramidSource> image_;
};

TEST_F(TileCompositorTest, FullTissueReproducesRgb) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report = TileCompositor().Compose(*image_, *mask, Plans(*mask), {0, 1},
                                         sink);
  ASSERT_TRUE(report.ok()) << report.status();
  ASSERT_EQ(sink.completed_levels(), 2);
  EXPECT_EQ(report->levels.size(), 2u);
  EXPECT_EQ(report->total_tiles(), 3u * 2u + 2u * 1u);

  const MemoryLevel& out = sink.levels()[0];
  const MemoryLevel source = RgbLevel(40, 24);
  for (size_t i = 0; i < out.dimensions.Area(); ++i) {
    EXPECT_EQ(out.pixels[i * 4 + 0], source.pixels[i * 3 + 0]);
    EXPECT_EQ(out.pixels[i * 4 + 1], source.pixels[i * 3 + 1]);
    EXPECT_EQ(out.pixels[i * 4 + 2], source.pixels[i * 3 + 2]);
    EXPECT_EQ(out.pixels[i * 4 + 3], core::kTissue);
  }
}

TEST_F(TileCompositorTest, AlphaIsBinaryAndFollowsMask) {
  auto mask = Mask(10);
  ASSERT_NE(mask, nullptr);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report =
      TileCompositor().Compose(*image_, *mask, Plans(*mask), {0}, sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->levels[0].tissue_pixels, 10u * 24u);

  const MemoryLevel& out = sink.levels()[0];
  for (uint32_t y = 0; y < 24; ++y) {
    for (uint32_t x = 0; x < 40; ++x) {
      const uint8_t alpha = out.pixels[(y * 40 + x) * 4 + 3];
      EXPECT_EQ(alpha, x < 10 ? core::kTissue : core::kBackground);
    }
  }
}

TEST_F(TileCompositorTest, CompositingIsIdempotent) {
  auto mask = Mask(17);
  ASSERT_NE(mask, nullptr);
  const auto plans = Plans(*mask);

  MemoryPyramidSink first(core::kRGBAChannels, 16);
  MemoryPyramidSink second(core::kRGBAChannels, 16);
  ASSERT_TRUE(
      TileCompositor().Compose(*image_, *mask, plans, {0, 1}, first).ok());
  ASSERT_TRUE(
      TileCompositor().Compose(*image_, *mask, plans, {0, 1}, second).ok());
  ASSERT_EQ(first.levels().size(), second.levels().size());
  for (size_t i = 0; i < first.levels().size(); ++i) {
    EXPECT_EQ(first.levels()[i].pixels, second.levels()[i].pixels);
  }
}

TEST_F(TileCompositorTest, ScaleCorrectedMaskLookup) {
  // Mask at half the image resolution: image = mask * 2
  auto mask = MemoryPyramidSource::Create({MaskLevel(20, 12, 5)},
                                          core::kMaskChannels);
  ASSERT_TRUE(mask.ok());
  std::vector<LevelPlan> plans = {LevelPlan{.level_index = 0,
                                            .image_dimensions = {40, 24},
                                            .mask_dimensions = {20, 12},
                                            .scale_factor = 2.0}};
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report = TileCompositor().Compose(*image_, **mask, plans, {0}, sink);
  ASSERT_TRUE(report.ok()) << report.status();
  const MemoryLevel& out = sink.levels()[0];
  EXPECT_EQ(out.pixels[(0 * 40 + 9) * 4 + 3], core::kTissue);
  EXPECT_EQ(out.pixels[(0 * 40 + 10) * 4 + 3], core::kBackground);
  EXPECT_EQ(out.pixels[(23 * 40 + 0) * 4 + 3], core::kTissue);
}

TEST_F(TileCompositorTest, MaskOutsideLevelIsBackground) {
  // Mask smaller than the image level
  auto mask = MemoryPyramidSource::Create({MaskLevel(16, 16, 16)},
                                          core::kMaskChannels);
  ASSERT_TRUE(mask.ok());
  std::vector<LevelPlan> plans = {LevelPlan{.level_index = 0,
                                            .image_dimensions = {40, 24},
                                            .mask_dimensions = {16, 16},
                                            .scale_factor = 1.0}};
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report = TileCompositor().Compose(*image_, **mask, plans, {0}, sink);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->levels[0].tissue_pixels, 16u * 16u);
}

TEST_F(TileCompositorTest, ReadFailureAbortsLevel) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  const auto plans = Plans(*mask);
  FlakySource flaky(std::move(mask), /*fail_level=*/1, /*fail_after=*/1);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report = TileCompositor().Compose(*image_, flaky, plans, {0, 1}, sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kTileIOError));
  const std::string message(report.status().message());
  EXPECT_NE(message.find("tile (16, 0) of level 1"), std::string::npos)
      << message;
  EXPECT_EQ(sink.completed_levels(), 1);
  EXPECT_EQ(sink.aborted_levels(), 1);
}

TEST_F(TileCompositorTest, ImageReadFailureAbortsLevel) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  const auto plans = Plans(*mask);
  auto image = MemoryPyramidSource::Create(
      {RgbLevel(40, 24), RgbLevel(20, 12)}, core::kRGBChannels);
  ASSERT_TRUE(image.ok());
  FlakySource flaky(*std::move(image), /*fail_level=*/0, /*fail_after=*/2);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report = TileCompositor().Compose(flaky, *mask, plans, {0, 1}, sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kTileIOError));
  const std::string message(report.status().message());
  EXPECT_NE(message.find("Failed to read image tile (32, 0) of level 0"),
            std::string::npos)
      << message;
  EXPECT_EQ(sink.completed_levels(), 0);
  EXPECT_EQ(sink.aborted_levels(), 1);
}

TEST_F(TileCompositorTest, WriteFailureAbortsLevel) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  FailingSink sink(/*fail_level=*/1, /*fail_tile=*/1);

  auto report =
      TileCompositor().Compose(*image_, *mask, Plans(*mask), {0, 1}, sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kTileIOError));
  const std::string message(report.status().message());
  EXPECT_NE(message.find("Failed to write tile (16, 0) of level 1"),
            std::string::npos)
      << message;
  EXPECT_EQ(sink.completed_levels(), 1);
  EXPECT_EQ(sink.inner().aborted_levels(), 1);
}

TEST_F(TileCompositorTest, EndLevelFailureIsTileIOError) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  FailingSink sink(/*fail_level=*/0, /*fail_tile=*/-1, /*fail_end=*/true);

  auto report =
      TileCompositor().Compose(*image_, *mask, Plans(*mask), {0, 1}, sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kTileIOError));
  const std::string message(report.status().message());
  EXPECT_NE(message.find("Failed to end output level 0"), std::string::npos)
      << message;
  EXPECT_EQ(sink.completed_levels(), 0);
  EXPECT_EQ(sink.inner().aborted_levels(), 1);
}

TEST_F(TileCompositorTest, CancellationStopsBetweenLevels) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  std::atomic<bool> cancel{true};
  auto report = TileCompositor().Compose(*image_, *mask, Plans(*mask), {0, 1},
                                         sink, &cancel);
  ASSERT_TRUE(report.ok());
  EXPECT_TRUE(report->cancelled);
  EXPECT_TRUE(report->levels.empty());
  EXPECT_EQ(sink.completed_levels(), 0);
}

TEST_F(TileCompositorTest, RejectsUnplannedLevels) {
  auto mask = Mask(40);
  ASSERT_NE(mask, nullptr);
  MemoryPyramidSink sink(core::kRGBAChannels, 16);

  auto report =
      TileCompositor().Compose(*image_, *mask, Plans(*mask), {2}, sink);
  ASSERT_FALSE(report.ok());
  EXPECT_TRUE(IsErrorKind(report.status(), ErrorKind::kInvalidLevelSpec));
}

TEST(MaskWindowTest, ClipsToMaskLevel) {
  auto window = TileCompositor::MaskWindowFor(PixelRect{32, 0, 16, 16}, 2.0,
                                              Dimensions{20, 20});
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(*window, (PixelRect{16, 0, 4, 8}));

  EXPECT_FALSE(TileCompositor::MaskWindowFor(PixelRect{64, 0, 16, 16}, 2.0,
                                             Dimensions{20, 20})
                   .has_value());
}

}  // namespace
}  // namespace pipeline
}  // namespace slidemask
