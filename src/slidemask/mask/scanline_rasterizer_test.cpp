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

#include "slidemask/mask/scanline_rasterizer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

#include "slidemask/status/errors.h"

namespace slidemask {
namespace mask {
namespace {

// Positive signed area, as produced by the normalizer for exteriors
Ring Rectangle(double x0, double y0, double x1, double y1) {
  return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}};
}

Ring Reversed(Ring ring) {
  std::reverse(ring.begin(), ring.end());
  return ring;
}

uint64_t CountTissue(const Tile& tile) {
  const auto pixels = tile.data();
  return static_cast<uint64_t>(
      std::count(pixels.begin(), pixels.end(), core::kTissue));
}

TEST(ScanlineRasterizerTest, FillsPixelCentresInsideRectangle) {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{.exterior = Rectangle(2, 3, 6, 5)});

  auto tile = Rasterize(geometry, Dimensions{10, 10}, 1.0,
                        PixelRect{0, 0, 10, 10});
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_EQ(tile->channels(), core::kMaskChannels);
  EXPECT_EQ(CountTissue(*tile), 8u);
  EXPECT_EQ(*tile->PixelAt(2, 3), core::kTissue);
  EXPECT_EQ(*tile->PixelAt(5, 4), core::kTissue);
  EXPECT_EQ(*tile->PixelAt(6, 4), core::kBackground);
  EXPECT_EQ(*tile->PixelAt(2, 5), core::kBackground);
}

TEST(ScanlineRasterizerTest, ValuesAreBinary) {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{
      .exterior = {{0.3, 0.7}, {17.2, 2.1}, {9.9, 15.4}, {0.3, 0.7}}});

  auto tile = Rasterize(geometry, Dimensions{20, 20}, 1.0,
                        PixelRect{0, 0, 20, 20});
  ASSERT_TRUE(tile.ok());
  for (uint8_t value : tile->data()) {
    EXPECT_TRUE(value == core::kTissue || value == core::kBackground);
  }
  EXPECT_GT(CountTissue(*tile), 0u);
}

TEST(ScanlineRasterizerTest, HolesSubtract) {
  Polygon polygon{.exterior = Rectangle(0, 0, 8, 8)};
  polygon.holes.push_back(Reversed(Rectangle(2, 2, 6, 6)));
  Geometry geometry;
  geometry.polygons.push_back(polygon);

  auto tile =
      Rasterize(geometry, Dimensions{8, 8}, 1.0, PixelRect{0, 0, 8, 8});
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(CountTissue(*tile), 64u - 16u);
  EXPECT_EQ(*tile->PixelAt(3, 3), core::kBackground);
  EXPECT_EQ(*tile->PixelAt(1, 3), core::kTissue);
}

TEST(ScanlineRasterizerTest, OverlappingPolygonsFormUnion) {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{.exterior = Rectangle(0, 0, 6, 4)});
  geometry.polygons.push_back(Polygon{.exterior = Rectangle(4, 0, 10, 4)});

  auto tile =
      Rasterize(geometry, Dimensions{10, 4}, 1.0, PixelRect{0, 0, 10, 4});
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(CountTissue(*tile), 40u);
}

TEST(ScanlineRasterizerTest, ScaleMapsLevelZeroGeometry) {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{.exterior = Rectangle(0, 0, 40, 40)});

  // Downsample 4: the 40x40 square covers 10x10 pixels of a 25x25 level
  auto tile = Rasterize(geometry, Dimensions{25, 25}, 0.25,
                        PixelRect{0, 0, 25, 25});
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(CountTissue(*tile), 100u);
}

TEST(ScanlineRasterizerTest, WindowsMatchFullRaster) {
  Geometry geometry;
  geometry.polygons.push_back(Polygon{
      .exterior = {{3.5, 1.2}, {60.1, 10.4}, {40.0, 70.3}, {3.5, 1.2}}});
  const Dimensions level{64, 72};

  auto full = Rasterize(geometry, level, 1.0, PixelRect{0, 0, 64, 72});
  ASSERT_TRUE(full.ok());

  ScanlineRasterizer rasterizer(geometry, 1.0, level, 16);
  for (const PixelRect window : {PixelRect{0, 0, 16, 16},
                                 PixelRect{16, 16, 16, 16},
                                 PixelRect{48, 64, 16, 8}}) {
    auto tile = rasterizer.RasterizeWindow(window);
    ASSERT_TRUE(tile.ok()) << tile.status();
    for (uint32_t row = 0; row < window.height; ++row) {
      for (uint32_t col = 0; col < window.width; ++col) {
        EXPECT_EQ(*tile->PixelAt(col, row),
                  *full->PixelAt(window.x + col, window.y + row));
      }
    }
  }
}

TEST(ScanlineRasterizerTest, GeometryOutsideLevelIsClipped) {
  Geometry geometry;
  geometry.polygons.push_back(
      Polygon{.exterior = Rectangle(-100, -100, 5, 200)});

  auto tile =
      Rasterize(geometry, Dimensions{10, 10}, 1.0, PixelRect{0, 0, 10, 10});
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(CountTissue(*tile), 50u);
}

TEST(ScanlineRasterizerTest, EmptyGeometryIsBackground) {
  auto tile =
      Rasterize(Geometry{}, Dimensions{16, 16}, 1.0, PixelRect{0, 0, 16, 16});
  ASSERT_TRUE(tile.ok());
  EXPECT_EQ(CountTissue(*tile), 0u);
  EXPECT_EQ(tile->data().size(), 256u);
}

TEST(ScanlineRasterizerTest, RejectsWindowsOutsideLevel) {
  auto tile =
      Rasterize(Geometry{}, Dimensions{16, 16}, 1.0, PixelRect{8, 8, 16, 16});
  ASSERT_FALSE(tile.ok());
  EXPECT_TRUE(IsErrorKind(tile.status(), ErrorKind::kRasterizationError));

  auto empty =
      Rasterize(Geometry{}, Dimensions{16, 16}, 1.0, PixelRect{0, 0, 0, 4});
  EXPECT_TRUE(IsErrorKind(empty.status(), ErrorKind::kRasterizationError));
}

TEST(ScanlineRasterizerTest, WindowOnLevelEdgeIsSizedToWindow) {
  auto tile =
      Rasterize(Geometry{}, Dimensions{16, 12}, 1.0, PixelRect{10, 4, 6, 8});
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_TRUE(tile->IsConsistent());
  EXPECT_EQ(tile->data().size(), 48u);
}

}  // namespace
}  // namespace mask
}  // namespace slidemask
