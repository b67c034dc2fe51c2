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

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>
#include <vector>

#include "slidemask/status/errors.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace mask {

namespace {

constexpr uint32_t kDefaultBandHeight = 256;

/// @brief First pixel index whose centre is at or right of `x`
int64_t FirstPixelAtOrAfter(double x, int64_t lo, int64_t hi) {
  const double clamped = std::clamp(x - 0.5, static_cast<double>(lo),
                                    static_cast<double>(hi));
  return static_cast<int64_t>(std::ceil(clamped));
}

}  // namespace

ScanlineRasterizer::ScanlineRasterizer(const Geometry& geometry, double scale,
                                       const Dimensions& level,
                                       uint32_t band_height)
    : level_(level),
      band_height_(band_height == 0 ? kDefaultBandHeight : band_height) {
  const uint32_t band_count =
      level_.height == 0 ? 0 : (level_.height - 1) / band_height_ + 1;
  bands_.resize(band_count);

  auto add_ring = [&](const Ring& ring) {
    const size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
      const Point& a = ring[i];
      const Point& b = ring[(i + 1) % n];
      const double ay = a.y * scale;
      const double by = b.y * scale;
      if (ay == by) {
        continue;  // Horizontal edges never cross a scanline
      }
      Edge edge = ay < by ? Edge{a.x * scale, ay, b.x * scale, by, +1}
                          : Edge{b.x * scale, by, a.x * scale, ay, -1};

      // Rows whose centre r + 0.5 lies in [y0, y1)
      const double first = std::ceil(edge.y0 - 0.5);
      const double last = std::ceil(edge.y1 - 0.5) - 1.0;
      if (last < 0.0 || first > static_cast<double>(level_.height) - 1.0 ||
          last < first) {
        continue;
      }
      const auto row_begin = static_cast<uint32_t>(std::max(first, 0.0));
      const auto row_end = static_cast<uint32_t>(
          std::min(last, static_cast<double>(level_.height) - 1.0));

      const size_t index = edges_.size();
      edges_.push_back(edge);
      for (uint32_t band = row_begin / band_height_;
           band <= row_end / band_height_; ++band) {
        bands_[band].push_back(index);
      }
    }
  };

  for (const auto& polygon : geometry.polygons) {
    add_ring(polygon.exterior);
    for (const auto& hole : polygon.holes) {
      add_ring(hole);
    }
  }
}

const std::vector<std::vector<Crossing>>& ScanlineRasterizer::BandCrossings(
    uint32_t band) {
  if (cached_band_ == static_cast<int64_t>(band)) {
    return cached_rows_;
  }

  const uint32_t row_begin = band * band_height_;
  const uint32_t rows = std::min(band_height_, level_.height - row_begin);
  cached_rows_.assign(rows, {});

  for (uint32_t r = 0; r < rows; ++r) {
    const double yc = static_cast<double>(row_begin + r) + 0.5;
    auto& crossings = cached_rows_[r];
    for (size_t index : bands_[band]) {
      const Edge& e = edges_[index];
      if (yc < e.y0 || yc >= e.y1) {
        continue;
      }
      const double t = (yc - e.y0) / (e.y1 - e.y0);
      crossings.push_back(
          Crossing{.x = e.x0 + t * (e.x1 - e.x0), .winding = e.winding});
    }
    std::sort(crossings.begin(), crossings.end(),
              [](const Crossing& a, const Crossing& b) { return a.x < b.x; });
  }

  cached_band_ = band;
  return cached_rows_;
}

absl::StatusOr<Tile> ScanlineRasterizer::RasterizeWindow(
    const PixelRect& window) {
  if (window.IsEmpty() || !window.FitsWithin(level_)) {
    return MAKE_ERROR(
        ErrorKind::kRasterizationError,
        slidemask::fmt::format(
            "Mask window ({}, {}) {}x{} does not fit level of size {}x{}",
            window.x, window.y, window.width, window.height, level_.width,
            level_.height));
  }

  Tile tile(window, core::kMaskChannels);

  const int64_t win_begin = window.x;
  const int64_t win_end = static_cast<int64_t>(window.x) + window.width;

  for (uint32_t row = 0; row < window.height; ++row) {
    const uint32_t y = window.y + row;
    const uint32_t band = y / band_height_;
    const auto& crossings = BandCrossings(band)[y - band * band_height_];

    uint8_t* out = tile.PixelAt(0, row);
    int winding = 0;
    for (size_t i = 0; i + 1 < crossings.size(); ++i) {
      winding += crossings[i].winding;
      if (winding == 0) {
        continue;
      }
      const int64_t begin = std::max(
          win_begin, FirstPixelAtOrAfter(crossings[i].x, win_begin, win_end));
      const int64_t end = std::min(
          win_end, FirstPixelAtOrAfter(crossings[i + 1].x, win_begin, win_end));
      if (begin < end) {
        std::memset(out + (begin - win_begin), core::kTissue,
                    static_cast<size_t>(end - begin));
      }
    }
  }

  return tile;
}

absl::StatusOr<Tile> Rasterize(const Geometry& geometry,
                               const Dimensions& level_dimensions,
                               double level_scale, const PixelRect& window) {
  ScanlineRasterizer rasterizer(geometry, level_scale, level_dimensions,
                                kDefaultBandHeight);
  return rasterizer.RasterizeWindow(window);
}

}  // namespace mask
}  // namespace slidemask
