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

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include "absl/log/log.h"
#include "slidemask/core/tile_grid.h"
#include "slidemask/status/errors.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace pipeline {

namespace {

/// @brief Nearest mask sample for an image pixel index
int64_t MaskCoordinate(uint32_t image_coordinate, double scale_factor) {
  return static_cast<int64_t>(
      std::floor((static_cast<double>(image_coordinate) + 0.5) / scale_factor));
}

absl::Status TileFailure(PyramidSink& sink, const absl::Status& cause,
                         std::string_view action, int level,
                         const PixelRect& window) {
  sink.AbortLevel();
  const std::string message = slidemask::fmt::format(
      "Failed to {} tile ({}, {}) of level {}", action, window.x, window.y,
      level);
  LOG(ERROR) << message << ": " << status::StripStackTrace(cause.message());
  return WithErrorKind(
      status::AddTrace(cause, __func__, __FILE__, __LINE__, message),
      ErrorKind::kTileIOError);
}

absl::Status LevelFailure(PyramidSink& sink, const absl::Status& cause,
                          std::string_view action, int level) {
  sink.AbortLevel();
  const std::string message =
      slidemask::fmt::format("Failed to {} output level {}", action, level);
  LOG(ERROR) << message << ": " << status::StripStackTrace(cause.message());
  return WithErrorKind(
      status::AddTrace(cause, __func__, __FILE__, __LINE__, message),
      ErrorKind::kTileIOError);
}

const LevelPlan* FindPlan(const std::vector<LevelPlan>& plans, int level) {
  auto it = std::find_if(
      plans.begin(), plans.end(),
      [level](const LevelPlan& plan) { return plan.level_index == level; });
  return it == plans.end() ? nullptr : &*it;
}

}  // namespace

uint64_t CompositeReport::total_tiles() const {
  uint64_t total = 0;
  for (const auto& level : levels) {
    total += level.tiles;
  }
  return total;
}

std::optional<PixelRect> TileCompositor::MaskWindowFor(
    const PixelRect& image_window, double scale_factor,
    const Dimensions& mask_level) {
  if (image_window.IsEmpty()) {
    return std::nullopt;
  }
  const int64_t x0 = MaskCoordinate(image_window.x, scale_factor);
  const int64_t y0 = MaskCoordinate(image_window.y, scale_factor);
  const int64_t x1 = std::min<int64_t>(
      MaskCoordinate(image_window.x + image_window.width - 1, scale_factor) +
          1,
      mask_level.width);
  const int64_t y1 = std::min<int64_t>(
      MaskCoordinate(image_window.y + image_window.height - 1, scale_factor) +
          1,
      mask_level.height);
  if (x0 >= x1 || y0 >= y1) {
    return std::nullopt;
  }
  return PixelRect{.x = static_cast<uint32_t>(x0),
                   .y = static_cast<uint32_t>(y0),
                   .width = static_cast<uint32_t>(x1 - x0),
                   .height = static_cast<uint32_t>(y1 - y0)};
}

Tile TileCompositor::CompositeTile(const Tile& image_tile,
                                   const Tile* mask_tile,
                                   double scale_factor) const {
  Tile output(image_tile.rect(), core::kRGBAChannels);
  const uint32_t channels = image_tile.channels();

  for (uint32_t row = 0; row < image_tile.height(); ++row) {
    const int64_t my = MaskCoordinate(image_tile.y() + row, scale_factor);
    const bool row_in_mask = mask_tile != nullptr && my >= mask_tile->y() &&
                             my < static_cast<int64_t>(mask_tile->y()) +
                                      mask_tile->height();

    const uint8_t* src = image_tile.PixelAt(0, row);
    uint8_t* dst = output.PixelAt(0, row);
    for (uint32_t col = 0; col < image_tile.width(); ++col) {
      if (channels >= core::kRGBChannels) {
        dst[0] = src[0];
        dst[1] = src[1];
        dst[2] = src[2];
      } else {
        dst[0] = dst[1] = dst[2] = src[0];
      }

      uint8_t value = core::kBackground;
      if (row_in_mask) {
        const int64_t mx = MaskCoordinate(image_tile.x() + col, scale_factor);
        if (mx >= mask_tile->x() &&
            mx < static_cast<int64_t>(mask_tile->x()) + mask_tile->width()) {
          value = *mask_tile->PixelAt(
              static_cast<uint32_t>(mx - mask_tile->x()),
              static_cast<uint32_t>(my - mask_tile->y()));
        }
      }
      dst[3] = value > options_.mask_threshold ? core::kTissue
                                               : core::kBackground;

      src += channels;
      dst += core::kRGBAChannels;
    }
  }
  return output;
}

absl::StatusOr<CompositeReport> TileCompositor::Compose(
    PyramidSource& image, PyramidSource& mask,
    const std::vector<LevelPlan>& plans, const std::vector<int>& levels,
    PyramidSink& sink, const std::atomic<bool>* cancel) const {
  if (mask.channels() != core::kMaskChannels) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Mask pyramid must have 1 channel, has {}",
                               mask.channels()));
  }
  if (image.channels() == 2 || image.channels() > core::kRGBAChannels) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Unsupported image channel count {}",
                               image.channels()));
  }

  std::vector<const LevelPlan*> selected;
  for (size_t i = 0; i < levels.size(); ++i) {
    const LevelPlan* plan = FindPlan(plans, levels[i]);
    if (plan == nullptr || !image.descriptor().HasLevel(levels[i]) ||
        !mask.descriptor().HasLevel(levels[i])) {
      return MAKE_ERROR(
          ErrorKind::kInvalidLevelSpec,
          slidemask::fmt::format("Level {} is not processable", levels[i]));
    }
    if (i > 0 && levels[i] <= levels[i - 1]) {
      return MAKE_ERROR(ErrorKind::kInvalidLevelSpec,
                        "Selected levels must be strictly ascending");
    }
    if (!std::isfinite(plan->scale_factor) || plan->scale_factor <= 0.0) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          slidemask::fmt::format("Level {} has invalid scale factor {}",
                                 levels[i], plan->scale_factor));
    }
    selected.push_back(plan);
  }

  CompositeReport report;
  const Dimensions tile_dims{.width = sink.tile_size(),
                             .height = sink.tile_size()};

  for (const LevelPlan* plan : selected) {
    if (cancel != nullptr && cancel->load()) {
      LOG(WARNING) << "Compositing cancelled before level "
                   << plan->level_index << " after "
                   << report.levels.size() << " level(s)";
      report.cancelled = true;
      break;
    }

    const auto start = std::chrono::steady_clock::now();
    const int level = plan->level_index;
    const Dimensions& dims = image.descriptor().dimensions(level);
    const Dimensions& mask_dims = mask.descriptor().dimensions(level);

    absl::Status begun = sink.BeginLevel(dims);
    if (!begun.ok()) {
      return LevelFailure(sink, begun, "begin", level);
    }

    CompositeLevelReport level_report{.level = level, .dimensions = dims};
    for (const PixelRect& window : TileGrid(dims, tile_dims)) {
      absl::StatusOr<Tile> image_tile = image.ReadRegion(level, window);
      if (!image_tile.ok()) {
        return TileFailure(sink, image_tile.status(), "read image", level,
                           window);
      }
      if (!image_tile->IsConsistent() ||
          image_tile->rect() != window ||
          image_tile->channels() != image.channels()) {
        return TileFailure(
            sink,
            MAKE_STATUS(absl::StatusCode::kDataLoss,
                        "Image tile disagrees with its requested window"),
            "read image", level, window);
      }

      std::optional<Tile> mask_tile;
      const auto mask_window =
          MaskWindowFor(window, plan->scale_factor, mask_dims);
      if (mask_window.has_value()) {
        absl::StatusOr<Tile> read = mask.ReadRegion(level, *mask_window);
        if (!read.ok()) {
          return TileFailure(sink, read.status(), "read mask", level, window);
        }
        if (!read->IsConsistent() || read->rect() != *mask_window) {
          return TileFailure(
              sink,
              MAKE_STATUS(absl::StatusCode::kDataLoss,
                          "Mask tile disagrees with its requested window"),
              "read mask", level, window);
        }
        mask_tile = *std::move(read);
      }

      Tile output = CompositeTile(
          *image_tile, mask_tile.has_value() ? &*mask_tile : nullptr,
          plan->scale_factor);
      for (uint32_t row = 0; row < output.height(); ++row) {
        const uint8_t* px = output.PixelAt(0, row);
        for (uint32_t col = 0; col < output.width(); ++col) {
          level_report.tissue_pixels +=
              px[col * core::kRGBAChannels + 3] == core::kTissue;
        }
      }

      absl::Status written = sink.WriteTile(output);
      if (!written.ok()) {
        return TileFailure(sink, written, "write", level, window);
      }
      ++level_report.tiles;
    }

    absl::Status ended = sink.EndLevel();
    if (!ended.ok()) {
      return LevelFailure(sink, ended, "end", level);
    }

    level_report.seconds = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    LOG(INFO) << "Composited level " << level << ": " << dims << ", "
              << level_report.tiles << " tiles, "
              << level_report.tissue_pixels << " tissue pixels in "
              << level_report.seconds << "s";
    report.levels.push_back(level_report);
  }

  return report;
}

}  // namespace pipeline
}  // namespace slidemask
