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

#include "slidemask/io/tiff_pyramid_reader.h"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "slidemask/core/tile_grid.h"
#include "slidemask/status/errors.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

namespace {

/// @brief Tiled directory found while scanning the file
struct TiledDirectory {
  uint16_t page;
  TiffDirectoryInfo info;
  uint64_t area;
};

/// @brief Check that a level can be decoded into interleaved 8-bit pixels
absl::Status ValidateLevelLayout(uint16_t page, const TiffDirectoryInfo& info,
                                 uint16_t expected_samples) {
  if (info.bits_per_sample != 8) {
    return MAKE_ERROR(
        ErrorKind::kUnreadablePyramid,
        slidemask::fmt::format("Directory {} has {} bits per sample, only 8 "
                               "is supported",
                               page, info.bits_per_sample));
  }
  if (info.planar_config != PLANARCONFIG_CONTIG && info.samples_per_pixel > 1) {
    return MAKE_ERROR(
        ErrorKind::kUnreadablePyramid,
        slidemask::fmt::format("Directory {} uses separate planes", page));
  }
  if (info.samples_per_pixel != expected_samples) {
    return MAKE_ERROR(
        ErrorKind::kUnreadablePyramid,
        slidemask::fmt::format("Directory {} has {} samples per pixel, level 0 "
                               "has {}",
                               page, info.samples_per_pixel,
                               expected_samples));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<TiffPyramidReader>> TiffPyramidReader::Open(
    const std::filesystem::path& filename) {
  absl::StatusOr<TiffFile> opened =
      TiffFile::Open(filename, TiffFile::Mode::kRead);
  if (!opened.ok()) {
    return WithErrorKind(
        status::AddTrace(opened.status(), __func__, __FILE__, __LINE__),
        ErrorKind::kUnreadablePyramid);
  }
  TiffFile file = *std::move(opened);

  absl::StatusOr<uint16_t> dir_count = file.GetDirectoryCount();
  if (!dir_count.ok()) {
    return WithErrorKind(
        status::AddTrace(dir_count.status(), __func__, __FILE__, __LINE__),
        ErrorKind::kUnreadablePyramid);
  }

  std::vector<TiledDirectory> tiled;
  for (uint16_t page = 0; page < *dir_count; ++page) {
    RETURN_IF_ERROR(file.SetDirectory(page), "Cannot scan TIFF directories");
    absl::StatusOr<TiffDirectoryInfo> info = file.GetDirectoryInfo();
    if (!info.ok()) {
      LOG(WARNING) << "Skipping unreadable TIFF directory " << page << " of "
                   << filename.string() << ": " << info.status().message();
      continue;
    }
    if (!info->is_tiled || info->image_dims.IsEmpty()) {
      // Thumbnail, label and macro images are stripped
      continue;
    }
    tiled.push_back(TiledDirectory{
        .page = page, .info = *info, .area = info->image_dims.Area()});
  }

  if (tiled.empty()) {
    return MAKE_ERROR(
        ErrorKind::kUnreadablePyramid,
        slidemask::fmt::format("No tiled pyramid levels in {}",
                               filename.string()));
  }

  std::stable_sort(tiled.begin(), tiled.end(),
                   [](const TiledDirectory& a, const TiledDirectory& b) {
                     return a.area > b.area;
                   });

  const uint16_t samples = tiled.front().info.samples_per_pixel;
  std::vector<TiffLevel> levels;
  std::vector<Dimensions> dimensions;
  levels.reserve(tiled.size());
  dimensions.reserve(tiled.size());
  for (const auto& dir : tiled) {
    RETURN_IF_ERROR(ValidateLevelLayout(dir.page, dir.info, samples),
                    filename.string());
    levels.push_back(TiffLevel{
        .directory = dir.page,
        .dimensions = dir.info.image_dims,
        .tile_dims = *dir.info.tile_dims,
        .is_jpeg = dir.info.compression == COMPRESSION_JPEG});
    dimensions.push_back(dir.info.image_dims);
  }

  absl::StatusOr<PyramidDescriptor> descriptor =
      PyramidDescriptor::FromDimensions(dimensions);
  RETURN_IF_ERROR(descriptor.status(), filename.string());

  LOG(INFO) << "Opened " << filename.string() << " with "
            << descriptor->level_count() << " levels, " << samples
            << " samples per pixel";

  return std::unique_ptr<TiffPyramidReader>(
      new TiffPyramidReader(std::move(file), std::move(levels),
                            *std::move(descriptor), samples));
}

TiffPyramidReader::TiffPyramidReader(TiffFile file,
                                     std::vector<TiffLevel> levels,
                                     PyramidDescriptor descriptor,
                                     uint32_t channels)
    : file_(std::move(file)),
      levels_(std::move(levels)),
      descriptor_(std::move(descriptor)),
      channels_(channels) {}

absl::StatusOr<Tile> TiffPyramidReader::ReadRegion(int level,
                                                   const PixelRect& region) {
  if (!descriptor_.HasLevel(level)) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidemask::fmt::format("Level {} out of range [0, {})", level,
                               descriptor_.level_count()));
  }
  const TiffLevel& tiff_level = levels_[static_cast<size_t>(level)];
  if (region.IsEmpty() || !region.FitsWithin(tiff_level.dimensions)) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidemask::fmt::format(
            "Region ({}, {}) {}x{} is outside level {} of size {}x{}",
            region.x, region.y, region.width, region.height, level,
            tiff_level.dimensions.width, tiff_level.dimensions.height));
  }

  if (file_.GetCurrentDirectory() != tiff_level.directory ||
      tile_buffer_.empty()) {
    RETURN_IF_ERROR(file_.SetDirectory(tiff_level.directory),
                    slidemask::fmt::format("Level {}", level));
    if (tiff_level.is_jpeg && channels_ == 3) {
      RETURN_IF_ERROR(file_.SetJpegColorModeRGB(),
                      "Cannot enable JPEG RGB conversion");
    }
    DECLARE_ASSIGN_OR_RETURN(size_t, tile_bytes, file_.GetTileSize());
    const size_t expected = static_cast<size_t>(tiff_level.tile_dims.Area()) *
                            channels_;
    tile_buffer_.assign(std::max(tile_bytes, expected), 0);
  }

  Tile tile(region, channels_);
  for (const PixelRect& window : TileGrid(region, tiff_level.tile_dims)) {
    RETURN_IF_ERROR(file_.ReadTile(tile_buffer_.data(), window.x, window.y),
                    slidemask::fmt::format("Level {}", level));
    core::CopyTileToBuffer(tile_buffer_.data(), tile.data().data(),
                           tiff_level.tile_dims.width,
                           tiff_level.tile_dims.height, window.x, window.y,
                           region.x, region.y, region.width, region.height,
                           channels_);
  }
  return tile;
}

}  // namespace io
}  // namespace slidemask
