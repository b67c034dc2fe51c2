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

#include "slidemask/io/tiff_pyramid_writer.h"

#include <tiffio.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

absl::StatusOr<std::unique_ptr<TiffPyramidWriter>> TiffPyramidWriter::Create(
    const std::filesystem::path& filename, const TiffWriterOptions& options) {
  if (options.channels != 1 && options.channels != 3 &&
      options.channels != 4) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Unsupported channel count {}",
                               options.channels));
  }
  if (options.tile_size == 0 || options.tile_size % 16 != 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile size {} is not a positive multiple of 16",
                               options.tile_size));
  }
  if (options.compression == TiffCompression::JPEG) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "JPEG output compression is not supported");
  }

  absl::StatusOr<TiffFile> file =
      TiffFile::Open(filename, TiffFile::Mode::kWriteBigTiff);
  RETURN_IF_ERROR(file.status(), "Cannot create pyramid output");

  return std::unique_ptr<TiffPyramidWriter>(
      new TiffPyramidWriter(*std::move(file), filename, options));
}

TiffPyramidWriter::TiffPyramidWriter(TiffFile file, std::filesystem::path path,
                                     TiffWriterOptions options)
    : file_(std::move(file)),
      path_(std::move(path)),
      options_(std::move(options)) {}

TiffPyramidWriter::~TiffPyramidWriter() {
  if (!file_.IsValid()) {
    return;
  }
  auto status = Close();
  if (!status.ok()) {
    LOG(ERROR) << "Closing " << path_.string() << ": " << status.message();
  }
}

absl::Status TiffPyramidWriter::WriteLevelFields(const Dimensions& dimensions) {
  const uint32_t subfile_type =
      completed_levels_ == 0 ? 0 : FILETYPE_REDUCEDIMAGE;
  const uint16_t photometric =
      options_.channels == 1 ? PHOTOMETRIC_MINISBLACK : PHOTOMETRIC_RGB;

  RETURN_IF_ERROR(file_.SetField(TIFFTAG_SUBFILETYPE, subfile_type),
                  "subfile type");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_IMAGEWIDTH, dimensions.width),
                  "image width");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_IMAGELENGTH, dimensions.height),
                  "image length");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_TILEWIDTH, options_.tile_size),
                  "tile width");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_TILELENGTH, options_.tile_size),
                  "tile length");
  RETURN_IF_ERROR(
      file_.SetField(TIFFTAG_SAMPLESPERPIXEL,
                     static_cast<uint16_t>(options_.channels)),
      "samples per pixel");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_BITSPERSAMPLE, uint16_t{8}),
                  "bits per sample");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_SAMPLEFORMAT,
                                 uint16_t{SAMPLEFORMAT_UINT}),
                  "sample format");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_PHOTOMETRIC, photometric),
                  "photometric");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_PLANARCONFIG,
                                 uint16_t{PLANARCONFIG_CONTIG}),
                  "planar config");
  RETURN_IF_ERROR(file_.SetField(TIFFTAG_ORIENTATION,
                                 uint16_t{ORIENTATION_TOPLEFT}),
                  "orientation");
  RETURN_IF_ERROR(
      file_.SetField(TIFFTAG_COMPRESSION,
                     static_cast<uint16_t>(options_.compression)),
      "compression");
  if (options_.channels == 4) {
    uint16_t extra_samples[] = {EXTRASAMPLE_UNASSALPHA};
    RETURN_IF_ERROR(
        file_.SetField(TIFFTAG_EXTRASAMPLES, uint16_t{1}, extra_samples),
        "extra samples");
  }
  RETURN_IF_ERROR(
      file_.SetField(TIFFTAG_SOFTWARE, options_.software.c_str()),
      "software");
  return absl::OkStatus();
}

absl::Status TiffPyramidWriter::BeginLevel(const Dimensions& dimensions) {
  if (!file_.IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Writer is closed");
  }
  if (level_open_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "BeginLevel called while a level is open");
  }
  if (dimensions.IsEmpty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot begin an empty level");
  }

  RETURN_IF_ERROR(WriteLevelFields(dimensions),
                  slidemask::fmt::format("Level {} of {}", completed_levels_,
                                         path_.string()));
  tile_buffer_.assign(static_cast<size_t>(options_.tile_size) *
                          options_.tile_size * options_.channels,
                      0);
  open_dimensions_ = dimensions;
  level_open_ = true;
  return absl::OkStatus();
}

absl::Status TiffPyramidWriter::WriteTile(const Tile& tile) {
  if (!level_open_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "WriteTile called without an open level");
  }
  if (tile.channels() != options_.channels || !tile.IsConsistent()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile at ({}, {}) has {} channels, writer "
                               "expects {}",
                               tile.x(), tile.y(), tile.channels(),
                               options_.channels));
  }
  const uint32_t ts = options_.tile_size;
  if (tile.x() % ts != 0 || tile.y() % ts != 0 ||
      !tile.rect().FitsWithin(open_dimensions_) ||
      tile.width() != std::min(ts, open_dimensions_.width - tile.x()) ||
      tile.height() != std::min(ts, open_dimensions_.height - tile.y())) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Tile {}x{} at ({}, {}) is not a cell of the "
                               "{}-pixel grid",
                               tile.width(), tile.height(), tile.x(), tile.y(),
                               ts));
  }

  const void* payload = tile.data().data();
  if (tile.width() != ts || tile.height() != ts) {
    // Edge tiles are zero padded to a full tile
    std::fill(tile_buffer_.begin(), tile_buffer_.end(), 0);
    const size_t dst_stride = static_cast<size_t>(ts) * options_.channels;
    for (uint32_t row = 0; row < tile.height(); ++row) {
      std::memcpy(tile_buffer_.data() + row * dst_stride, tile.PixelAt(0, row),
                  tile.RowStride());
    }
    payload = tile_buffer_.data();
  }

  return file_.WriteTile(payload, tile.x(), tile.y());
}

absl::Status TiffPyramidWriter::EndLevel() {
  if (!level_open_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "EndLevel called without an open level");
  }
  level_open_ = false;
  RETURN_IF_ERROR(file_.WriteDirectory(),
                  slidemask::fmt::format("Level {}", completed_levels_));
  ++completed_levels_;
  return absl::OkStatus();
}

void TiffPyramidWriter::AbortLevel() {
  if (!level_open_) {
    return;
  }
  level_open_ = false;

  // Tiles already encoded cannot be taken back; write the directory so the
  // handle is consistent, then drop it from the chain.
  absl::Status status = file_.WriteDirectory();
  if (status.ok()) {
    status =
        file_.UnlinkDirectory(static_cast<uint16_t>(completed_levels_ + 1));
  }
  if (!status.ok()) {
    LOG(ERROR) << "Failed to discard incomplete level " << completed_levels_
               << " of " << path_.string() << ": " << status.message();
    return;
  }
  LOG(WARNING) << "Discarded incomplete level " << completed_levels_ << " of "
               << path_.string();
}

absl::Status TiffPyramidWriter::Close() {
  const bool had_open_level = level_open_;
  AbortLevel();
  file_.Close();
  if (had_open_level) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        slidemask::fmt::format("{} closed with an unfinished level",
                               path_.string()));
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace slidemask
