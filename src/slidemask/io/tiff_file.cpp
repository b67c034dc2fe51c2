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

#include "slidemask/io/tiff_file.h"

#include <tiffio.h>
#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

absl::StatusOr<TiffCompression> ParseTiffCompression(std::string_view name) {
  const std::string lowered =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(name));
  if (lowered == "none") {
    return TiffCompression::None;
  }
  if (lowered == "lzw") {
    return TiffCompression::LZW;
  }
  if (lowered == "deflate" || lowered == "zip") {
    return TiffCompression::Deflate;
  }
  if (lowered == "packbits") {
    return TiffCompression::Packbits;
  }
  return MAKE_STATUS(
      absl::StatusCode::kInvalidArgument,
      slidemask::fmt::format("Unsupported output compression '{}' (expected "
                             "none, lzw, deflate or packbits)",
                             name));
}

const char* GetCompressionName(TiffCompression compression) {
  switch (compression) {
    case TiffCompression::None:
      return "none";
    case TiffCompression::LZW:
      return "lzw";
    case TiffCompression::JPEG:
      return "jpeg";
    case TiffCompression::Packbits:
      return "packbits";
    case TiffCompression::Deflate:
      return "deflate";
  }
  return "unknown";
}

absl::StatusOr<TiffFile> TiffFile::Open(const std::filesystem::path& filename,
                                        Mode mode) {
  // "m" disables memory-mapping
  const char* open_mode = mode == Mode::kRead ? "rm" : "w8";
  TIFF* tif = TIFFOpen(filename.string().c_str(), open_mode);
  if (tif == nullptr) {
    return MAKE_STATUS(
        mode == Mode::kRead ? absl::StatusCode::kNotFound
                            : absl::StatusCode::kPermissionDenied,
        slidemask::fmt::format("Cannot open TIFF file {} for {}",
                               filename.string(),
                               mode == Mode::kRead ? "reading" : "writing"));
  }
  return TiffFile(std::unique_ptr<TIFF, TiffCloser>(tif), filename);
}

TiffFile::TiffFile(std::unique_ptr<TIFF, TiffCloser> handle,
                   std::filesystem::path path)
    : handle_(std::move(handle)), path_(std::move(path)) {}

void TiffFile::Close() {
  handle_.reset();
}

absl::StatusOr<uint16_t> TiffFile::GetDirectoryCount() const {
  if (cached_directory_count_.has_value()) {
    return *cached_directory_count_;
  }

  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  TIFF* tif = handle_.get();
  const uint16_t current_dir = TIFFCurrentDirectory(tif);

  if (TIFFSetDirectory(tif, 0) == 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to set directory to 0");
  }

  uint16_t dir_count = 1;
  while (TIFFReadDirectory(tif) != 0) {
    ++dir_count;
  }

  if (TIFFSetDirectory(tif, current_dir) == 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to restore original directory");
  }

  cached_directory_count_ = dir_count;
  return dir_count;
}

absl::Status TiffFile::SetDirectory(uint16_t dir_index) {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  if (TIFFSetDirectory(handle_.get(), dir_index) == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidemask::fmt::format("Failed to set directory to {}", dir_index));
  }

  current_directory_ = dir_index;
  return absl::OkStatus();
}

template <typename T>
absl::StatusOr<T> TiffFile::GetRequiredField(ttag_t tag) const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  T value;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_.get(), tag, &value) != 1) {
    return MAKE_STATUS(
        absl::StatusCode::kNotFound,
        slidemask::fmt::format("Required field (tag {}) not found",
                               static_cast<uint32_t>(tag)));
  }
  return value;
}

template <typename T>
std::optional<T> TiffFile::GetOptionalField(ttag_t tag) const {
  if (!IsValid()) {
    return std::nullopt;
  }

  T value;
  // TIFFGetFieldDefaulted fills in the values libtiff assumes when absent
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetFieldDefaulted(handle_.get(), tag, &value) == 1) {
    return value;
  }
  return std::nullopt;
}

absl::StatusOr<Dimensions> TiffFile::GetImageDimensions() const {
  Dimensions dims;
  ASSIGN_OR_RETURN(dims.width, GetRequiredField<uint32_t>(TIFFTAG_IMAGEWIDTH));
  ASSIGN_OR_RETURN(dims.height,
                   GetRequiredField<uint32_t>(TIFFTAG_IMAGELENGTH));
  return dims;
}

absl::StatusOr<Dimensions> TiffFile::GetTileDimensions() const {
  if (!IsTiled()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Image is not tiled");
  }

  Dimensions dims;
  ASSIGN_OR_RETURN(dims.width, GetRequiredField<uint32_t>(TIFFTAG_TILEWIDTH));
  ASSIGN_OR_RETURN(dims.height,
                   GetRequiredField<uint32_t>(TIFFTAG_TILELENGTH));
  return dims;
}

bool TiffFile::IsTiled() const {
  return IsValid() && TIFFIsTiled(handle_.get()) != 0;
}

absl::StatusOr<TiffDirectoryInfo> TiffFile::GetDirectoryInfo() const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  TiffDirectoryInfo info;
  ASSIGN_OR_RETURN(info.image_dims, GetImageDimensions());
  info.samples_per_pixel =
      GetOptionalField<uint16_t>(TIFFTAG_SAMPLESPERPIXEL).value_or(1);
  info.bits_per_sample =
      GetOptionalField<uint16_t>(TIFFTAG_BITSPERSAMPLE).value_or(1);
  ASSIGN_OR_RETURN(info.photometric,
                   GetRequiredField<uint16_t>(TIFFTAG_PHOTOMETRIC));
  info.compression = GetOptionalField<uint16_t>(TIFFTAG_COMPRESSION)
                         .value_or(COMPRESSION_NONE);
  info.planar_config = GetOptionalField<uint16_t>(TIFFTAG_PLANARCONFIG)
                           .value_or(PLANARCONFIG_CONTIG);
  info.subfile_type =
      GetOptionalField<uint32_t>(TIFFTAG_SUBFILETYPE).value_or(0);

  info.is_tiled = IsTiled();
  if (info.is_tiled) {
    ASSIGN_OR_RETURN(info.tile_dims, GetTileDimensions());
  }

  return info;
}

absl::StatusOr<size_t> TiffFile::GetTileSize() const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  const tmsize_t size = TIFFTileSize(handle_.get());
  if (size <= 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to compute tile size");
  }
  return static_cast<size_t>(size);
}

absl::Status TiffFile::SetJpegColorModeRGB() {
  return SetField(TIFFTAG_JPEGCOLORMODE, JPEGCOLORMODE_RGB);
}

absl::Status TiffFile::ReadTile(void* buffer, uint32_t x, uint32_t y) const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  if (!IsTiled()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Image is not tiled");
  }

  const tmsize_t bytes_read = TIFFReadTile(handle_.get(), buffer, x, y, 0, 0);
  if (bytes_read < 0) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        slidemask::fmt::format("Failed to read tile at ({}, {}) of {}", x, y,
                               path_.string()));
  }

  return absl::OkStatus();
}

absl::Status TiffFile::WriteTile(const void* buffer, uint32_t x, uint32_t y) {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  // libtiff takes a non-const buffer but does not modify it when encoding
  const tmsize_t written =
      TIFFWriteTile(handle_.get(), const_cast<void*>(buffer), x, y, 0, 0);
  if (written < 0) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        slidemask::fmt::format("Failed to write tile at ({}, {}) to {}", x, y,
                               path_.string()));
  }
  return absl::OkStatus();
}

absl::Status TiffFile::WriteDirectory() {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  if (TIFFWriteDirectory(handle_.get()) != 1) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        slidemask::fmt::format("Failed to write TIFF directory to {}",
                               path_.string()));
  }
  cached_directory_count_.reset();
  return absl::OkStatus();
}

absl::Status TiffFile::UnlinkDirectory(uint16_t dir_number) {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  if (TIFFUnlinkDirectory(handle_.get(), dir_number) != 1) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        slidemask::fmt::format("Failed to unlink directory {} of {}",
                               dir_number, path_.string()));
  }
  cached_directory_count_.reset();
  return absl::OkStatus();
}

}  // namespace io
}  // namespace slidemask
