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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_FILE_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_FILE_H_

#include <tiffio.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidemask/core/types.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

/// @brief TIFF compression schemes the pipeline reads or writes
/// @details Only the lossless schemes are offered for writing; JPEG is
/// recognized on read because Aperio SVS levels are JPEG-compressed.
enum class TiffCompression : uint16_t {
  None = COMPRESSION_NONE,          ///< No compression
  LZW = COMPRESSION_LZW,            ///< Lempel-Ziv & Welch
  JPEG = COMPRESSION_JPEG,          ///< JPEG compression (read only)
  Packbits = COMPRESSION_PACKBITS,  ///< Macintosh RLE
  Deflate = COMPRESSION_ADOBE_DEFLATE,  ///< Deflate compression
};

/// @brief Parse a compression name ("none", "lzw", "deflate", "packbits")
/// @return Compression, or InvalidArgument naming the unknown value
absl::StatusOr<TiffCompression> ParseTiffCompression(std::string_view name);

/// @brief Display name of a compression scheme
const char* GetCompressionName(TiffCompression compression);

/// @brief TIFF directory information structure
/// @details Aggregates the fields needed to decide whether a directory is a
/// pyramid level and how to decode its tiles.
struct TiffDirectoryInfo {
  Dimensions image_dims;               ///< Image width and height
  std::optional<Dimensions> tile_dims;  ///< Tile dimensions (if tiled)
  uint16_t samples_per_pixel = 0;      ///< Number of samples per pixel
  uint16_t bits_per_sample = 0;        ///< Bits per sample
  uint16_t photometric = 0;            ///< Photometric interpretation
  uint16_t compression = COMPRESSION_NONE;  ///< Compression tag value
  uint16_t planar_config = PLANARCONFIG_CONTIG;  ///< Planar configuration
  uint32_t subfile_type = 0;           ///< Subfile type flags
  bool is_tiled = false;               ///< Whether image is tiled

  /// @brief Check if this is a reduced resolution image
  [[nodiscard]] bool IsReducedResolution() const noexcept {
    return (subfile_type & FILETYPE_REDUCEDIMAGE) != 0;
  }
};

/// @brief RAII wrapper owning one libtiff handle
/// @details The handle is exclusively owned: it is opened by Open() and
/// closed by the destructor or Close(). TiffFile is move-only and not
/// thread-safe. Read and write helpers translate libtiff failures into
/// absl::Status values.
class TiffFile {
 public:
  /// @brief Access mode of an opened file
  enum class Mode {
    kRead,           ///< Existing classic TIFF or BigTIFF
    kWriteBigTiff,   ///< New BigTIFF, truncating any existing file
  };

  /// @brief Open a TIFF file
  /// @param filename Path to the file
  /// @param mode Read or write access
  /// @return TiffFile owning the handle, or an error naming the path
  static absl::StatusOr<TiffFile> Open(const std::filesystem::path& filename,
                                       Mode mode);

  ~TiffFile() = default;

  // Non-copyable but movable
  TiffFile(const TiffFile&) = delete;
  TiffFile& operator=(const TiffFile&) = delete;
  TiffFile(TiffFile&& other) noexcept = default;
  TiffFile& operator=(TiffFile&& other) noexcept = default;

  /// @brief Close the handle, flushing pending writes
  void Close();

  [[nodiscard]] bool IsValid() const { return handle_ != nullptr; }

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // --- Reading -------------------------------------------------------------

  /// @brief Get the total number of directories in the file
  /// @details Cached after the first call.
  absl::StatusOr<uint16_t> GetDirectoryCount() const;

  /// @brief Set the current directory
  absl::Status SetDirectory(uint16_t dir_index);

  [[nodiscard]] uint16_t GetCurrentDirectory() const {
    return current_directory_;
  }

  /// @brief Get the metadata of the current directory in one call
  absl::StatusOr<TiffDirectoryInfo> GetDirectoryInfo() const;

  /// @brief Get image dimensions for current directory
  absl::StatusOr<Dimensions> GetImageDimensions() const;

  /// @brief Get tile dimensions (only valid for tiled images)
  absl::StatusOr<Dimensions> GetTileDimensions() const;

  /// @brief Check if current directory is tiled
  [[nodiscard]] bool IsTiled() const;

  /// @brief Get the size of a decoded tile in bytes
  [[nodiscard]] absl::StatusOr<size_t> GetTileSize() const;

  /// @brief Make libtiff convert YCbCr JPEG tiles to RGB on decode
  absl::Status SetJpegColorModeRGB();

  /// @brief Read and decode the tile containing pixel (x, y)
  /// @param buffer Buffer of at least GetTileSize() bytes
  absl::Status ReadTile(void* buffer, uint32_t x, uint32_t y) const;

  // --- Writing -------------------------------------------------------------

  /// @brief Set a directory field of the directory being written
  /// @details Thin typed wrapper over the variadic TIFFSetField.
  template <typename... Args>
  absl::Status SetField(ttag_t tag, Args... values);

  /// @brief Encode one full tile whose top-left pixel is (x, y)
  /// @param buffer Exactly one tile of GetTileSize() bytes
  absl::Status WriteTile(const void* buffer, uint32_t x, uint32_t y);

  /// @brief Write the current directory and start a new one
  absl::Status WriteDirectory();

  /// @brief Remove a directory from the chain (1-based, as in libtiff)
  /// @details Leaves the handle ready to start a fresh directory.
  absl::Status UnlinkDirectory(uint16_t dir_number);

  /// @brief Access the raw handle for operations not wrapped here
  [[nodiscard]] TIFF* GetHandle() const { return handle_.get(); }

 private:
  struct TiffCloser {
    void operator()(TIFF* tif) const {
      if (tif != nullptr) {
        TIFFClose(tif);
      }
    }
  };

  TiffFile(std::unique_ptr<TIFF, TiffCloser> handle,
           std::filesystem::path path);

  template <typename T>
  absl::StatusOr<T> GetRequiredField(ttag_t tag) const;

  template <typename T>
  std::optional<T> GetOptionalField(ttag_t tag) const;

  std::unique_ptr<TIFF, TiffCloser> handle_;
  std::filesystem::path path_;
  uint16_t current_directory_ = 0;
  mutable std::optional<uint16_t> cached_directory_count_;
};

template <typename... Args>
absl::Status TiffFile::SetField(ttag_t tag, Args... values) {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFSetField(handle_.get(), tag, values...) != 1) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        slidemask::fmt::format("Failed to set TIFF field (tag {}) in {}",
                               static_cast<uint32_t>(tag), path_.string()));
  }
  return absl::OkStatus();
}

}  // namespace io

using io::TiffCompression;
using io::TiffDirectoryInfo;
using io::TiffFile;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_FILE_H_
