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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_WRITER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_WRITER_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidemask/core/tile.h"
#include "slidemask/core/types.h"
#include "slidemask/io/pyramid_sink.h"
#include "slidemask/io/tiff_file.h"

namespace slidemask {
namespace io {

/// @brief Layout of the pyramid written by TiffPyramidWriter
struct TiffWriterOptions {
  uint32_t channels = 4;  ///< 1 (grayscale mask), 3 (RGB) or 4 (RGBA)
  uint32_t tile_size = 512;  ///< Square tile edge, multiple of 16
  TiffCompression compression = TiffCompression::LZW;
  std::string software = "slidemask";
};

/// @brief Tiled BigTIFF pyramid writer
///
/// Each level becomes one directory. The first directory is the full
/// resolution subfile, later directories are flagged FILETYPE_REDUCEDIMAGE.
/// Four-channel output declares an unassociated alpha extra sample.
///
/// An aborted level is written out and immediately unlinked from the
/// directory chain, so readers only ever see completed levels.
class TiffPyramidWriter : public PyramidSink {
 public:
  /// @brief Create the output file
  static absl::StatusOr<std::unique_ptr<TiffPyramidWriter>> Create(
      const std::filesystem::path& filename, const TiffWriterOptions& options);

  ~TiffPyramidWriter() override;

  TiffPyramidWriter(const TiffPyramidWriter&) = delete;
  TiffPyramidWriter& operator=(const TiffPyramidWriter&) = delete;

  [[nodiscard]] uint32_t tile_size() const override {
    return options_.tile_size;
  }
  [[nodiscard]] int completed_levels() const override {
    return completed_levels_;
  }

  absl::Status BeginLevel(const Dimensions& dimensions) override;
  absl::Status WriteTile(const Tile& tile) override;
  absl::Status EndLevel() override;
  void AbortLevel() override;

  /// @brief Flush and close the file
  /// @details Fails when a level is still open; the open level is discarded.
  absl::Status Close();

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  TiffPyramidWriter(TiffFile file, std::filesystem::path path,
                    TiffWriterOptions options);

  absl::Status WriteLevelFields(const Dimensions& dimensions);

  TiffFile file_;
  std::filesystem::path path_;
  TiffWriterOptions options_;
  int completed_levels_ = 0;
  bool level_open_ = false;
  Dimensions open_dimensions_;
  std::vector<uint8_t> tile_buffer_;  ///< Padded edge-tile scratch buffer
};

}  // namespace io

using io::TiffPyramidWriter;
using io::TiffWriterOptions;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_TIFF_PYRAMID_WRITER_H_
