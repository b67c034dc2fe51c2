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

#include <tiffio.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "slidemask/core/tile_grid.h"
#include "slidemask/io/tiff_file.h"
#include "slidemask/io/tiff_pyramid_reader.h"
#include "slidemask/io/tiff_pyramid_writer.h"
#include "slidemask/status/errors.h"

namespace slidemask {
namespace io {
namespace {

constexpr uint32_t kTileSize = 16;

uint8_t PatternValue(uint32_t level, uint32_t x, uint32_t y, uint32_t c) {
  return static_cast<uint8_t>(level * 50 + x * 3 + y * 5 + c * 7);
}

Tile PatternTile(uint32_t level, const PixelRect& rect, uint32_t channels) {
  Tile tile(rect, channels);
  for (uint32_t row = 0; row < rect.height; ++row) {
    for (uint32_t col = 0; col < rect.width; ++col) {
      uint8_t* px = tile.PixelAt(col, row);
      for (uint32_t c = 0; c < channels; ++c) {
        px[c] = PatternValue(level, rect.x + col, rect.y + row, c);
      }
    }
  }
  return tile;
}

absl::Status WritePatternLevel(PyramidSink& sink, uint32_t level,
                               const Dimensions& dims, uint32_t channels) {
  absl::Status status = sink.BeginLevel(dims);
  if (!status.ok()) {
    return status;
  }
  for (const PixelRect& window :
       TileGrid(dims, Dimensions{kTileSize, kTileSize})) {
    status = sink.WriteTile(PatternTile(level, window, channels));
    if (!status.ok()) {
      return status;
    }
  }
  return sink.EndLevel();
}

class TiffPyramidTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / "tiff_pyramid_test";
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir_)) {
      std::filesystem::remove_all(test_dir_);
    }
  }

  /// @brief Tiled RGB level, stripped thumbnail, then a tiled 2x reduction
  void CreateSvsLikeFile(const std::filesystem::path& path) {
    TIFF* tif = TIFFOpen(path.string().c_str(), "w");
    ASSERT_NE(tif, nullptr);

    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, 40);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, 20);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, kTileSize);
    TIFFSetField(tif, TIFFTAG_TILELENGTH, kTileSize);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_LZW);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    std::vector<uint8_t> tile(kTileSize * kTileSize * 3, 200);
    for (uint32_t ty = 0; ty < 20; ty += kTileSize) {
      for (uint32_t tx = 0; tx < 40; tx += kTileSize) {
        TIFFWriteTile(tif, tile.data(), tx, ty, 0, 0);
      }
    }
    TIFFWriteDirectory(tif);

    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, 8);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, 4);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, 4);
    std::vector<uint8_t> scanline(8 * 3, 10);
    for (uint32_t y = 0; y < 4; ++y) {
      TIFFWriteScanline(tif, scanline.data(), y, 0);
    }
    TIFFWriteDirectory(tif);

    TIFFSetField(tif, TIFFTAG_SUBFILETYPE, FILETYPE_REDUCEDIMAGE);
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, 20);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, 10);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, kTileSize);
    TIFFSetField(tif, TIFFTAG_TILELENGTH, kTileSize);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_LZW);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    std::vector<uint8_t> reduced(kTileSize * kTileSize * 3, 100);
    TIFFWriteTile(tif, reduced.data(), 0, 0, 0, 0);
    TIFFWriteTile(tif, reduced.data(), kTileSize, 0, 0, 0);
    TIFFClose(tif);
  }

  std::filesystem::path test_dir_;
};

TEST_F(TiffPyramidTest, WriterRoundTripThroughReader) {
  const auto path = test_dir_ / "pyramid.tiff";
  const std::vector<Dimensions> dims = {{70, 45}, {35, 22}, {17, 11}};
  {
    auto writer = TiffPyramidWriter::Create(
        path, TiffWriterOptions{.channels = 4, .tile_size = kTileSize});
    ASSERT_TRUE(writer.ok()) << writer.status();
    for (uint32_t level = 0; level < dims.size(); ++level) {
      ASSERT_TRUE(WritePatternLevel(**writer, level, dims[level], 4).ok());
    }
    EXPECT_EQ((*writer)->completed_levels(), 3);
    ASSERT_TRUE((*writer)->Close().ok());
  }

  auto reader = TiffPyramidReader::Open(path);
  ASSERT_TRUE(reader.ok()) << reader.status();
  const PyramidDescriptor& desc = (*reader)->descriptor();
  ASSERT_EQ(desc.level_count(), 3);
  EXPECT_EQ((*reader)->channels(), 4u);
  EXPECT_EQ((*reader)->tile_size(), (Dimensions{kTileSize, kTileSize}));
  for (int level = 0; level < 3; ++level) {
    EXPECT_EQ(desc.dimensions(level), dims[level]);
  }

  // A region spanning several native tiles
  const PixelRect region{10, 5, 40, 30};
  auto tile = (*reader)->ReadRegion(0, region);
  ASSERT_TRUE(tile.ok()) << tile.status();
  for (uint32_t row = 0; row < region.height; ++row) {
    for (uint32_t col = 0; col < region.width; ++col) {
      for (uint32_t c = 0; c < 4; ++c) {
        ASSERT_EQ(tile->PixelAt(col, row)[c],
                  PatternValue(0, region.x + col, region.y + row, c));
      }
    }
  }

  auto edge = (*reader)->ReadRegion(2, PixelRect{16, 0, 1, 11});
  ASSERT_TRUE(edge.ok()) << edge.status();
  EXPECT_EQ(edge->PixelAt(0, 10)[3], PatternValue(2, 16, 10, 3));

  EXPECT_FALSE((*reader)->ReadRegion(3, PixelRect{0, 0, 1, 1}).ok());
  EXPECT_FALSE((*reader)->ReadRegion(1, PixelRect{30, 0, 10, 1}).ok());
}

TEST_F(TiffPyramidTest, OutputDirectoriesAreTaggedAsPyramid) {
  const auto path = test_dir_ / "tags.tiff";
  {
    auto writer = TiffPyramidWriter::Create(
        path, TiffWriterOptions{.channels = 4,
                                .tile_size = kTileSize,
                                .compression = TiffCompression::Deflate});
    ASSERT_TRUE(writer.ok()) << writer.status();
    ASSERT_TRUE(WritePatternLevel(**writer, 0, Dimensions{32, 32}, 4).ok());
    ASSERT_TRUE(WritePatternLevel(**writer, 1, Dimensions{16, 16}, 4).ok());
  }

  auto file = TiffFile::Open(path, TiffFile::Mode::kRead);
  ASSERT_TRUE(file.ok()) << file.status();
  ASSERT_EQ(*file->GetDirectoryCount(), 2);

  ASSERT_TRUE(file->SetDirectory(0).ok());
  auto first = file->GetDirectoryInfo();
  ASSERT_TRUE(first.ok());
  EXPECT_FALSE(first->IsReducedResolution());
  EXPECT_EQ(first->samples_per_pixel, 4);
  EXPECT_EQ(first->compression, COMPRESSION_ADOBE_DEFLATE);

  uint16_t extra_count = 0;
  uint16_t* extra_types = nullptr;
  ASSERT_EQ(TIFFGetField(file->GetHandle(), TIFFTAG_EXTRASAMPLES, &extra_count,
                         &extra_types),
            1);
  ASSERT_EQ(extra_count, 1);
  EXPECT_EQ(extra_types[0], EXTRASAMPLE_UNASSALPHA);

  ASSERT_TRUE(file->SetDirectory(1).ok());
  auto second = file->GetDirectoryInfo();
  ASSERT_TRUE(second.ok());
  EXPECT_TRUE(second->IsReducedResolution());
}

TEST_F(TiffPyramidTest, AbortedLevelIsDiscarded) {
  const auto path = test_dir_ / "aborted.tiff";
  {
    auto writer = TiffPyramidWriter::Create(
        path, TiffWriterOptions{.channels = 1, .tile_size = kTileSize});
    ASSERT_TRUE(writer.ok()) << writer.status();
    ASSERT_TRUE(WritePatternLevel(**writer, 0, Dimensions{48, 32}, 1).ok());

    ASSERT_TRUE((*writer)->BeginLevel(Dimensions{24, 16}).ok());
    ASSERT_TRUE(
        (*writer)->WriteTile(PatternTile(1, PixelRect{0, 0, 16, 16}, 1)).ok());
    (*writer)->AbortLevel();
    EXPECT_EQ((*writer)->completed_levels(), 1);
    ASSERT_TRUE((*writer)->Close().ok());
  }

  auto reader = TiffPyramidReader::Open(path);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->descriptor().level_count(), 1);
  EXPECT_EQ((*reader)->descriptor().dimensions(0), (Dimensions{48, 32}));
}

TEST_F(TiffPyramidTest, WriterRejectsMisplacedTiles) {
  auto writer = TiffPyramidWriter::Create(
      test_dir_ / "misplaced.tiff",
      TiffWriterOptions{.channels = 3, .tile_size = kTileSize});
  ASSERT_TRUE(writer.ok());
  ASSERT_TRUE((*writer)->BeginLevel(Dimensions{20, 20}).ok());
  EXPECT_FALSE(
      (*writer)->WriteTile(PatternTile(0, PixelRect{8, 0, 12, 16}, 3)).ok());
  EXPECT_FALSE(
      (*writer)->WriteTile(PatternTile(0, PixelRect{16, 0, 16, 16}, 3)).ok());
  EXPECT_FALSE(
      (*writer)->WriteTile(PatternTile(0, PixelRect{0, 0, 16, 16}, 4)).ok());
  (*writer)->AbortLevel();
}

TEST_F(TiffPyramidTest, WriterRejectsBadOptions) {
  EXPECT_FALSE(TiffPyramidWriter::Create(test_dir_ / "a.tiff",
                                         TiffWriterOptions{.channels = 2})
                   .ok());
  EXPECT_FALSE(TiffPyramidWriter::Create(
                   test_dir_ / "b.tiff", TiffWriterOptions{.tile_size = 100})
                   .ok());
  EXPECT_FALSE(
      TiffPyramidWriter::Create(
          test_dir_ / "c.tiff",
          TiffWriterOptions{.compression = TiffCompression::JPEG})
          .ok());
}

TEST_F(TiffPyramidTest, ReaderSkipsStrippedDirectories) {
  const auto path = test_dir_ / "svs_like.tiff";
  CreateSvsLikeFile(path);

  auto reader = TiffPyramidReader::Open(path);
  ASSERT_TRUE(reader.ok()) << reader.status();
  ASSERT_EQ((*reader)->descriptor().level_count(), 2);
  EXPECT_EQ((*reader)->descriptor().dimensions(1), (Dimensions{20, 10}));
  EXPECT_DOUBLE_EQ((*reader)->descriptor().downsample(1), 2.0);
  EXPECT_EQ((*reader)->channels(), 3u);
  EXPECT_EQ((*reader)->GetDirectoryForLevel(0), 0);
  EXPECT_EQ((*reader)->GetDirectoryForLevel(1), 2);
  auto tile = (*reader)->ReadRegion(0, PixelRect{30, 10, 10, 10});
  ASSERT_TRUE(tile.ok()) << tile.status();
  EXPECT_EQ(tile->PixelAt(9, 9)[0], 200);

  auto reduced = (*reader)->ReadRegion(1, PixelRect{15, 5, 5, 5});
  ASSERT_TRUE(reduced.ok()) << reduced.status();
  EXPECT_EQ(reduced->PixelAt(4, 4)[2], 100);
}

TEST_F(TiffPyramidTest, ReaderRejectsUnreadableInput) {
  auto missing = TiffPyramidReader::Open(test_dir_ / "missing.tiff");
  ASSERT_FALSE(missing.ok());
  EXPECT_TRUE(IsErrorKind(missing.status(), ErrorKind::kUnreadablePyramid));

  const auto garbage = test_dir_ / "garbage.tiff";
  {
    std::ofstream out(garbage, std::ios::binary);
    out << "This is not a TIFF file";
  }
  auto invalid = TiffPyramidReader::Open(garbage);
  ASSERT_FALSE(invalid.ok());
  EXPECT_TRUE(IsErrorKind(invalid.status(), ErrorKind::kUnreadablePyramid));
}

TEST(TiffCompressionTest, ParsesNames) {
  EXPECT_EQ(*ParseTiffCompression("LZW"), TiffCompression::LZW);
  EXPECT_EQ(*ParseTiffCompression("deflate"), TiffCompression::Deflate);
  EXPECT_EQ(*ParseTiffCompression("zip"), TiffCompression::Deflate);
  EXPECT_EQ(*ParseTiffCompression("none"), TiffCompression::None);
  EXPECT_EQ(*ParseTiffCompression("packbits"), TiffCompression::Packbits);
  EXPECT_FALSE(ParseTiffCompression("webp").ok());
}

TEST(TiffCompressionTest, NamesRoundTripThroughParser) {
  for (TiffCompression compression :
       {TiffCompression::None, TiffCompression::LZW, TiffCompression::Deflate,
        TiffCompression::Packbits}) {
    auto parsed = ParseTiffCompression(GetCompressionName(compression));
    ASSERT_TRUE(parsed.ok()) << GetCompressionName(compression);
    EXPECT_EQ(*parsed, compression);
  }
  EXPECT_STREQ(GetCompressionName(TiffCompression::JPEG), "jpeg");
}

}  // namespace
}  // namespace io
}  // namespace slidemask
