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

#include "slidemask/pipeline/tissue_pipeline.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_join.h"
#include "slidemask/io/geojson_reader.h"
#include "slidemask/io/tiff_pyramid_reader.h"
#include "slidemask/io/tiff_pyramid_writer.h"
#include "slidemask/pipeline/level_aligner.h"
#include "slidemask/pipeline/level_selector.h"
#include "slidemask/status/errors.h"
#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"
#include "slidemask/utilities/temporary.h"

namespace slidemask {
namespace pipeline {

namespace fs = std::filesystem;

namespace {

constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

uintmax_t FileSizeOrZero(const fs::path& path) {
  std::error_code ec;
  const uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    LOG(WARNING) << "Cannot determine size of " << path << ": "
                 << ec.message();
    return 0;
  }
  return size;
}

void LogDescriptor(std::string_view name, const PyramidDescriptor& desc) {
  LOG(INFO) << name << " pyramid has " << desc.level_count() << " level(s)";
  for (int level = 0; level < desc.level_count(); ++level) {
    LOG(INFO) << "  level " << level << ": " << desc.dimensions(level)
              << " downsample " << desc.downsample(level);
  }
}

}  // namespace

TissuePipeline::TissuePipeline(PipelineOptions options)
    : options_(std::move(options)) {}

absl::Status TissuePipeline::ValidateInputs() const {
  RETURN_IF_ERROR(options_.Validate(), "Invalid pipeline options");

  std::error_code ec;
  if (!fs::is_regular_file(options_.input_path, ec)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Slide file not found: " + options_.input_path.string());
  }
  if (!fs::is_regular_file(options_.annotations_path, ec)) {
    return MAKE_STATUS(
        absl::StatusCode::kNotFound,
        "Annotations file not found: " + options_.annotations_path.string());
  }
  return absl::OkStatus();
}

absl::StatusOr<PipelineReport> TissuePipeline::Run() {
  const auto start = std::chrono::steady_clock::now();
  PipelineReport report;
  report.output_path = options_.output_path;

  LOG(INFO) << "Validating inputs";
  RETURN_IF_ERROR(ValidateInputs(), "Input validation failed");
  LOG(INFO) << "Input slide: " << options_.input_path.string();
  LOG(INFO) << "Annotations: " << options_.annotations_path.string();
  LOG(INFO) << "Output: " << options_.output_path.string() << " ("
            << io::GetCompressionName(options_.compression) << ", "
            << options_.tile_size << " px tiles)";

  absl::StatusOr<std::unique_ptr<TiffPyramidReader>> image =
      TiffPyramidReader::Open(options_.input_path);
  RETURN_IF_ERROR(image.status(), "Opening slide");
  const PyramidDescriptor& image_desc = (*image)->descriptor();
  report.image_levels = image_desc.level_count();
  LogDescriptor("Image", image_desc);

  absl::StatusOr<FeatureCollection> features =
      ReadGeoJsonFile(options_.annotations_path);
  RETURN_IF_ERROR(features.status(), "Reading annotations");

  Geometry geometry;
  absl::StatusOr<Geometry> normalized = NormalizeGeometry(
      *features, image_desc.dimensions(0), &report.normalization);
  if (normalized.ok()) {
    geometry = *std::move(normalized);
  } else if (options_.allow_empty_geometry &&
             IsErrorKind(normalized.status(), ErrorKind::kEmptyGeometry)) {
    LOG(WARNING) << status::StripStackTrace(normalized.status().message())
                 << "; continuing with an all-background mask";
    report.empty_geometry = true;
  } else {
    RETURN_IF_ERROR(normalized.status(), "Normalizing annotations");
  }

  absl::StatusOr<utilities::TemporaryDirectory> scratch =
      utilities::TemporaryDirectory::Create(options_.temp_dir,
                                            options_.keep_intermediates);
  RETURN_IF_ERROR(scratch.status(), "Creating scratch directory");
  const fs::path mask_path = scratch->Path() / kMaskFileName;
  LOG(INFO) << "Working directory: " << scratch->Path().string();

  {
    absl::StatusOr<std::unique_ptr<TiffPyramidWriter>> mask_writer =
        TiffPyramidWriter::Create(
            mask_path,
            TiffWriterOptions{.channels = core::kMaskChannels,
                              .tile_size = options_.tile_size,
                              .compression = TiffCompression::Deflate});
    RETURN_IF_ERROR(mask_writer.status(), "Creating mask pyramid");

    MaskRasterizer rasterizer(MaskPyramidOptions{
        .max_levels = options_.max_mask_levels, .cancel = cancel_});
    absl::StatusOr<MaskPyramidReport> built =
        rasterizer.BuildPyramid(geometry, image_desc, **mask_writer);
    const int completed = (*mask_writer)->completed_levels();
    if (built.ok()) {
      report.mask = *built;
    } else if (completed > 0 &&
               IsErrorKind(built.status(), ErrorKind::kRasterizationError)) {
      LOG(ERROR) << "Mask pyramid truncated to " << completed
                 << " level(s): "
                 << status::StripStackTrace(built.status().message());
      report.mask.levels_built = completed;
    } else {
      RETURN_IF_ERROR(built.status(), "Building mask pyramid");
    }
    RETURN_IF_ERROR((*mask_writer)->Close(), "Closing mask pyramid");
  }
  if (report.mask.cancelled) {
    LOG(WARNING) << "Cancelled while building the mask pyramid";
    report.cancelled = true;
    return report;
  }
  LOG(INFO) << "Mask pyramid written to " << mask_path.string();

  absl::StatusOr<std::unique_ptr<TiffPyramidReader>> mask =
      TiffPyramidReader::Open(mask_path);
  RETURN_IF_ERROR(mask.status(), "Re-opening mask pyramid");
  const PyramidDescriptor& mask_desc = (*mask)->descriptor();
  report.mask_levels = mask_desc.level_count();

  absl::StatusOr<std::vector<LevelPlan>> plans =
      AlignLevels(image_desc, mask_desc);
  RETURN_IF_ERROR(plans.status(), "Aligning levels");
  report.max_processable = static_cast<int>(plans->size());

  if (options_.levels.has_value()) {
    absl::StatusOr<std::vector<int>> selected =
        ParseLevelSelection(*options_.levels, report.max_processable);
    RETURN_IF_ERROR(selected.status(), "Selecting levels");
    report.selected_levels = *std::move(selected);
  } else {
    report.selected_levels =
        PromptForLevels(*prompt_in_, *prompt_out_, report.image_levels,
                        report.mask_levels, report.max_processable);
  }
  if (cancel_ != nullptr && cancel_->load()) {
    LOG(WARNING) << "Cancelled during level selection";
    report.cancelled = true;
    return report;
  }
  LOG(INFO) << "Processing " << report.selected_levels.size()
            << " pyramid level(s): "
            << absl::StrJoin(report.selected_levels, ",");

  std::error_code ec;
  const fs::path output_dir = options_.output_path.parent_path();
  if (!output_dir.empty()) {
    fs::create_directories(output_dir, ec);
    if (ec) {
      return MAKE_STATUS(absl::StatusCode::kPermissionDenied,
                         "Cannot create output directory " +
                             output_dir.string() + ": " + ec.message());
    }
  }

  absl::StatusOr<std::unique_ptr<TiffPyramidWriter>> output =
      TiffPyramidWriter::Create(
          options_.output_path,
          TiffWriterOptions{.channels = core::kRGBAChannels,
                            .tile_size = options_.tile_size,
                            .compression = options_.compression});
  RETURN_IF_ERROR(output.status(), "Creating output");

  TileCompositor compositor(
      CompositeOptions{.mask_threshold = options_.mask_threshold});
  absl::StatusOr<CompositeReport> composed =
      compositor.Compose(**image, **mask, *plans, report.selected_levels,
                         **output, cancel_);
  RETURN_IF_ERROR(composed.status(), "Compositing tissue");
  report.composite = *std::move(composed);
  report.cancelled = report.composite.cancelled;
  RETURN_IF_ERROR((*output)->Close(), "Closing output");

  report.elapsed_seconds = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - start)
                               .count();
  report.input_bytes = FileSizeOrZero(options_.input_path);
  report.output_bytes = FileSizeOrZero(options_.output_path);

  LOG(INFO) << slidemask::fmt::format(
      "Pipeline completed in {:.1f}s: input {:.1f} MB, output {:.1f} MB, "
      "ratio {:.2f}x",
      report.elapsed_seconds,
      static_cast<double>(report.input_bytes) / kBytesPerMegabyte,
      static_cast<double>(report.output_bytes) / kBytesPerMegabyte,
      report.SizeRatio());
  if (options_.keep_intermediates) {
    report.mask_path = mask_path;
    LOG(INFO) << "Intermediate mask preserved at " << mask_path.string();
  } else {
    LOG(INFO) << "Intermediate files will be removed";
  }
  return report;
}

}  // namespace pipeline
}  // namespace slidemask
