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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TISSUE_PIPELINE_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TISSUE_PIPELINE_H_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <vector>

#include "absl/status/statusor.h"
#include "slidemask/geometry/geometry_normalizer.h"
#include "slidemask/mask/mask_rasterizer.h"
#include "slidemask/pipeline/pipeline_options.h"
#include "slidemask/pipeline/tile_compositor.h"

/**
 * @file tissue_pipeline.h
 * @brief End-to-end tissue extraction
 *
 * Stages of a run:
 *
 * 1. Validate the options and the input files.
 * 2. Open the slide as a pyramid source.
 * 3. Read and normalize the annotations.
 * 4. Rasterize the mask pyramid into `<scratch>/mask_pyramidal.tiff`.
 * 5. Re-open the mask, align its levels with the slide and select levels.
 * 6. Composite the selected levels into the RGBA output.
 * 7. Log a summary; the scratch directory is removed unless kept.
 */

namespace slidemask {
namespace pipeline {

inline constexpr char kMaskFileName[] = "mask_pyramidal.tiff";

/// @brief Outcome of a pipeline run
struct PipelineReport {
  int image_levels = 0;
  int mask_levels = 0;
  int max_processable = 0;
  std::vector<int> selected_levels;

  NormalizationReport normalization;
  bool empty_geometry = false;  ///< Ran with an all-background mask
  bool cancelled = false;       ///< Stopped early through the cancel flag
  MaskPyramidReport mask;
  CompositeReport composite;

  double elapsed_seconds = 0.0;
  uintmax_t input_bytes = 0;
  uintmax_t output_bytes = 0;
  std::filesystem::path output_path;
  std::filesystem::path mask_path;  ///< Empty unless intermediates are kept

  /// @brief Output size divided by input size, 0 for an empty input
  [[nodiscard]] double SizeRatio() const {
    return input_bytes == 0 ? 0.0
                            : static_cast<double>(output_bytes) /
                                  static_cast<double>(input_bytes);
  }
};

class TissuePipeline {
 public:
  explicit TissuePipeline(PipelineOptions options);

  /// @brief Streams used when no level selection is configured
  void SetPromptStreams(std::istream* in, std::ostream* out) {
    prompt_in_ = in;
    prompt_out_ = out;
  }

  /// @brief Flag polled between mask levels, after level selection and
  /// between output levels
  void SetCancelFlag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

  [[nodiscard]] const PipelineOptions& options() const { return options_; }

  absl::StatusOr<PipelineReport> Run();

 private:
  absl::Status ValidateInputs() const;

  PipelineOptions options_;
  std::istream* prompt_in_ = &std::cin;
  std::ostream* prompt_out_ = &std::cout;
  const std::atomic<bool>* cancel_ = nullptr;
};

}  // namespace pipeline

using pipeline::PipelineReport;
using pipeline::TissuePipeline;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_TISSUE_PIPELINE_H_
