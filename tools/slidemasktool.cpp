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

#include <signal.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/strings/str_join.h"
#include "slidemask/io/tiff_file.h"
#include "slidemask/io/tiff_pyramid_reader.h"
#include "slidemask/pipeline/tissue_pipeline.h"

ABSL_FLAG(std::string, input, "", "Path to the slide file (TIFF or SVS)");
ABSL_FLAG(std::string, annotations, "",
          "Path to the GeoJSON tissue annotations");
ABSL_FLAG(std::string, output, "", "Output pyramidal RGBA TIFF path");
ABSL_FLAG(std::optional<std::string>, levels, std::nullopt,
          "Pyramid levels to process, e.g. 'all', '0,1,2' or '0-3'; "
          "prompts interactively when unset");
ABSL_FLAG(std::string, temp_dir, "",
          "Directory for intermediate files (default: system temp)");
ABSL_FLAG(bool, keep_intermediates, false,
          "Keep the intermediate mask pyramid");
ABSL_FLAG(std::string, compression, "lzw",
          "Output compression: none, lzw, deflate or packbits");
ABSL_FLAG(uint32_t, tile_size, 512, "Output tile size, a multiple of 16");
ABSL_FLAG(int, mask_threshold, 128,
          "Mask samples above this value are tissue (0-254)");
ABSL_FLAG(int, max_mask_levels, 0,
          "Maximum number of mask levels to build (0: no limit)");
ABSL_FLAG(bool, allow_empty_geometry, true,
          "Continue with a fully transparent output when the annotations "
          "contain no polygons");

namespace {

std::atomic<bool> g_cancel_requested{false};

void HandleInterrupt(int /*signal*/) { g_cancel_requested.store(true); }

// Without SA_RESTART so a blocked level prompt read is interrupted
void InstallInterruptHandler() {
  struct sigaction action {};
  action.sa_handler = HandleInterrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, nullptr) != 0) {
    LOG(WARNING) << "Cannot install SIGINT handler; Ctrl-C will not cancel";
  }
}

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, double value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << std::fixed
            << std::setprecision(2) << value << '\n';
}

void PrintKeyValue(const std::string& key, int value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintSummary(const slidemask::PipelineReport& report) {
  PrintHeader("Tissue Extraction Summary");
  PrintKeyValue("Total processing time (s)", report.elapsed_seconds);
  PrintKeyValue("Input size (MB)",
                static_cast<double>(report.input_bytes) / (1024.0 * 1024.0));
  PrintKeyValue("Output size (MB)",
                static_cast<double>(report.output_bytes) / (1024.0 * 1024.0));
  PrintKeyValue("Size ratio", report.SizeRatio());
  PrintKeyValue("Image levels", report.image_levels);
  PrintKeyValue("Mask levels", report.mask_levels);
  PrintKeyValue("Levels written",
                static_cast<int>(report.composite.levels.size()));
  PrintKeyValue("Selected levels", absl::StrJoin(report.selected_levels, ","));
  PrintKeyValue("Polygons",
                static_cast<int>(report.normalization.polygons_kept));
  if (report.empty_geometry) {
    PrintKeyValue("Mask", "empty (no tissue polygons)");
  }
  if (report.cancelled) {
    PrintKeyValue("Status", "cancelled");
  }
  PrintKeyValue("Output file", report.output_path.string());
  if (!report.mask_path.empty()) {
    PrintKeyValue("Mask file", report.mask_path.string());
  }
  PrintSeparator('=');
}

int InfoCommand(const std::string& input_file) {
  std::cout << "Opening pyramid: " << input_file << '\n';
  auto reader_or = slidemask::TiffPyramidReader::Open(input_file);
  if (!reader_or.ok()) {
    std::cerr << "\nError: Failed to open pyramid\n";
    std::cerr << "Status: " << reader_or.status() << '\n';
    return 1;
  }

  const auto& reader = *reader_or;
  const auto& desc = reader->descriptor();
  PrintHeader("Pyramid Levels");
  PrintKeyValue("Number of Levels", desc.level_count());
  PrintKeyValue("Channels", static_cast<int>(reader->channels()));
  for (int level = 0; level < desc.level_count(); ++level) {
    const auto& dims = desc.dimensions(level);
    PrintKeyValue("  Level " + std::to_string(level),
                  std::to_string(dims.width) + " x " +
                      std::to_string(dims.height) + " (downsample " +
                      std::to_string(desc.downsample(level)) + ")");
  }
  return 0;
}

int ExtractCommand() {
  auto compression =
      slidemask::io::ParseTiffCompression(absl::GetFlag(FLAGS_compression));
  if (!compression.ok()) {
    std::cerr << "Error: " << compression.status().message() << '\n';
    return 1;
  }
  const int threshold = absl::GetFlag(FLAGS_mask_threshold);
  if (threshold < 0 || threshold > 254) {
    std::cerr << "Error: --mask_threshold must be in [0, 254]\n";
    return 1;
  }

  slidemask::PipelineOptions options;
  options.input_path = absl::GetFlag(FLAGS_input);
  options.annotations_path = absl::GetFlag(FLAGS_annotations);
  options.output_path = absl::GetFlag(FLAGS_output);
  options.temp_dir = absl::GetFlag(FLAGS_temp_dir);
  options.keep_intermediates = absl::GetFlag(FLAGS_keep_intermediates);
  options.compression = *compression;
  options.tile_size = absl::GetFlag(FLAGS_tile_size);
  options.mask_threshold = static_cast<uint8_t>(threshold);
  options.max_mask_levels = absl::GetFlag(FLAGS_max_mask_levels);
  options.levels = absl::GetFlag(FLAGS_levels);
  options.allow_empty_geometry = absl::GetFlag(FLAGS_allow_empty_geometry);

  PrintHeader("Tissue Extraction Pipeline");

  slidemask::TissuePipeline pipeline(std::move(options));
  pipeline.SetCancelFlag(&g_cancel_requested);
  InstallInterruptHandler();

  auto report = pipeline.Run();
  if (!report.ok()) {
    std::cerr << "\nError: Pipeline failed\n";
    std::cerr << "Status: " << report.status() << '\n';
    return 1;
  }

  PrintSummary(*report);
  return report->cancelled ? 130 : 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  extract  Extract tissue into a pyramidal RGBA TIFF\n";
  std::cerr << "  info     Show the pyramid levels of a TIFF file\n";
  std::cerr << "\n";
  std::cerr << "Extract options:\n";
  std::cerr << "  --input=<path>            Slide file (required)\n";
  std::cerr << "  --annotations=<path>      GeoJSON annotations (required)\n";
  std::cerr << "  --output=<path>           Output TIFF (required)\n";
  std::cerr << "  --levels=<list>           Levels, e.g. '0-3' (default: "
               "prompt)\n";
  std::cerr << "  --temp_dir=<path>         Intermediate file directory\n";
  std::cerr << "  --keep_intermediates      Keep the mask pyramid\n";
  std::cerr << "  --compression=<type>      none, lzw, deflate, packbits "
               "(default: lzw)\n";
  std::cerr << "  --tile_size=<pixels>      Tile size (default: 512)\n";
  std::cerr << "  --mask_threshold=<value>  Tissue threshold (default: 128)\n";
  std::cerr << "  --max_mask_levels=<n>     Mask level limit (default: 0)\n";
  std::cerr << "\n";
  std::cerr << "Info options:\n";
  std::cerr << "  --input=<path>            TIFF file (required)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name
            << " extract --input=tissue.svs --annotations=tissue.geojson "
               "--output=tissue_rgba.tiff\n";
  std::cerr << "  " << program_name
            << " extract --input=tissue.svs --annotations=mask.geojson "
               "--output=out.tiff --levels=0-3 --temp_dir=./temp\n";
  std::cerr << "  " << program_name << " info --input=tissue_rgba.tiff\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (absl::GetFlag(FLAGS_input).empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "extract") {
    if (absl::GetFlag(FLAGS_annotations).empty() ||
        absl::GetFlag(FLAGS_output).empty()) {
      std::cerr << "Error: --annotations and --output are required\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    return ExtractCommand();
  } else if (command == "info") {
    return InfoCommand(absl::GetFlag(FLAGS_input));
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
