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

#include "slidemask/pipeline/level_selector.h"

#include <set>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "slidemask/status/errors.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace pipeline {

namespace {

absl::StatusOr<int> ParseIndex(std::string_view text, std::string_view token,
                               int max_levels) {
  int value = 0;
  // SimpleAtoi also accepts a sign, which is not part of the grammar
  const bool starts_with_digit =
      !text.empty() && absl::ascii_isdigit(static_cast<unsigned char>(text[0]));
  if (!starts_with_digit || !absl::SimpleAtoi(text, &value)) {
    return MAKE_ERROR(
        ErrorKind::kInvalidLevelSpec,
        slidemask::fmt::format("Invalid level '{}': not a number", token));
  }
  if (value >= max_levels) {
    return MAKE_ERROR(
        ErrorKind::kInvalidLevelSpec,
        slidemask::fmt::format("Invalid level '{}': valid levels are 0 to {}",
                               token, max_levels - 1));
  }
  return value;
}

}  // namespace

std::vector<int> AllLevels(int max_levels) {
  std::vector<int> levels;
  for (int level = 0; level < max_levels; ++level) {
    levels.push_back(level);
  }
  return levels;
}

absl::StatusOr<std::vector<int>> ParseLevelSelection(
    std::string_view selection, int max_levels) {
  const std::string normalized =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(selection));
  if (normalized.empty() || normalized == "all") {
    return AllLevels(max_levels);
  }
  if (max_levels <= 0) {
    return MAKE_ERROR(ErrorKind::kInvalidLevelSpec,
                      "No levels are available for selection");
  }

  std::set<int> selected;
  for (std::string_view raw : absl::StrSplit(normalized, ',')) {
    const std::string_view token = absl::StripAsciiWhitespace(raw);
    if (token.empty()) {
      return MAKE_ERROR(
          ErrorKind::kInvalidLevelSpec,
          slidemask::fmt::format("Empty level in '{}'", normalized));
    }

    const size_t dash = token.find('-');
    if (dash == std::string_view::npos) {
      absl::StatusOr<int> level = ParseIndex(token, token, max_levels);
      RETURN_IF_ERROR(level.status(), "Parsing level selection");
      selected.insert(*level);
      continue;
    }

    const std::string_view first =
        absl::StripAsciiWhitespace(token.substr(0, dash));
    const std::string_view last =
        absl::StripAsciiWhitespace(token.substr(dash + 1));
    absl::StatusOr<int> begin = ParseIndex(first, token, max_levels);
    RETURN_IF_ERROR(begin.status(), "Parsing level range");
    absl::StatusOr<int> end = ParseIndex(last, token, max_levels);
    RETURN_IF_ERROR(end.status(), "Parsing level range");
    if (*begin > *end) {
      return MAKE_ERROR(
          ErrorKind::kInvalidLevelSpec,
          slidemask::fmt::format("Invalid range '{}': start exceeds end",
                                 token));
    }
    for (int level = *begin; level <= *end; ++level) {
      selected.insert(level);
    }
  }

  return std::vector<int>(selected.begin(), selected.end());
}

std::string FormatLevelSelectionPrompt(int image_levels, int mask_levels,
                                       int max_levels) {
  std::string prompt;
  prompt += "Available pyramid levels:\n";
  prompt += slidemask::fmt::format("  Image levels:        {}\n", image_levels);
  prompt += slidemask::fmt::format("  Mask levels:         {}\n", mask_levels);
  prompt += slidemask::fmt::format("  Maximum processable: {}\n", max_levels);
  prompt += slidemask::fmt::format("  Level indices:       0 to {}\n",
                                   max_levels - 1);
  prompt += "Selection options:\n";
  prompt += "  Single level:    '0' or '2'\n";
  prompt += "  Multiple levels: '0,1,2' or '1,3,5'\n";
  prompt += "  Range:           '0-3' or '2-5'\n";
  prompt += "  All levels:      press Enter (default)\n";
  return prompt;
}

std::vector<int> PromptForLevels(std::istream& in, std::ostream& out,
                                 int image_levels, int mask_levels,
                                 int max_levels) {
  out << FormatLevelSelectionPrompt(image_levels, mask_levels, max_levels);

  std::string line;
  while (true) {
    out << "\nEnter pyramid levels to process (default: all): " << std::flush;
    if (!std::getline(in, line)) {
      LOG(WARNING) << "No level selection received, using all levels";
      return AllLevels(max_levels);
    }

    absl::StatusOr<std::vector<int>> levels =
        ParseLevelSelection(line, max_levels);
    if (levels.ok()) {
      LOG(INFO) << "Selected levels: " << absl::StrJoin(*levels, ",");
      return *std::move(levels);
    }
    out << status::StripStackTrace(levels.status().message()) << "\n";
  }
}

}  // namespace pipeline
}  // namespace slidemask
