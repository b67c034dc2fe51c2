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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_SELECTOR_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_SELECTOR_H_

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

/**
 * @file level_selector.h
 * @brief Parsing of pyramid level selections
 *
 * Accepted forms, case-insensitive and whitespace-tolerant:
 *
 *     ""  or "all"     every usable level
 *     "3"              a single index
 *     "0,1,2"          a list of indices
 *     "2-5"            an inclusive range
 *     "0,2-4,7"        any comma-separated combination
 *
 * Out-of-range, reversed, empty or non-numeric tokens reject the whole
 * selection with InvalidLevelSpec.
 */

namespace slidemask {
namespace pipeline {

/// @brief Parse a level selection against [0, max_levels)
/// @return Strictly ascending, duplicate-free level indices
absl::StatusOr<std::vector<int>> ParseLevelSelection(
    std::string_view selection, int max_levels);

/// @brief Every level in [0, max_levels)
std::vector<int> AllLevels(int max_levels);

/// @brief Summary shown before asking for a selection
std::string FormatLevelSelectionPrompt(int image_levels, int mask_levels,
                                       int max_levels);

/// @brief Ask for a selection on `out`, reading answers from `in`
///
/// Invalid answers are reported and the question is repeated. End of input
/// selects every level.
std::vector<int> PromptForLevels(std::istream& in, std::ostream& out,
                                 int image_levels, int mask_levels,
                                 int max_levels);

}  // namespace pipeline

using pipeline::AllLevels;
using pipeline::FormatLevelSelectionPrompt;
using pipeline::ParseLevelSelection;
using pipeline::PromptForLevels;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_PIPELINE_LEVEL_SELECTOR_H_
