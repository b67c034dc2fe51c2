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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_GEOMETRY_GEOMETRY_NORMALIZER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_GEOMETRY_GEOMETRY_NORMALIZER_H_

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "slidemask/core/geometry.h"
#include "slidemask/core/types.h"

/**
 * @file geometry_normalizer.h
 * @brief Annotation features to canonical polygon rings
 *
 * The normalizer turns the features of an annotation document into a flat
 * Geometry in level-0 pixel coordinates:
 *
 * - Polygon features become one polygon, MultiPolygon members become
 *   independent polygons, other geometry types are skipped.
 * - Rings with non-finite coordinates or fewer than three distinct vertices
 *   are dropped; a polygon whose exterior is dropped is dropped entirely.
 * - Open rings are closed and repeated consecutive vertices are removed.
 * - Exteriors are oriented to positive signed area and holes to negative
 *   signed area, so that the non-zero winding rule yields the union of all
 *   polygons minus their holes.
 *
 * Coordinates outside the image are kept; they are clipped per tile.
 */

namespace slidemask {
namespace geometry {

/// @brief What happened during normalization
struct NormalizationReport {
  size_t features_seen = 0;     ///< Features in the input
  size_t polygons_kept = 0;     ///< Polygons in the output
  size_t holes_kept = 0;        ///< Hole rings in the output
  size_t rings_dropped = 0;     ///< Degenerate or non-finite rings removed
  size_t rings_closed = 0;      ///< Open rings that were closed
  size_t rings_reoriented = 0;  ///< Rings whose orientation was flipped
  /// Skipped feature count per unsupported geometry type
  std::map<std::string, size_t> skipped_types;
  std::optional<std::string> crs;  ///< Declared CRS, if any
  bool outside_image = false;  ///< Geometry lies entirely outside the image
};

/// @brief Normalize annotation features against the image size
/// @param features Parsed annotation document
/// @param base_dimensions Level-0 dimensions of the image pyramid
/// @param report Optional sink for normalization statistics
/// @return Canonical geometry, or EmptyGeometry when no polygon remains
absl::StatusOr<Geometry> NormalizeGeometry(
    const FeatureCollection& features, const Dimensions& base_dimensions,
    NormalizationReport* report = nullptr);

}  // namespace geometry

using geometry::NormalizationReport;
using geometry::NormalizeGeometry;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_GEOMETRY_GEOMETRY_NORMALIZER_H_
