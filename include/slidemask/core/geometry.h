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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_CORE_GEOMETRY_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_CORE_GEOMETRY_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @file geometry.h
 * @brief Vector tissue annotations in level-0 pixel coordinates
 *
 * A Geometry is an ordered list of polygons. Each polygon has one exterior
 * ring and zero or more hole rings. Rings are closed point sequences: the
 * first and the last point coincide.
 */

namespace slidemask {
namespace core {

/// @brief 2D point in level-0 pixel space (x to the right, y downwards)
struct Point {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Point& other) const = default;
};

/// @brief Closed sequence of points
using Ring = std::vector<Point>;

/// @brief Polygon with an exterior ring and optional holes
struct Polygon {
  Ring exterior;
  std::vector<Ring> holes;
};

/// @brief Axis-aligned bounds of a point set
struct BoundingBox {
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;
};

/// @brief Normalized annotation geometry
struct Geometry {
  std::vector<Polygon> polygons;

  [[nodiscard]] bool IsEmpty() const { return polygons.empty(); }

  /// @brief Bounds of all exterior rings, nullopt for empty geometry
  [[nodiscard]] std::optional<BoundingBox> Bounds() const;
};

/// @brief Signed area of a ring by the shoelace formula
///
/// Positive when the ring runs clockwise on screen (y pointing down), which
/// is counter-clockwise in a y-up frame. The ring may be open or closed.
double SignedArea(const Ring& ring);

/// @brief A single annotation feature as read from a GeoJSON document
///
/// Polygon features carry one polygon, MultiPolygon features carry one per
/// member. Features of any other type carry no polygons; their type is kept
/// so the normalizer can report them.
struct Feature {
  std::string geometry_type;
  std::vector<Polygon> polygons;
};

/// @brief All features of an annotation document
struct FeatureCollection {
  std::vector<Feature> features;
  std::optional<std::string> crs;  ///< Declared CRS name, if any
};

}  // namespace core

using core::BoundingBox;
using core::Feature;
using core::FeatureCollection;
using core::Geometry;
using core::Point;
using core::Polygon;
using core::Ring;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_CORE_GEOMETRY_H_
