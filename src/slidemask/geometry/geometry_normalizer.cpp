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

#include "slidemask/geometry/geometry_normalizer.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "slidemask/status/errors.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace geometry {

namespace {

enum class RingRole { kExterior, kHole };

bool AllFinite(const Ring& ring) {
  return std::all_of(ring.begin(), ring.end(), [](const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
  });
}

size_t CountDistinct(const Ring& ring) {
  std::vector<std::pair<double, double>> points;
  points.reserve(ring.size());
  for (const Point& p : ring) {
    points.emplace_back(p.x, p.y);
  }
  std::sort(points.begin(), points.end());
  return static_cast<size_t>(
      std::unique(points.begin(), points.end()) - points.begin());
}

/// @brief Canonicalize one ring in place
/// @return false when the ring must be dropped
bool NormalizeRing(Ring& ring, RingRole role, NormalizationReport& report) {
  if (!AllFinite(ring)) {
    return false;
  }

  ring.erase(std::unique(ring.begin(), ring.end()), ring.end());
  if (CountDistinct(ring) < 3) {
    return false;
  }

  if (ring.front() != ring.back()) {
    ring.push_back(ring.front());
    ++report.rings_closed;
  }

  const double area = SignedArea(ring);
  const bool wants_positive = role == RingRole::kExterior;
  if ((wants_positive && area < 0.0) || (!wants_positive && area > 0.0)) {
    std::reverse(ring.begin(), ring.end());
    ++report.rings_reoriented;
  }
  return true;
}

bool IsOutside(const BoundingBox& bounds, const Dimensions& image) {
  return bounds.max_x <= 0.0 || bounds.max_y <= 0.0 ||
         bounds.min_x >= static_cast<double>(image.width) ||
         bounds.min_y >= static_cast<double>(image.height);
}

}  // namespace

absl::StatusOr<Geometry> NormalizeGeometry(const FeatureCollection& features,
                                           const Dimensions& base_dimensions,
                                           NormalizationReport* report) {
  NormalizationReport local_report;
  NormalizationReport& stats = report != nullptr ? *report : local_report;
  stats = NormalizationReport{};
  stats.features_seen = features.features.size();
  stats.crs = features.crs;

  if (features.crs.has_value()) {
    LOG(WARNING) << "Annotations declare CRS " << *features.crs
                 << "; coordinates are interpreted as level-0 pixels";
  }

  Geometry geometry;
  for (size_t f = 0; f < features.features.size(); ++f) {
    const Feature& feature = features.features[f];
    if (feature.geometry_type != "Polygon" &&
        feature.geometry_type != "MultiPolygon") {
      ++stats.skipped_types[feature.geometry_type];
      continue;
    }

    for (const Polygon& source : feature.polygons) {
      Polygon polygon;
      polygon.exterior = source.exterior;
      if (!NormalizeRing(polygon.exterior, RingRole::kExterior, stats)) {
        ++stats.rings_dropped;
        stats.rings_dropped += source.holes.size();
        LOG(WARNING) << "Dropping polygon of feature " << f
                     << ": degenerate or non-finite exterior ring";
        continue;
      }
      for (const Ring& hole : source.holes) {
        Ring ring = hole;
        if (!NormalizeRing(ring, RingRole::kHole, stats)) {
          ++stats.rings_dropped;
          LOG(WARNING) << "Dropping hole of feature " << f
                       << ": degenerate or non-finite ring";
          continue;
        }
        polygon.holes.push_back(std::move(ring));
      }
      stats.holes_kept += polygon.holes.size();
      geometry.polygons.push_back(std::move(polygon));
    }
  }
  stats.polygons_kept = geometry.polygons.size();

  for (const auto& [type, count] : stats.skipped_types) {
    LOG(WARNING) << "Skipped " << count << " feature(s) of unsupported type "
                 << type;
  }

  if (geometry.IsEmpty()) {
    return MAKE_ERROR(
        ErrorKind::kEmptyGeometry,
        slidemask::fmt::format("No polygon geometry among {} feature(s)",
                               stats.features_seen));
  }

  const auto bounds = geometry.Bounds();
  if (bounds.has_value() && IsOutside(*bounds, base_dimensions)) {
    stats.outside_image = true;
    LOG(WARNING) << "Annotation bounds [" << bounds->min_x << ", "
                 << bounds->min_y << "] - [" << bounds->max_x << ", "
                 << bounds->max_y << "] lie outside the " << base_dimensions
                 << " image";
  }

  LOG(INFO) << "Normalized " << stats.polygons_kept << " polygon(s) with "
            << stats.holes_kept << " hole(s) from " << stats.features_seen
            << " feature(s)";
  return geometry;
}

}  // namespace geometry
}  // namespace slidemask
