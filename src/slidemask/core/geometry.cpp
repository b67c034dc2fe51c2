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

#include "slidemask/core/geometry.h"

#include <algorithm>
#include <optional>

namespace slidemask {
namespace core {

std::optional<BoundingBox> Geometry::Bounds() const {
  std::optional<BoundingBox> bounds;
  for (const auto& polygon : polygons) {
    for (const Point& p : polygon.exterior) {
      if (!bounds.has_value()) {
        bounds = BoundingBox{
            .min_x = p.x, .min_y = p.y, .max_x = p.x, .max_y = p.y};
        continue;
      }
      bounds->min_x = std::min(bounds->min_x, p.x);
      bounds->min_y = std::min(bounds->min_y, p.y);
      bounds->max_x = std::max(bounds->max_x, p.x);
      bounds->max_y = std::max(bounds->max_y, p.y);
    }
  }
  return bounds;
}

double SignedArea(const Ring& ring) {
  if (ring.size() < 3) {
    return 0.0;
  }
  double twice_area = 0.0;
  for (size_t i = 0; i < ring.size(); ++i) {
    const Point& a = ring[i];
    const Point& b = ring[(i + 1) % ring.size()];
    twice_area += a.x * b.y - b.x * a.y;
  }
  return twice_area / 2.0;
}

}  // namespace core
}  // namespace slidemask
