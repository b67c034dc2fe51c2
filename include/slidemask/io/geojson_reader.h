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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_IO_GEOJSON_READER_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_IO_GEOJSON_READER_H_

#include <filesystem>
#include <string_view>

#include "absl/status/statusor.h"
#include "slidemask/core/geometry.h"

/**
 * @file geojson_reader.h
 * @brief GeoJSON annotation documents to FeatureCollection
 *
 * Accepted top-level forms:
 * - a FeatureCollection (its "features" member is required);
 * - a bare array of Features, as exported by QuPath;
 * - a single Feature;
 * - a bare Polygon or MultiPolygon geometry.
 *
 * Coordinates are taken as level-0 pixel positions; a third ordinate is
 * ignored. Features with other geometry types are kept with their type name
 * and no polygons.
 */

namespace slidemask {
namespace io {

/// @brief Parse a GeoJSON document held in memory
/// @return Features, or InvalidArgument describing the first structural error
absl::StatusOr<FeatureCollection> ParseGeoJson(std::string_view text);

/// @brief Read and parse a GeoJSON file
/// @return Features, NotFound when the file cannot be read, or a parse error
absl::StatusOr<FeatureCollection> ReadGeoJsonFile(
    const std::filesystem::path& path);

}  // namespace io

using io::ParseGeoJson;
using io::ReadGeoJsonFile;

}  // namespace slidemask

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_IO_GEOJSON_READER_H_
