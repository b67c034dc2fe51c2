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

#include "slidemask/io/geojson_reader.h"

#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "slidemask/status/status_macros.h"
#include "slidemask/utilities/fmt.h"

namespace slidemask {
namespace io {

namespace {

absl::StatusOr<Point> ParsePosition(const Json::Value& position) {
  if (!position.isArray() || position.size() < 2 ||
      !position[0].isNumeric() || !position[1].isNumeric()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Position must be an array of at least two numbers");
  }
  return Point{.x = position[0].asDouble(), .y = position[1].asDouble()};
}

absl::StatusOr<Ring> ParseRing(const Json::Value& ring) {
  if (!ring.isArray()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Linear ring must be an array of positions");
  }
  Ring out;
  out.reserve(ring.size());
  for (Json::ArrayIndex i = 0; i < ring.size(); ++i) {
    DECLARE_ASSIGN_OR_RETURN(Point, point, ParsePosition(ring[i]),
                             slidemask::fmt::format("Position {}", i));
    out.push_back(point);
  }
  return out;
}

absl::StatusOr<Polygon> ParsePolygonCoordinates(const Json::Value& rings) {
  if (!rings.isArray()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Polygon coordinates must be an array of rings");
  }
  Polygon polygon;
  for (Json::ArrayIndex i = 0; i < rings.size(); ++i) {
    DECLARE_ASSIGN_OR_RETURN(Ring, ring, ParseRing(rings[i]),
                             slidemask::fmt::format("Ring {}", i));
    if (i == 0) {
      polygon.exterior = std::move(ring);
    } else {
      polygon.holes.push_back(std::move(ring));
    }
  }
  return polygon;
}

/// @brief Parse a geometry object into a feature
absl::StatusOr<Feature> ParseGeometry(const Json::Value& geometry) {
  Feature feature;
  if (geometry.isNull()) {
    feature.geometry_type = "null";
    return feature;
  }
  if (!geometry.isObject() || !geometry["type"].isString()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Geometry must be an object with a string 'type'");
  }
  feature.geometry_type = geometry["type"].asString();
  const Json::Value& coordinates = geometry["coordinates"];

  if (feature.geometry_type == "Polygon") {
    DECLARE_ASSIGN_OR_RETURN(Polygon, polygon,
                             ParsePolygonCoordinates(coordinates), "Polygon");
    feature.polygons.push_back(std::move(polygon));
  } else if (feature.geometry_type == "MultiPolygon") {
    if (!coordinates.isArray()) {
      return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                         "MultiPolygon coordinates must be an array");
    }
    for (Json::ArrayIndex i = 0; i < coordinates.size(); ++i) {
      DECLARE_ASSIGN_OR_RETURN(
          Polygon, polygon, ParsePolygonCoordinates(coordinates[i]),
          slidemask::fmt::format("MultiPolygon member {}", i));
      feature.polygons.push_back(std::move(polygon));
    }
  }
  return feature;
}

absl::StatusOr<Feature> ParseFeature(const Json::Value& feature) {
  if (!feature.isObject()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Feature must be an object");
  }
  if (feature["type"].isString() && feature["type"].asString() != "Feature") {
    // A geometry used directly where a feature is expected
    return ParseGeometry(feature);
  }
  return ParseGeometry(feature["geometry"]);
}

absl::Status ParseFeatureArray(const Json::Value& features,
                               FeatureCollection& collection) {
  for (Json::ArrayIndex i = 0; i < features.size(); ++i) {
    DECLARE_ASSIGN_OR_RETURN(Feature, feature, ParseFeature(features[i]),
                             slidemask::fmt::format("Feature {}", i));
    collection.features.push_back(std::move(feature));
  }
  return absl::OkStatus();
}

std::string DescribeCrs(const Json::Value& crs) {
  if (crs.isObject() && crs["properties"].isObject() &&
      crs["properties"]["name"].isString()) {
    return crs["properties"]["name"].asString();
  }
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, crs);
}

}  // namespace

absl::StatusOr<FeatureCollection> ParseGeoJson(std::string_view text) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Invalid JSON: " + errors);
  }

  FeatureCollection collection;

  if (root.isArray()) {
    RETURN_IF_ERROR(ParseFeatureArray(root, collection), "Feature array");
    return collection;
  }
  if (!root.isObject() || !root["type"].isString()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "GeoJSON root must be an object with a string 'type'");
  }

  if (root.isMember("crs") && !root["crs"].isNull()) {
    collection.crs = DescribeCrs(root["crs"]);
  }

  const std::string type = root["type"].asString();
  if (type == "FeatureCollection") {
    if (!root["features"].isArray()) {
      return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                         "Invalid GeoJSON: missing 'features'");
    }
    RETURN_IF_ERROR(ParseFeatureArray(root["features"], collection),
                    "FeatureCollection");
    return collection;
  }

  DECLARE_ASSIGN_OR_RETURN(Feature, feature, ParseFeature(root),
                           "Top-level object");
  collection.features.push_back(std::move(feature));
  return collection;
}

absl::StatusOr<FeatureCollection> ReadGeoJsonFile(
    const std::filesystem::path& path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return MAKE_STATUS(
        absl::StatusCode::kNotFound,
        slidemask::fmt::format("Cannot read annotations file {}",
                               path.string()));
  }
  std::ostringstream buffer;
  buffer << stream.rdbuf();

  absl::StatusOr<FeatureCollection> collection = ParseGeoJson(buffer.str());
  RETURN_IF_ERROR(collection.status(), path.string());
  return collection;
}

}  // namespace io
}  // namespace slidemask
