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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_ERRORS_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_ERRORS_H_

#include <optional>
#include <string_view>

#include "absl/status/status.h"
#include "slidemask/status/status_macros.h"

/**
 * @file errors.h
 * @brief Pipeline error taxonomy carried on absl::Status payloads
 *
 * Every pipeline failure is an absl::Status with a canonical code and a
 * payload naming its ErrorKind. The payload survives RETURN_IF_ERROR and
 * ASSIGN_OR_RETURN, so callers can branch on the kind after any number of
 * propagation steps.
 */

namespace slidemask {

/// @brief Failure categories of the tissue pipeline
enum class ErrorKind {
  kUnreadablePyramid,   ///< Source pyramid is empty or malformed (fatal)
  kEmptyGeometry,       ///< No polygon survived normalization (reported)
  kNoUsableLevels,      ///< Image and mask share no level (fatal)
  kInvalidLevelSpec,    ///< Level selection string rejected (re-prompt)
  kRasterizationError,  ///< A mask tile disagrees with its bounds
  kTileIOError,         ///< Tile read or write failed during compositing
};

/// @brief Payload type URL under which the error kind is stored
inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.slidemask/error-kind";

/// @brief Get the display name of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnreadablePyramid:
      return "UnreadablePyramid";
    case ErrorKind::kEmptyGeometry:
      return "EmptyGeometry";
    case ErrorKind::kNoUsableLevels:
      return "NoUsableLevels";
    case ErrorKind::kInvalidLevelSpec:
      return "InvalidLevelSpec";
    case ErrorKind::kRasterizationError:
      return "RasterizationError";
    case ErrorKind::kTileIOError:
      return "TileIOError";
  }
  return "unknown";
}

/// @brief Canonical status code used for an error kind
constexpr absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnreadablePyramid:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kEmptyGeometry:
      return absl::StatusCode::kNotFound;
    case ErrorKind::kNoUsableLevels:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kInvalidLevelSpec:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kRasterizationError:
      return absl::StatusCode::kInternal;
    case ErrorKind::kTileIOError:
      return absl::StatusCode::kAborted;
  }
  return absl::StatusCode::kUnknown;
}

/// @brief Attach an error kind to a status
/// @return The same status with the kind payload set (ok() is left alone)
absl::Status WithErrorKind(absl::Status status, ErrorKind kind);

/// @brief Read the error kind back from a status
/// @return The kind, or nullopt for ok() or untagged statuses
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

/// @brief Check whether a status carries the given error kind
inline bool IsErrorKind(const absl::Status& status, ErrorKind kind) {
  auto found = GetErrorKind(status);
  return found.has_value() && *found == kind;
}

}  // namespace slidemask

/**
 * @brief Create a traced status tagged with an ErrorKind.
 *
 * @param kind     A slidemask::ErrorKind value.
 * @param message  The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_ERROR(kind, message)                                          \
  ::slidemask::WithErrorKind(                                              \
      MAKE_STATUS(::slidemask::GetStatusCode(kind), (message)), (kind))

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_ERRORS_H_
