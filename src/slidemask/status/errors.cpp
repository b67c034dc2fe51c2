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

#include "slidemask/status/errors.h"

#include <array>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/cord.h"

namespace slidemask {

namespace {

constexpr std::array<ErrorKind, 6> kAllKinds = {
    ErrorKind::kUnreadablePyramid,  ErrorKind::kEmptyGeometry,
    ErrorKind::kNoUsableLevels,     ErrorKind::kInvalidLevelSpec,
    ErrorKind::kRasterizationError, ErrorKind::kTileIOError,
};

}  // namespace

absl::Status WithErrorKind(absl::Status status, ErrorKind kind) {
  if (status.ok()) {
    return status;
  }
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(GetName(kind)));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  const std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace slidemask
