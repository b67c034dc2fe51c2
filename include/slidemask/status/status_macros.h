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

#ifndef SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_STATUS_MACROS_H_
#define SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"

/**
 * @file status_macros.h
 * @brief absl::Status propagation with a readable call trace
 *
 * An error message consists of the root error text followed by one line per
 * function the error travelled through:
 *
 *     Cannot open TIFF file slide.svs for reading
 *       at Open (tiff_file.cpp:70) [NOT_FOUND] - Cannot open ...
 *       at Run (tissue_pipeline.cpp:95) [NOT_FOUND] - Opening slide
 *
 * Payloads such as the ErrorKind tag survive every frame.
 */

namespace slidemask::status {

inline constexpr std::string_view kFramePrefix = "\n  at ";

/// @brief Root error text of a traced message, without any frames
inline std::string StripStackTrace(std::string_view full_message) {
  return std::string(full_message.substr(0, full_message.find(kFramePrefix)));
}

/// @brief Append one frame for `function` to a non-ok status
inline absl::Status AddTrace(const absl::Status& st, const char* function,
                             const char* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }

  std::string traced(st.message());
  traced.append(kFramePrefix);
  traced.append(function);
  traced.append(" (");
  traced.append(file);
  traced.push_back(':');
  traced.append(std::to_string(line));
  traced.append(") [");
  traced.append(absl::StatusCodeToString(st.code()));
  traced.push_back(']');
  if (!message.empty()) {
    traced.append(" - ");
    traced.append(message);
  }

  absl::Status result(st.code(), traced);
  st.ForEachPayload([&result](std::string_view type_url,
                              const absl::Cord& payload) {
    result.SetPayload(type_url, payload);
  });
  return result;
}

template <typename T>
absl::StatusOr<T> AddTrace(const absl::StatusOr<T>& sor, const char* function,
                           const char* file, int line,
                           std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace slidemask::status

/// @brief New error status carrying its first frame
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                         \
  ::slidemask::status::AddTrace(absl::Status((code), (message)), __func__, \
                                __FILE__, __LINE__, (message))

/// @brief Return `expr` from the caller with an extra frame when it failed
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define RETURN_IF_ERROR(expr, msg)                                      \
  do {                                                                  \
    auto _slidemask_status = (expr);                                    \
    if (!_slidemask_status.ok()) {                                      \
      return ::slidemask::status::AddTrace(_slidemask_status, __func__, \
                                           __FILE__, __LINE__, (msg));  \
    }                                                                   \
  } while (0)

/// @brief Move the value of a StatusOr into `lhs`, or return its error
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                  \
  do {                                                                    \
    auto _slidemask_statusor = (expr);                                    \
    if (!_slidemask_statusor.ok()) {                                      \
      return ::slidemask::status::AddTrace(_slidemask_statusor.status(),  \
                                           __func__, __FILE__, __LINE__,  \
                                           ##__VA_ARGS__);                \
    }                                                                     \
    lhs = std::move(_slidemask_statusor).value();                         \
  } while (0)

/// @brief Declare `name` of a default-constructible `type` and assign it
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // SLIDEMASK_INCLUDE_SLIDEMASK_STATUS_STATUS_MACROS_H_
