// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


// Early-return helpers for functions returning absl::Status or
// absl::StatusOr<T>.

#ifndef CODEBOX_UTIL_STATUS_MACROS_H_
#define CODEBOX_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Returns the status of expr from the enclosing function unless it is OK.
#define CODEBOX_RETURN_IF_ERROR(expr)                                  \
  do {                                                                 \
    if (absl::Status codebox_status = (expr);                          \
        ABSL_PREDICT_FALSE(!codebox_status.ok())) {                    \
      return codebox_status;                                           \
    }                                                                  \
  } while (0)

// Evaluates a StatusOr<T> expression and either moves its value into lhs or
// returns its status. Expands to several statements and declares a local, so
// it needs braces around it inside a switch case.
#define CODEBOX_ASSIGN_OR_RETURN(lhs, rexpr)                              \
  CODEBOX_ASSIGN_OR_RETURN_IMPL_(CODEBOX_STATUS_MACROS_NAME_(__LINE__), lhs, \
                                 rexpr)

#define CODEBOX_STATUS_MACROS_NAME_(line) \
  CODEBOX_STATUS_MACROS_NAME_INNER_(line)
#define CODEBOX_STATUS_MACROS_NAME_INNER_(line) codebox_statusor_##line

#define CODEBOX_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                  \
    return std::move(statusor).status();                     \
  }                                                          \
  lhs = *std::move(statusor)

#endif  // CODEBOX_UTIL_STATUS_MACROS_H_
