// Copyright 2026 The BitInt Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS-IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef BITINT_UTIL_STATUS_MACROS_H_
#define BITINT_UTIL_STATUS_MACROS_H_

#include <utility>

#define BITINT_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define BITINT_STATUS_MACROS_CONCAT_(x, y) \
  BITINT_STATUS_MACROS_CONCAT_INNER_(x, y)

// Executes an expression that returns a StatusOr, extracting its value
// into the variable defined by lhs (or returning the status on error).
// May be used more than once in the same scope.
//
// Example:
//   absl::StatusOr<BitInteger> Difference(const BitInteger& a,
//                                         const BitInteger& b);
//   ASSIGN_OR_RETURN(BitInteger d, Difference(a, b));
#define ASSIGN_OR_RETURN(lhs, rhs)                                     \
  ASSIGN_OR_RETURN_IMPL_(                                              \
      BITINT_STATUS_MACROS_CONCAT_(status_or_value_, __LINE__), lhs, rhs)

#define ASSIGN_OR_RETURN_IMPL_(status_or, lhs, rhs)          \
  auto status_or = (rhs);                                    \
  if (!status_or.ok()) return std::move(status_or).status(); \
  lhs = *std::move(status_or)

#endif  // BITINT_UTIL_STATUS_MACROS_H_
