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

#ifndef BITINT_UTIL_VALUE_OR_DIE_H_
#define BITINT_UTIL_VALUE_OR_DIE_H_

#include <utility>

#include "absl/log/absl_check.h"
#include "absl/status/statusor.h"

namespace bitint {

// Returns the value held by `v`, dying with the status message if `v` holds
// an error. Used where an operator overload has no way to report a status.
template <typename T>
T ValueOrDie(absl::StatusOr<T>&& v) {
  ABSL_CHECK_OK(v.status());
  return *std::move(v);
}

}  // namespace bitint

#endif  // BITINT_UTIL_VALUE_OR_DIE_H_
