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

#include "bitint/bit_integer_error.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace bitint {

absl::string_view BitIntErrorCodeName(BitIntError::Code code) {
  switch (code) {
    case BitIntError::OK:
      return "OK";
    case BitIntError::INVALID_FORMAT:
      return "INVALID_FORMAT";
    case BitIntError::NEGATIVE_RESULT:
      return "NEGATIVE_RESULT";
    case BitIntError::DIVISION_BY_ZERO:
      return "DIVISION_BY_ZERO";
    case BitIntError::INTEGER_OVERFLOW:
      return "INTEGER_OVERFLOW";
  }
  return "UNKNOWN";
}

absl::Status ToStatus(const BitIntError& error) {
  absl::Status status;
  switch (error.code()) {
    case BitIntError::OK:
      return absl::OkStatus();

    case BitIntError::INVALID_FORMAT:
    case BitIntError::DIVISION_BY_ZERO:
      status = absl::InvalidArgumentError(error.text());
      break;

    case BitIntError::NEGATIVE_RESULT:
      status = absl::FailedPreconditionError(error.text());
      break;

    case BitIntError::INTEGER_OVERFLOW:
      status = absl::OutOfRangeError(error.text());
      break;
  }
  status.SetPayload(kBitIntErrorPayloadUrl,
                    absl::Cord(absl::StrCat(static_cast<int>(error.code()))));
  return status;
}

BitIntError ToBitIntError(const absl::Status& status) {
  if (status.ok()) {
    return BitIntError();
  }

  const absl::string_view message = status.message();

  // Prefer the exact code if the status came from ToStatus().
  const absl::optional<absl::Cord> payload =
      status.GetPayload(kBitIntErrorPayloadUrl);
  int code = 0;
  if (payload.has_value() &&
      absl::SimpleAtoi(std::string(*payload), &code) &&
      code > BitIntError::OK && code <= BitIntError::INTEGER_OVERFLOW) {
    return BitIntError(static_cast<BitIntError::Code>(code), message);
  }

  switch (status.code()) {
    case absl::StatusCode::kFailedPrecondition:
      return BitIntError::NegativeResult(message);

    case absl::StatusCode::kOutOfRange:
      return BitIntError::Overflow(message);

    default:
      return BitIntError::InvalidFormat(message);
  }
}

}  // namespace bitint
