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

// BitIntError is a simple class consisting of an error code and a
// human-readable error message. Fallible BitInteger operations report
// failures as absl::Status; ToStatus() and ToBitIntError() convert between
// the two representations without losing the error code.

#ifndef BITINT_BIT_INTEGER_ERROR_H_
#define BITINT_BIT_INTEGER_ERROR_H_

#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace bitint {

// This class is intended to be copied by value as desired.  It uses
// the default copy constructor and assignment operator.
class BitIntError {
 public:
  enum Code {
    OK = 0,                // No error.
    INVALID_FORMAT = 1,    // Input string contains a character not '0'/'1'.
    NEGATIVE_RESULT = 2,   // Subtrahend is larger than the minuend.
    DIVISION_BY_ZERO = 3,  // Divisor of a division or modulo is zero.
    INTEGER_OVERFLOW = 4,  // Value does not fit in the native integer type.
  };

  BitIntError() = default;
  BitIntError(Code code, absl::string_view text)
      : code_(code), text_(text) {}

  static BitIntError InvalidFormat(absl::string_view text) {
    return BitIntError(INVALID_FORMAT, text);
  }
  static BitIntError NegativeResult(absl::string_view text) {
    return BitIntError(NEGATIVE_RESULT, text);
  }
  static BitIntError DivisionByZero(absl::string_view text) {
    return BitIntError(DIVISION_BY_ZERO, text);
  }
  static BitIntError Overflow(absl::string_view text) {
    return BitIntError(INTEGER_OVERFLOW, text);
  }

  bool ok() const { return code_ == OK; }
  Code code() const { return code_; }
  const std::string& text() const { return text_; }

 private:
  Code code_ = OK;
  std::string text_;
};

// Returns a short name for the given code, e.g. "NEGATIVE_RESULT".
absl::string_view BitIntErrorCodeName(BitIntError::Code code);

// Converts a BitIntError to an absl::Status. Each code maps onto the closest
// canonical status code, and the exact BitIntError code is attached as a
// payload under kBitIntErrorPayloadUrl.
absl::Status ToStatus(const BitIntError& error);

// Converts an absl::Status produced by this library back to a BitIntError.
// Statuses without a payload are classified by their canonical code alone:
// kFailedPrecondition is NEGATIVE_RESULT, kOutOfRange is INTEGER_OVERFLOW and
// every other error, kInvalidArgument included, is INVALID_FORMAT. A
// DIVISION_BY_ZERO status that has lost its payload therefore comes back as
// INVALID_FORMAT.
BitIntError ToBitIntError(const absl::Status& status);

// Payload type URL used to carry the BitIntError code inside absl::Status.
inline constexpr absl::string_view kBitIntErrorPayloadUrl =
    "type.bitint/bitint.BitIntError.Code";

inline std::ostream& operator<<(std::ostream& os, const BitIntError& error) {
  return os << BitIntErrorCodeName(error.code()) << ": " << error.text();
}

}  // namespace bitint

#endif  // BITINT_BIT_INTEGER_ERROR_H_
