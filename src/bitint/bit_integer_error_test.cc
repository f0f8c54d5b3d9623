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

#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include "absl/status/status.h"

namespace bitint {
namespace {

TEST(BitIntError, Basic) {
  const BitIntError error = BitIntError::NegativeResult("9 - 24");
  EXPECT_FALSE(error.ok());
  EXPECT_EQ(error.code(), BitIntError::NEGATIVE_RESULT);
  EXPECT_EQ(error.text(), "9 - 24");

  EXPECT_TRUE(BitIntError().ok());
  EXPECT_EQ(BitIntError().code(), BitIntError::OK);
}

TEST(BitIntError, StreamOutput) {
  std::ostringstream os;
  os << BitIntError::DivisionByZero("1 / 0");
  EXPECT_EQ(os.str(), "DIVISION_BY_ZERO: 1 / 0");
}

TEST(BitIntError, ToStatus) {
  EXPECT_TRUE(ToStatus(BitIntError()).ok());

  const absl::Status invalid_format =
      ToStatus(BitIntError::InvalidFormat("invalid_format"));
  EXPECT_EQ(invalid_format.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(invalid_format.message(), "invalid_format");

  const absl::Status negative_result =
      ToStatus(BitIntError::NegativeResult("negative_result"));
  EXPECT_EQ(negative_result.code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(negative_result.message(), "negative_result");

  const absl::Status division_by_zero =
      ToStatus(BitIntError::DivisionByZero("division_by_zero"));
  EXPECT_EQ(division_by_zero.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(division_by_zero.message(), "division_by_zero");

  const absl::Status overflow =
      ToStatus(BitIntError::Overflow("integer_overflow"));
  EXPECT_EQ(overflow.code(), absl::StatusCode::kOutOfRange);
  EXPECT_EQ(overflow.message(), "integer_overflow");
}

TEST(BitIntError, RoundTripKeepsCode) {
  for (BitIntError::Code code :
       {BitIntError::INVALID_FORMAT, BitIntError::NEGATIVE_RESULT,
        BitIntError::DIVISION_BY_ZERO, BitIntError::INTEGER_OVERFLOW}) {
    const BitIntError error(code, "message");
    const BitIntError round_trip = ToBitIntError(ToStatus(error));
    EXPECT_EQ(round_trip.code(), code) << BitIntErrorCodeName(code);
    EXPECT_EQ(round_trip.text(), "message");
  }
}

TEST(BitIntError, ToBitIntErrorWithoutPayload) {
  EXPECT_TRUE(ToBitIntError(absl::OkStatus()).ok());
  EXPECT_EQ(ToBitIntError(absl::FailedPreconditionError("x")).code(),
            BitIntError::NEGATIVE_RESULT);
  EXPECT_EQ(ToBitIntError(absl::OutOfRangeError("x")).code(),
            BitIntError::INTEGER_OVERFLOW);
  EXPECT_EQ(ToBitIntError(absl::InvalidArgumentError("x")).code(),
            BitIntError::INVALID_FORMAT);
}

TEST(BitIntError, DivisionByZeroNeedsPayloadToRoundTrip) {
  absl::Status status = ToStatus(BitIntError::DivisionByZero("1 / 0"));
  EXPECT_EQ(ToBitIntError(status).code(), BitIntError::DIVISION_BY_ZERO);

  ASSERT_TRUE(status.ErasePayload(kBitIntErrorPayloadUrl));
  const BitIntError without_payload = ToBitIntError(status);
  EXPECT_EQ(without_payload.code(), BitIntError::INVALID_FORMAT);
  EXPECT_EQ(without_payload.text(), "1 / 0");
}

TEST(BitIntError, CodeNames) {
  EXPECT_EQ(BitIntErrorCodeName(BitIntError::OK), "OK");
  EXPECT_EQ(BitIntErrorCodeName(BitIntError::INVALID_FORMAT),
            "INVALID_FORMAT");
  EXPECT_EQ(BitIntErrorCodeName(BitIntError::INTEGER_OVERFLOW),
            "INTEGER_OVERFLOW");
}

}  // namespace
}  // namespace bitint
