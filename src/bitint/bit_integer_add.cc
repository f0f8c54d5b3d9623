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

#include <algorithm>
#include <utility>

#include "absl/log/absl_check.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "bitint/bit_integer.h"
#include "bitint/bit_integer_error.h"
#include "bitint/util/value_or_die.h"

namespace bitint {

// Computes a + b + carry for single bits and updates the carry.
//
// The sum bit is the parity of the three inputs and the carry out is their
// majority.
inline bool AddBit(bool a, bool b, bool* carry) {
  const bool sum = (a != b) != *carry;
  *carry = (a && b) || (a && *carry) || (b && *carry);
  return sum;
}

BitInteger Add(const BitInteger& a, const BitInteger& b) {
  const int size = std::max(a.length(), b.length());

  BitInteger out;
  bool carry = false;
  for (int i = 0; i < size; ++i) {
    out.Append(AddBit(a.bit(i), b.bit(i), &carry));
  }

  // The top sum bit can only be zero when there is a carry out, so the result
  // never has a leading zero.
  if (carry) {
    out.Append(true);
  }
  return out;
}

absl::StatusOr<BitInteger> Subtract(const BitInteger& a, const BitInteger& b) {
  if (a < b) {
    return ToStatus(BitIntError::NegativeResult(
        absl::StrCat("cannot subtract ", b.ToString(), " from smaller value ",
                     a.ToString())));
  }

  // With k = a.length(), complementing b within k bits gives 2^k - 1 - b, so
  //
  //   a + ~b + 1 = a - b + 2^k
  //
  // Since a >= b the sum lies in [2^k, 2^(k+1)) and dropping bit k leaves
  // a - b, possibly with leading zeros.
  const int k = a.length();
  BitInteger complement;
  for (int i = 0; i < k; ++i) {
    complement.Append(!b.bit(i));
  }

  const BitInteger sum = Add(Add(a, complement), BitInteger(1u));
  ABSL_DCHECK_EQ(sum.length(), k + 1);

  BitInteger out(BitInteger::BitVector(sum.bits_.begin(),
                                       sum.bits_.begin() + k));
  out.Normalize();
  return out;
}

BitInteger& BitInteger::operator+=(const BitInteger& b) {
  return *this = Add(*this, b);
}

BitInteger& BitInteger::operator-=(const BitInteger& b) {
  return *this = ValueOrDie(Subtract(*this, b));
}

}  // namespace bitint
