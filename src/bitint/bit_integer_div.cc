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

#include <utility>

#include "absl/log/absl_check.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "bitint/bit_integer.h"
#include "bitint/bit_integer_error.h"
#include "bitint/util/status_macros.h"
#include "bitint/util/value_or_die.h"

namespace bitint {

absl::StatusOr<DivModResult> DivMod(const BitInteger& a, const BitInteger& b) {
  if (b.is_zero()) {
    return ToStatus(BitIntError::DivisionByZero(
        absl::StrCat("cannot divide ", a.ToString(), " by zero")));
  }

  // Binary long division. The recursive definition is
  //
  //   divmod(0, b) = (0, 0)
  //   divmod(a, b) = correct(2q, 2r + (a odd ? 1 : 0))
  //                    where (q, r) = divmod(floor(a / 2), b)
  //
  // where correct() subtracts b from the remainder once (and adds one to the
  // quotient) if the remainder reached b. Unwinding the recursion consumes
  // the bits of a from the most significant down, which is what the loop
  // below does so that stack depth does not grow with the operand.
  //
  // Before the correction 0 <= r < 2b, after it 0 <= r < b.
  const BitInteger one(1u);
  BitInteger q, r;
  for (int i = a.length() - 1; i >= 0; --i) {
    q = q.Double();
    r = r.Double();
    if (a.bit(i)) {
      r = Add(r, one);
    }
    if (r >= b) {
      ASSIGN_OR_RETURN(r, Subtract(r, b));
      q = Add(q, one);
    }
    ABSL_DCHECK(r < b);
  }
  return DivModResult{std::move(q), std::move(r)};
}

absl::StatusOr<BitInteger> Divide(const BitInteger& a, const BitInteger& b) {
  ASSIGN_OR_RETURN(DivModResult result, DivMod(a, b));
  return std::move(result.quotient);
}

absl::StatusOr<BitInteger> Mod(const BitInteger& a, const BitInteger& b) {
  ASSIGN_OR_RETURN(DivModResult result, DivMod(a, b));
  return std::move(result.remainder);
}

BitInteger& BitInteger::operator/=(const BitInteger& b) {
  return *this = ValueOrDie(Divide(*this, b));
}

BitInteger& BitInteger::operator%=(const BitInteger& b) {
  return *this = ValueOrDie(Mod(*this, b));
}

}  // namespace bitint
