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
#include <cstdint>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

#include "bitint/base/commandlineflags.h"
#include "bitint/bit_integer.h"
#include "bitint/util/status_macros.h"
#include "bitint/util/value_or_die.h"

BITINT_DEFINE_int32(
    bitint_karatsuba_base_bits, 1,
    "Multiplication switches from Karatsuba to shift-and-add once neither "
    "operand is longer than this many bits. Values below 1 act as 1.");

namespace bitint {

BitInteger MultiplyShiftAndAdd(const BitInteger& a, const BitInteger& b) {
  // Equivalent to the recursion
  //
  //   a * b = 2 * (a * floor(b / 2)) + (b odd ? a : 0)
  //
  // unrolled from the most significant bit of b down.
  BitInteger product;
  for (int i = b.length() - 1; i >= 0; --i) {
    product = product.Double();
    if (b.bit(i)) {
      product = Add(product, a);
    }
  }
  return product;
}

// Split a value into its low `m` bits and the remaining high bits.
inline std::pair<BitInteger, BitInteger> Split(const BitInteger& x, int m) {
  absl::Span<const bool> bits = x.bits();
  if (static_cast<int>(bits.size()) <= m) {
    return {x, BitInteger()};
  }
  return {BitInteger::FromBits(bits.first(m)),
          BitInteger::FromBits(bits.subspan(m))};
}

// Recursive step of Karatsuba multiplication. `base_bits` is the operand
// length at or below which we fall back to shift-and-add.
absl::StatusOr<BitInteger> KaratsubaMulRecursive(const BitInteger& a,
                                                 const BitInteger& b,
                                                 int base_bits) {
  const int n = std::max(a.length(), b.length());
  if (n <= base_bits) {
    return MultiplyShiftAndAdd(a, b);
  }

  // Writing each operand as x = x1 * 2^m + x0, where x0 holds the low m bits:
  //
  //   a * b = z2 * 2^(2m) + z1 * 2^m + z0
  //
  // with
  //   z2 = a1 * b1
  //   z0 = a0 * b0
  //   z1 = a1 * b0 + a0 * b1 = (a1 + a0) * (b1 + b0) - z2 - z0
  //
  // which takes three half-size multiplies rather than four. Both operands
  // are split at the same m so the identity holds.
  const int m = n / 2;
  auto [a0, a1] = Split(a, m);
  auto [b0, b1] = Split(b, m);

  ASSIGN_OR_RETURN(const BitInteger z2,
                   KaratsubaMulRecursive(a1, b1, base_bits));
  ASSIGN_OR_RETURN(const BitInteger z0,
                   KaratsubaMulRecursive(a0, b0, base_bits));
  ASSIGN_OR_RETURN(const BitInteger z3,
                   KaratsubaMulRecursive(Add(a1, a0), Add(b1, b0), base_bits));

  // (a1 + a0) * (b1 + b0) >= a1 * b1 + a0 * b0, so neither subtraction can
  // fail unless the split above is inconsistent.
  absl::StatusOr<BitInteger> z1 = Subtract(z3, z2);
  if (z1.ok()) {
    z1 = Subtract(*z1, z0);
  }
  if (!z1.ok()) {
    ABSL_LOG(ERROR) << "Karatsuba middle term is negative for " << a << " * "
                    << b << ": " << z1.status();
    return z1.status();
  }

  return Add(Add(z2.ShiftLeft(2 * m), z1->ShiftLeft(m)), z0);
}

absl::StatusOr<BitInteger> Multiply(const BitInteger& a, const BitInteger& b) {
  if (a.is_zero() || b.is_zero()) {
    return BitInteger();
  }

  const int base_bits =
      std::max<int32_t>(1, absl::GetFlag(FLAGS_bitint_karatsuba_base_bits));
  return KaratsubaMulRecursive(a, b, base_bits);
}

BitInteger& BitInteger::operator*=(const BitInteger& b) {
  return *this = ValueOrDie(Multiply(*this, b));
}

}  // namespace bitint
