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

#ifndef BITINT_BIT_INTEGER_H_
#define BITINT_BIT_INTEGER_H_

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/container/inlined_vector.h"
#include "absl/log/absl_check.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

#include "bitint/base/commandlineflags_declare.h"
#include "bitint/bit_integer_error.h"

// Multiplication falls back to shift-and-add once both operands are at most
// this many bits long.
BITINT_DECLARE_int32(bitint_karatsuba_base_bits);

namespace bitint {

// An unsigned integer of arbitrary precision, stored one bit per element.
//
// Every arithmetic operation is built out of explicit bit manipulation:
// ripple-carry addition, subtraction by two's complement addition,
// Karatsuba multiplication and binary long division. Values are immutable
// from the point of view of the arithmetic operations, which always return a
// new BitInteger.
class BitInteger {
 public:
  // Bits, least significant first. The first 64 bits are stored inline.
  using BitVector = absl::InlinedVector<bool, 64>;

  // Constructs the value zero.
  BitInteger() = default;

  // Constructs a BitInteger from an unsigned native integer.
  template <typename T,
            typename = std::enable_if_t<std::is_unsigned_v<T> &&
                                        !std::is_same_v<T, bool>>>
  explicit BitInteger(T value);

  //--------------------------------------
  // Construction and rendering.
  //--------------------------------------

  // Parses a binary literal, most significant digit first. Leading zeros are
  // accepted and dropped; the empty string is zero. Any character other than
  // '0' or '1' yields an INVALID_FORMAT error.
  static absl::StatusOr<BitInteger> FromBinaryString(absl::string_view s);

  // Builds a value from bits given least significant first.
  static BitInteger FromBits(absl::Span<const bool> bits);

  // Appends `bit` as the new most significant bit.
  //
  // Zero bits are held back until a one bit arrives, so the value never
  // acquires leading zeros: appending 0, 1, 0, 0 yields "10". Only zeros
  // appended to this object are held back; values returned by the parsing,
  // shift and arithmetic functions hold none, so appending to equal values
  // always gives equal results.
  void Append(bool bit);

  // Renders the value in binary, most significant digit first. Zero is "0".
  std::string ToString() const;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const BitInteger& b) {
    sink.Append(b.ToString());
  }

  friend std::ostream& operator<<(std::ostream& os, const BitInteger& b) {
    return os << b.ToString();
  }

  //--------------------------------------
  // Conversion to native integers.
  //--------------------------------------

  // Returns true if the value can be stored in T without truncation.
  template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  bool FitsIn() const {
    return length() <= std::numeric_limits<T>::digits;
  }

  // Returns the value as a T, or an INTEGER_OVERFLOW error if it doesn't fit.
  template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  absl::StatusOr<T> ConvertTo() const;

  absl::StatusOr<uint64_t> ToUint64() const { return ConvertTo<uint64_t>(); }

  //--------------------------------------
  // General accessors.
  //--------------------------------------

  // Returns the number of significant bits (0 for zero).
  int length() const { return static_cast<int>(bits_.size()); }

  // Returns the bits of the value, least significant first. The most
  // significant element is always true.
  absl::Span<const bool> bits() const { return bits_; }

  // Returns bit `n`, counting from the least significant bit. Bits past
  // length() are zero.
  bool bit(int n) const {
    ABSL_DCHECK_GE(n, 0);
    return n < length() && bits_[n];
  }

  bool is_zero() const { return bits_.empty(); }
  bool is_odd() const { return !bits_.empty() && bits_[0]; }
  bool is_even() const { return !is_odd(); }

  //--------------------------------------
  // Shifts.
  //--------------------------------------

  // Returns floor(*this / 2).
  BitInteger Halve() const { return ShiftRight(1); }

  // Returns *this * 2.
  BitInteger Double() const { return ShiftLeft(1); }

  // Returns *this * 2^nbit, by inserting nbit zeros below the lowest bit.
  BitInteger ShiftLeft(int nbit) const;

  // Returns floor(*this / 2^nbit), by dropping the nbit lowest bits.
  BitInteger ShiftRight(int nbit) const;

  BitInteger& operator<<=(int nbit) { return *this = ShiftLeft(nbit); }
  BitInteger& operator>>=(int nbit) { return *this = ShiftRight(nbit); }
  friend BitInteger operator<<(const BitInteger& a, int nbit) {
    return a.ShiftLeft(nbit);
  }
  friend BitInteger operator>>(const BitInteger& a, int nbit) {
    return a.ShiftRight(nbit);
  }

  //--------------------------------------
  // Comparisons.
  //--------------------------------------

  // Compares to another value, returning -1, 0, +1. A shorter value is
  // smaller; values of equal length compare from the most significant bit.
  int Compare(const BitInteger& b) const;

  bool operator==(const BitInteger& b) const { return bits_ == b.bits_; }
  bool operator!=(const BitInteger& b) const { return !(*this == b); }
  bool operator<(const BitInteger& b) const { return Compare(b) < 0; }
  bool operator<=(const BitInteger& b) const { return Compare(b) <= 0; }
  bool operator>(const BitInteger& b) const { return Compare(b) > 0; }
  bool operator>=(const BitInteger& b) const { return Compare(b) >= 0; }

  //--------------------------------------
  // Arithmetic operators.
  //
  // These forward to the functions declared below the class. Operators that
  // can fail (subtraction of a larger value, division by zero) die with the
  // corresponding status; call the functions directly to handle the error.
  //--------------------------------------

  BitInteger& operator+=(const BitInteger& b);
  BitInteger& operator-=(const BitInteger& b);
  BitInteger& operator*=(const BitInteger& b);
  BitInteger& operator/=(const BitInteger& b);
  BitInteger& operator%=(const BitInteger& b);

  friend BitInteger operator+(BitInteger a, const BitInteger& b) {
    return a += b;
  }
  friend BitInteger operator-(BitInteger a, const BitInteger& b) {
    return a -= b;
  }
  friend BitInteger operator*(BitInteger a, const BitInteger& b) {
    return a *= b;
  }
  friend BitInteger operator/(BitInteger a, const BitInteger& b) {
    return a /= b;
  }
  friend BitInteger operator%(BitInteger a, const BitInteger& b) {
    return a %= b;
  }

 private:
  friend absl::StatusOr<BitInteger> Subtract(const BitInteger& a,
                                             const BitInteger& b);

  // Takes ownership of `bits` as is. The caller must call Normalize() if the
  // bits may have leading zeros.
  explicit BitInteger(BitVector bits) : bits_(std::move(bits)) {}

  // Drops leading (most significant) zero bits and any buffered zeros.
  void Normalize();

  // Returns true if there are no leading zero bits.
  bool IsNormalized() const { return bits_.empty() || bits_.back(); }

  // bits_ holds the value least significant bit first, and never has a zero
  // most significant bit, so zero is the empty vector. pending_zeros_ counts
  // zero bits passed to Append() that are not yet part of the value because
  // no one bit has followed them.
  BitVector bits_;
  int pending_zeros_ = 0;
};

// Result of DivMod().
struct DivModResult {
  BitInteger quotient;
  BitInteger remainder;
};

// Returns a + b by ripple-carry addition.
BitInteger Add(const BitInteger& a, const BitInteger& b);

// Returns a - b. Fails with NEGATIVE_RESULT if b > a.
absl::StatusOr<BitInteger> Subtract(const BitInteger& a, const BitInteger& b);

// Returns a * b using Karatsuba's algorithm. The split point at each step is
// half the length of the longer operand (rounded down), and recursion stops
// at --bitint_karatsuba_base_bits bits. A NEGATIVE_RESULT error means the
// middle Karatsuba term came out negative, which is an internal bug.
absl::StatusOr<BitInteger> Multiply(const BitInteger& a, const BitInteger& b);

// Returns a * b by shift-and-add: for each bit of b from the most
// significant down, double the running product and add a if the bit is set.
BitInteger MultiplyShiftAndAdd(const BitInteger& a, const BitInteger& b);

// Returns the quotient and remainder of a / b by binary long division.
// Fails with DIVISION_BY_ZERO if b is zero.
absl::StatusOr<DivModResult> DivMod(const BitInteger& a, const BitInteger& b);

// Returns floor(a / b), computed with DivMod().
absl::StatusOr<BitInteger> Divide(const BitInteger& a, const BitInteger& b);

// Returns a mod b, computed with DivMod().
absl::StatusOr<BitInteger> Mod(const BitInteger& a, const BitInteger& b);

////////////////////////////////////////////////////////////////////////////////
//                           Implementation Details
////////////////////////////////////////////////////////////////////////////////

template <typename T, typename>
BitInteger::BitInteger(T value) {
  while (value != 0) {
    bits_.push_back((value & 1) != 0);
    value >>= 1;
  }
}

template <typename T, typename>
absl::StatusOr<T> BitInteger::ConvertTo() const {
  if (!FitsIn<T>()) {
    return ToStatus(BitIntError::Overflow(
        absl::StrCat("value of ", length(), " bits does not fit in ",
                     std::numeric_limits<T>::digits, " bits")));
  }

  T value = 0;
  for (int i = length() - 1; i >= 0; --i) {
    value = static_cast<T>((value << 1) | (bits_[i] ? 1 : 0));
  }
  return value;
}

}  // namespace bitint

#endif  // BITINT_BIT_INTEGER_H_
