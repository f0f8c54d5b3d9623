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

#include "bitint/bit_integer.h"

#include <string>

#include "absl/log/absl_check.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

#include "bitint/bit_integer_error.h"

namespace bitint {

absl::StatusOr<BitInteger> BitInteger::FromBinaryString(absl::string_view s) {
  BitInteger out;
  out.bits_.reserve(s.size());

  // Walk from the last character, which is the least significant bit.
  for (size_t i = s.size(); i-- > 0;) {
    const char c = s[i];
    if (c != '0' && c != '1') {
      return ToStatus(BitIntError::InvalidFormat(
          absl::StrCat("invalid character '", absl::string_view(&c, 1),
                       "' at position ", i, " of binary literal \"", s,
                       "\"")));
    }
    out.Append(c == '1');
  }
  // Leading zeros of the literal are still buffered; drop them so that they
  // cannot resurface through a later Append().
  out.Normalize();
  return out;
}

BitInteger BitInteger::FromBits(absl::Span<const bool> bits) {
  BitInteger out;
  for (bool bit : bits) {
    out.Append(bit);
  }
  out.Normalize();
  return out;
}

void BitInteger::Append(bool bit) {
  if (!bit) {
    ++pending_zeros_;
    return;
  }

  // Commit the buffered zeros now that a one bit sits above them.
  bits_.insert(bits_.end(), pending_zeros_, false);
  bits_.push_back(true);
  pending_zeros_ = 0;
}

std::string BitInteger::ToString() const {
  if (is_zero()) {
    return "0";
  }

  std::string out;
  out.reserve(bits_.size());
  for (auto it = bits_.rbegin(); it != bits_.rend(); ++it) {
    out.push_back(*it ? '1' : '0');
  }
  return out;
}

BitInteger BitInteger::ShiftLeft(int nbit) const {
  ABSL_DCHECK_GE(nbit, 0);
  if (is_zero() || nbit == 0) {
    return BitInteger(bits_);
  }

  BitVector bits;
  bits.reserve(bits_.size() + nbit);
  bits.insert(bits.end(), nbit, false);
  bits.insert(bits.end(), bits_.begin(), bits_.end());
  return BitInteger(std::move(bits));
}

BitInteger BitInteger::ShiftRight(int nbit) const {
  ABSL_DCHECK_GE(nbit, 0);
  if (nbit >= length()) {
    return BitInteger();
  }

  // Dropping low bits keeps the most significant bit, so the result is
  // already normalized.
  BitInteger out(BitVector(bits_.begin() + nbit, bits_.end()));
  ABSL_DCHECK(out.IsNormalized());
  return out;
}

int BitInteger::Compare(const BitInteger& b) const {
  if (length() != b.length()) {
    return length() < b.length() ? -1 : +1;
  }

  for (int i = length() - 1; i >= 0; --i) {
    if (bits_[i] != b.bits_[i]) {
      return b.bits_[i] ? -1 : +1;
    }
  }
  return 0;
}

void BitInteger::Normalize() {
  while (!bits_.empty() && !bits_.back()) {
    bits_.pop_back();
  }
  pending_zeros_ = 0;
}

}  // namespace bitint
