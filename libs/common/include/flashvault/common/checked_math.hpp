#pragma once

#include "flashvault/common/errors.hpp"
#include "flashvault/common/types.hpp"

namespace flashvault {
namespace common {

inline SignedAmount checked_add(SignedAmount lhs, SignedAmount rhs) {
  SignedAmount out;
  if (__builtin_add_overflow(lhs, rhs, &out)) {
    throw VaultError(ErrorCode::kArithmeticOverflow, "signed 128-bit addition overflowed");
  }
  return out;
}

inline Amount checked_add(Amount lhs, Amount rhs) {
  Amount out;
  if (__builtin_add_overflow(lhs, rhs, &out)) {
    throw VaultError(ErrorCode::kArithmeticOverflow, "unsigned 128-bit addition overflowed");
  }
  return out;
}

inline Amount checked_sub(Amount lhs, Amount rhs) {
  if (rhs > lhs) {
    throw VaultError(ErrorCode::kArithmeticUnderflow, "unsigned 128-bit subtraction underflowed");
  }
  return lhs - rhs;
}

inline SignedAmount to_signed(Amount value) {
  if (value > static_cast<Amount>(kMaxSignedAmount)) {
    throw VaultError(ErrorCode::kArithmeticOverflow, "amount does not fit a signed 128-bit delta");
  }
  return static_cast<SignedAmount>(value);
}

// -to_signed(value), also accepting 2^127 which maps to kMinSignedAmount.
inline SignedAmount to_negative(Amount value) {
  if (value == static_cast<Amount>(kMaxSignedAmount) + 1) {
    return kMinSignedAmount;
  }
  return -to_signed(value);
}

}  // namespace common
}  // namespace flashvault
