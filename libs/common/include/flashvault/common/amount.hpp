#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace common {

inline std::string to_string(Amount value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value != 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

inline Amount magnitude(SignedAmount value) noexcept {
  if (value >= 0) {
    return static_cast<Amount>(value);
  }
  // -(value + 1) cannot overflow, including for kMinSignedAmount.
  return static_cast<Amount>(-(value + 1)) + 1;
}

inline std::string to_string(SignedAmount value) {
  if (value < 0) {
    return "-" + to_string(magnitude(value));
  }
  return to_string(static_cast<Amount>(value));
}

inline std::optional<Amount> parse_amount(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  Amount value = 0;
  for (const char c : text) {
    if (c == '_') {
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<Amount>(c - '0');
    if (value > (kMaxAmount - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

inline std::optional<SignedAmount> parse_signed_amount(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  const auto value = parse_amount(text);
  if (!value) {
    return std::nullopt;
  }
  const auto limit = static_cast<Amount>(kMaxSignedAmount) + (negative ? 1 : 0);
  if (*value > limit) {
    return std::nullopt;
  }
  if (negative) {
    return *value == limit ? kMinSignedAmount : -static_cast<SignedAmount>(*value);
  }
  return static_cast<SignedAmount>(*value);
}

}  // namespace common
}  // namespace flashvault
