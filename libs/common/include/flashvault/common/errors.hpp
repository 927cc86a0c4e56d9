#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace flashvault {
namespace common {

enum class ErrorCode : std::uint16_t {
  kAppUnregistered = 1,
  kNoLocker,
  kAlreadyLocked,
  kUnsettledBalance,
  kArithmeticOverflow,
  kArithmeticUnderflow,
  kSettleNonNativeCurrencyWithValue,
  kNotOwner,
  kInsufficientBalance,
};

inline constexpr const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kAppUnregistered:
      return "AppUnregistered";
    case ErrorCode::kNoLocker:
      return "NoLocker";
    case ErrorCode::kAlreadyLocked:
      return "AlreadyLocked";
    case ErrorCode::kUnsettledBalance:
      return "UnsettledBalance";
    case ErrorCode::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorCode::kArithmeticUnderflow:
      return "ArithmeticUnderflow";
    case ErrorCode::kSettleNonNativeCurrencyWithValue:
      return "SettleNonNativeCurrencyWithValue";
    case ErrorCode::kNotOwner:
      return "NotOwner";
    case ErrorCode::kInsufficientBalance:
      return "InsufficientBalance";
  }
  return "Unknown";
}

// Thrown by every vault component. The in-flight operation has been rolled back
// by the time the caller sees it.
class VaultError : public std::runtime_error {
 public:
  VaultError(ErrorCode code, const std::string& detail)
      : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace common
}  // namespace flashvault
