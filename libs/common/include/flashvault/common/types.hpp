#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flashvault {
namespace common {

using SequenceId = std::uint64_t;

// 128-bit balances and deltas.
__extension__ typedef unsigned __int128 Amount;
__extension__ typedef __int128 SignedAmount;

inline constexpr Amount kMaxAmount = ~Amount{0};
inline constexpr SignedAmount kMaxSignedAmount = static_cast<SignedAmount>(kMaxAmount >> 1);
inline constexpr SignedAmount kMinSignedAmount = -kMaxSignedAmount - 1;

inline constexpr std::size_t kAddressSize = 20;

namespace detail {

inline int hex_nibble(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace detail

// Accepts an optional "0x" prefix. Returns nullopt on odd length or a non-hex digit.
inline std::optional<std::vector<std::uint8_t>> decode_hex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = detail::hex_nibble(hex[i]);
    const int lo = detail::hex_nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

inline std::string encode_hex(const std::uint8_t* data, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(2 + size * 2);
  out += "0x";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

struct Address {
  std::array<std::uint8_t, kAddressSize> bytes{};

  [[nodiscard]] bool is_zero() const noexcept {
    for (const auto b : bytes) {
      if (b != 0) {
        return false;
      }
    }
    return true;
  }

  [[nodiscard]] std::string to_hex() const { return encode_hex(bytes.data(), bytes.size()); }

  static std::optional<Address> from_hex(std::string_view hex) {
    auto decoded = decode_hex(hex);
    if (!decoded || decoded->size() != kAddressSize) {
      return std::nullopt;
    }
    Address out;
    for (std::size_t i = 0; i < kAddressSize; ++i) {
      out.bytes[i] = (*decoded)[i];
    }
    return out;
  }

  // Big-endian integer in the low 8 bytes, for fixtures and well-known ids.
  static Address from_index(std::uint64_t index) noexcept {
    Address out;
    for (std::size_t i = 0; i < 8; ++i) {
      out.bytes[kAddressSize - 1 - i] = static_cast<std::uint8_t>(index >> (8 * i));
    }
    return out;
  }

  friend bool operator==(const Address&, const Address&) = default;
};

// The zero address denotes the chain's native asset.
struct Currency {
  Address address{};

  [[nodiscard]] bool is_native() const noexcept { return address.is_zero(); }

  friend bool operator==(const Currency&, const Currency&) = default;
};

inline constexpr Currency kNativeCurrency{};

struct AddressHash {
  std::size_t operator()(const Address& address) const noexcept {
    // FNV-1a
    std::uint64_t hash = 1469598103934665603ull;
    for (const auto b : address.bytes) {
      hash ^= b;
      hash *= 1099511628211ull;
    }
    return static_cast<std::size_t>(hash);
  }
};

struct CurrencyHash {
  std::size_t operator()(const Currency& currency) const noexcept {
    return AddressHash{}(currency.address);
  }
};

// Composite key for the (account, currency) and (app, currency) ledgers.
struct HolderCurrencyKey {
  Address holder{};
  Currency currency{};

  friend bool operator==(const HolderCurrencyKey&, const HolderCurrencyKey&) = default;
};

struct HolderCurrencyKeyHash {
  std::size_t operator()(const HolderCurrencyKey& key) const noexcept {
    const std::size_t h = AddressHash{}(key.holder);
    return h ^ (CurrencyHash{}(key.currency) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
  }
};

}  // namespace common
}  // namespace flashvault
