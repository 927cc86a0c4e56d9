#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace common {

// Little-endian fixed-width encoding for log records and snapshot images.
class ByteWriter {
 public:
  void put_u16(std::uint16_t value) { put_le(value, 2); }
  void put_u32(std::uint32_t value) { put_le(value, 4); }
  void put_u64(std::uint64_t value) { put_le(value, 8); }

  void put_amount(Amount value) {
    put_u64(static_cast<std::uint64_t>(value));
    put_u64(static_cast<std::uint64_t>(value >> 64));
  }

  void put_address(const Address& address) {
    for (const auto b : address.bytes) {
      buffer_.push_back(static_cast<std::byte>(b));
    }
  }

  void put_currency(const Currency& currency) { put_address(currency.address); }

  [[nodiscard]] const std::vector<std::byte>& bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<std::byte> release() { return std::move(buffer_); }

 private:
  std::vector<std::byte> buffer_{};

  void put_le(std::uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
      buffer_.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xff));
    }
  }
};

class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

  std::uint16_t get_u16() { return static_cast<std::uint16_t>(get_le(2)); }
  std::uint32_t get_u32() { return static_cast<std::uint32_t>(get_le(4)); }
  std::uint64_t get_u64() { return get_le(8); }

  Amount get_amount() {
    const Amount lo = get_u64();
    const Amount hi = get_u64();
    return lo | (hi << 64);
  }

  Address get_address() {
    require(kAddressSize);
    Address out;
    for (std::size_t i = 0; i < kAddressSize; ++i) {
      out.bytes[i] = static_cast<std::uint8_t>(data_[offset_ + i]);
    }
    offset_ += kAddressSize;
    return out;
  }

  Currency get_currency() { return Currency{get_address()}; }

  [[nodiscard]] bool exhausted() const noexcept { return offset_ == data_.size(); }

 private:
  std::span<const std::byte> data_;
  std::size_t offset_{0};

  void require(std::size_t width) const {
    if (data_.size() - offset_ < width) {
      throw std::runtime_error("truncated record");
    }
  }

  std::uint64_t get_le(std::size_t width) {
    require(width);
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
      value |= static_cast<std::uint64_t>(data_[offset_ + i]) << (8 * i);
    }
    offset_ += width;
    return value;
  }
};

}  // namespace common
}  // namespace flashvault
