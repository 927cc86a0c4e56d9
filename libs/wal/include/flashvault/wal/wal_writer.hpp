#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace wal {

struct RecordHeader {
  std::uint32_t magic{0x4656574c};      // 'FVWL'
  std::uint16_t version{1};
  std::uint16_t kind{0};
  common::SequenceId sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct RecordView {
  RecordHeader header{};
  std::span<const std::byte> payload{};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only record log. Sequence numbers continue from the last record found
// in an existing file.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  common::SequenceId append(const RecordView& record);
  void flush();
  void sync();
  [[nodiscard]] common::SequenceId next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] common::SequenceId last_sequence() const noexcept { return next_sequence_ - 1; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  common::SequenceId next_sequence_{1};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  bool next(Record& out_record);

 private:
  std::FILE* file_{nullptr};
};

}  // namespace wal
}  // namespace flashvault
