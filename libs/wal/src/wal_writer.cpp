#include "flashvault/wal/wal_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace flashvault {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x4656574c;  // 'FVWL'

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open(path);
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception&) {
    // Records still buffered here are lost; sync() is the durable path.
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    Reader reader(path);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
  }

  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open event log: " + path.string());
  }
}

common::SequenceId Writer::append(const RecordView& record_view) {
  if (!file_) {
    throw std::runtime_error("event log writer not open");
  }

  RecordHeader header = record_view.header;
  header.magic = kMagic;
  header.version = 1;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(record_view.payload.size());
  header.checksum = checksum32(record_view.payload);

  const std::size_t mark = buffer_.size();
  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), record_view.payload.begin(), record_view.payload.end());

  if (buffer_.size() >= flush_threshold_) {
    try {
      flush();
    } catch (const std::exception&) {
      // Unless the bytes already reached the stream, a failed append leaves
      // neither the record nor its sequence behind, so it can be retried.
      // Earlier records stay buffered.
      if (buffer_.size() > mark) {
        buffer_.resize(mark);
        --next_sequence_;
      }
      throw;
    }
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write event log buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  if (::fsync(fileno(file_)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

Reader::Reader(const std::filesystem::path& path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open event log for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  if (std::fread(&header, sizeof(RecordHeader), 1, file_) != 1) {
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid event log magic");
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated event log record");
    }
  }

  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("event log checksum mismatch");
  }

  return true;
}

}  // namespace wal
}  // namespace flashvault
