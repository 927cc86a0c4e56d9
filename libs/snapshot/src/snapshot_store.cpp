#include "flashvault/snapshot/snapshot_store.hpp"

#include <fstream>
#include <stdexcept>

#include "flashvault/common/byte_codec.hpp"

namespace flashvault {
namespace snapshot {

namespace {
constexpr std::uint32_t kMagic = 0x4656534e;  // 'FVSN'
constexpr std::uint32_t kImageVersion = 1;
constexpr std::uint32_t kCustodyVersion = 1;

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint32_t payload_size{0};
};

void put_entries(common::ByteWriter& out, const std::vector<custody::BalanceEntry>& entries) {
  out.put_u32(static_cast<std::uint32_t>(entries.size()));
  for (const auto& entry : entries) {
    out.put_address(entry.holder);
    out.put_currency(entry.currency);
    out.put_amount(entry.amount);
  }
}

std::vector<custody::BalanceEntry> get_entries(common::ByteReader& in) {
  std::vector<custody::BalanceEntry> entries;
  const auto count = in.get_u32();
  for (std::uint32_t i = 0; i < count; ++i) {
    custody::BalanceEntry entry;
    entry.holder = in.get_address();
    entry.currency = in.get_currency();
    entry.amount = in.get_amount();
    entries.push_back(entry);
  }
  return entries;
}

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory) {
  prepare(directory);
}

void Store::prepare(const std::filesystem::path& directory) {
  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }
  directory_ = directory;
  file_path_ = directory_ / "vault.snapshot";
}

void Store::persist(common::SequenceId sequence_id, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  std::ofstream out(file_path_, std::ios::binary | std::ios::app);
  if (!out) {
    throw std::runtime_error("failed to open snapshot file for write: " + file_path_.string());
  }

  SnapshotHeader header;
  header.sequence = sequence_id;
  header.payload_size = static_cast<std::uint32_t>(payload.size());

  out.write(reinterpret_cast<const char*>(&header), sizeof(header));
  if (!payload.empty()) {
    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write snapshot record");
  }
}

std::optional<SnapshotRecord> Store::latest() const {
  if (file_path_.empty() || !std::filesystem::exists(file_path_)) {
    return std::nullopt;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + file_path_.string());
  }

  SnapshotHeader header;
  std::optional<SnapshotRecord> record;

  while (in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    if (header.magic != kMagic) {
      throw std::runtime_error("invalid snapshot magic");
    }
    SnapshotRecord current;
    current.sequence = header.sequence;
    current.payload.resize(header.payload_size);
    if (header.payload_size > 0) {
      in.read(reinterpret_cast<char*>(current.payload.data()), static_cast<std::streamsize>(header.payload_size));
      if (!in) {
        throw std::runtime_error("truncated snapshot record");
      }
    }
    record = std::move(current);
  }

  return record;
}

std::vector<std::byte> encode_image(const vault::VaultImage& image) {
  common::ByteWriter out;
  out.put_u32(kImageVersion);

  out.put_u32(static_cast<std::uint32_t>(image.apps.size()));
  for (const auto& app : image.apps) {
    out.put_address(app);
  }

  out.put_u32(static_cast<std::uint32_t>(image.app_reserves.size()));
  for (const auto& entry : image.app_reserves) {
    out.put_address(entry.app);
    out.put_currency(entry.currency);
    out.put_amount(entry.amount);
  }

  out.put_u32(static_cast<std::uint32_t>(image.reserves.size()));
  for (const auto& entry : image.reserves) {
    out.put_currency(entry.currency);
    out.put_amount(entry.amount);
  }
  return out.release();
}

vault::VaultImage decode_image(std::span<const std::byte> payload) {
  common::ByteReader in(payload);
  if (in.get_u32() != kImageVersion) {
    throw std::runtime_error("unsupported vault image version");
  }

  vault::VaultImage image;
  const auto app_count = in.get_u32();
  for (std::uint32_t i = 0; i < app_count; ++i) {
    image.apps.push_back(in.get_address());
  }

  const auto app_reserve_count = in.get_u32();
  for (std::uint32_t i = 0; i < app_reserve_count; ++i) {
    ledger::AppReserveEntry entry;
    entry.app = in.get_address();
    entry.currency = in.get_currency();
    entry.amount = in.get_amount();
    image.app_reserves.push_back(entry);
  }

  const auto reserve_count = in.get_u32();
  for (std::uint32_t i = 0; i < reserve_count; ++i) {
    ledger::ReserveEntry entry;
    entry.currency = in.get_currency();
    entry.amount = in.get_amount();
    image.reserves.push_back(entry);
  }

  if (!in.exhausted()) {
    throw std::runtime_error("trailing bytes in vault image");
  }
  return image;
}

std::vector<std::byte> encode_custody(const CustodyImage& image) {
  common::ByteWriter out;
  out.put_u32(kCustodyVersion);
  put_entries(out, image.balances);
  put_entries(out, image.shares);
  return out.release();
}

CustodyImage decode_custody(std::span<const std::byte> payload) {
  common::ByteReader in(payload);
  if (in.get_u32() != kCustodyVersion) {
    throw std::runtime_error("unsupported custody image version");
  }

  CustodyImage image;
  image.balances = get_entries(in);
  image.shares = get_entries(in);
  if (!in.exhausted()) {
    throw std::runtime_error("trailing bytes in custody image");
  }
  return image;
}

}  // namespace snapshot
}  // namespace flashvault
