#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/vault/vault.hpp"

namespace flashvault {
namespace snapshot {

struct SnapshotRecord {
  // Last event log sequence reflected in the payload.
  common::SequenceId sequence{0};
  std::vector<std::byte> payload{};
};

class Store {
 public:
  Store();
  explicit Store(std::filesystem::path directory);

  void prepare(const std::filesystem::path& directory);
  void persist(common::SequenceId sequence_id, std::span<const std::byte> payload);
  [[nodiscard]] std::optional<SnapshotRecord> latest() const;
  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

 private:
  std::filesystem::path directory_{};
  std::filesystem::path file_path_{};
};

std::vector<std::byte> encode_image(const vault::VaultImage& image);
vault::VaultImage decode_image(std::span<const std::byte> payload);

// Holder balances of the simulated chain, stored beside the vault image so a
// restart resumes with the same custody instead of replaying genesis.
struct CustodyImage {
  std::vector<custody::BalanceEntry> balances{};
  std::vector<custody::BalanceEntry> shares{};
};

std::vector<std::byte> encode_custody(const CustodyImage& image);
CustodyImage decode_custody(std::span<const std::byte> payload);

}  // namespace snapshot
}  // namespace flashvault
