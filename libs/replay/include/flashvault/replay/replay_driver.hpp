#pragma once

#include <filesystem>
#include <functional>
#include <span>

#include "flashvault/common/types.hpp"
#include "flashvault/snapshot/snapshot_store.hpp"
#include "flashvault/vault/vault.hpp"
#include "flashvault/wal/wal_writer.hpp"

namespace flashvault {
namespace replay {

// Feeds the latest snapshot, then every log record written after it.
class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using EventHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_event_handler(EventHandler handler);
  // Returns the last sequence handed to either handler (0 if none).
  common::SequenceId execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  EventHandler event_handler_{};
};

struct RestoreSummary {
  bool from_snapshot{false};
  common::SequenceId last_sequence{0};
  std::size_t registrations_replayed{0};
};

// Rebuilds vault state from disk: the snapshot image, then app registrations
// logged after it. Must run before an event sink is attached to the vault.
RestoreSummary restore_vault(vault::Vault& vault, const std::filesystem::path& snapshot_directory,
                             const std::filesystem::path& wal_path);

}  // namespace replay
}  // namespace flashvault
