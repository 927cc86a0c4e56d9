#include "flashvault/replay/replay_driver.hpp"

#include <stdexcept>
#include <utility>

#include "flashvault/wal/event_log.hpp"

namespace flashvault {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_event_handler(EventHandler handler) {
  event_handler_ = std::move(handler);
}

common::SequenceId Driver::execute() {
  if (!event_handler_) {
    throw std::runtime_error("event handler not set for replay");
  }

  common::SequenceId last_sequence{0};

  if (auto snap = snapshot_store_.latest()) {
    last_sequence = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload.data(), snap->payload.size()));
    }
  }

  if (!std::filesystem::exists(wal_path_)) {
    return last_sequence;
  }

  const common::SequenceId resume_from = last_sequence + 1;
  wal::Reader reader(wal_path_);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence < resume_from) {
      continue;
    }
    event_handler_(record);
    last_sequence = record.header.sequence;
  }
  return last_sequence;
}

RestoreSummary restore_vault(vault::Vault& vault, const std::filesystem::path& snapshot_directory,
                             const std::filesystem::path& wal_path) {
  RestoreSummary summary;

  Driver driver;
  driver.configure(snapshot_directory, wal_path);
  driver.set_snapshot_handler([&](common::SequenceId, std::span<const std::byte> payload) {
    vault.restore_image(snapshot::decode_image(payload));
    summary.from_snapshot = true;
  });
  driver.set_event_handler([&](const wal::Record& record) {
    auto event = wal::decode_event(record);
    if (event && event->kind == vault::EventKind::kAppRegistered) {
      vault.register_app(vault.owner(), event->subject);
      ++summary.registrations_replayed;
    }
  });

  summary.last_sequence = driver.execute();
  return summary;
}

}  // namespace replay
}  // namespace flashvault
