#pragma once

#include <optional>
#include <span>
#include <vector>

#include "flashvault/vault/events.hpp"
#include "flashvault/wal/wal_writer.hpp"

namespace flashvault {
namespace wal {

std::vector<std::byte> encode_event(const vault::VaultEvent& event);
// Returns nullopt for record kinds this build does not know.
std::optional<vault::VaultEvent> decode_event(const Record& record);

// Event sink writing every committed vault event to the log.
class EventLog final : public vault::EventSink {
 public:
  explicit EventLog(Writer& writer) : writer_(writer) {}

  void publish(const vault::VaultEvent& event) override;

  [[nodiscard]] std::size_t published() const noexcept { return published_; }

 private:
  Writer& writer_;
  std::size_t published_{0};
};

}  // namespace wal
}  // namespace flashvault
