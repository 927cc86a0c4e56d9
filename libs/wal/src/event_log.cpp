#include "flashvault/wal/event_log.hpp"

#include <stdexcept>

#include "flashvault/common/byte_codec.hpp"

namespace flashvault {
namespace wal {

std::vector<std::byte> encode_event(const vault::VaultEvent& event) {
  common::ByteWriter out;
  out.put_address(event.subject);
  if (event.kind == vault::EventKind::kFeeCollected) {
    out.put_currency(event.currency);
    out.put_amount(event.amount);
    out.put_address(event.recipient);
  }
  return out.release();
}

std::optional<vault::VaultEvent> decode_event(const Record& record) {
  const auto kind = static_cast<vault::EventKind>(record.header.kind);
  if (kind != vault::EventKind::kAppRegistered && kind != vault::EventKind::kLockSettled &&
      kind != vault::EventKind::kFeeCollected) {
    return std::nullopt;
  }

  common::ByteReader in(record.payload);
  vault::VaultEvent event{.kind = kind, .subject = in.get_address()};
  if (kind == vault::EventKind::kFeeCollected) {
    event.currency = in.get_currency();
    event.amount = in.get_amount();
    event.recipient = in.get_address();
  }
  if (!in.exhausted()) {
    throw std::runtime_error("trailing bytes in event record " + std::to_string(record.header.sequence));
  }
  return event;
}

void EventLog::publish(const vault::VaultEvent& event) {
  const auto payload = encode_event(event);
  RecordView record{.header = {}, .payload = payload};
  record.header.kind = static_cast<std::uint16_t>(event.kind);
  writer_.append(record);
  ++published_;
}

}  // namespace wal
}  // namespace flashvault
