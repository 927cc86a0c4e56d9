#pragma once

#include <cstdint>

#include "flashvault/common/types.hpp"

namespace flashvault {
namespace vault {

enum class EventKind : std::uint16_t {
  kAppRegistered = 1,
  kLockSettled = 2,
  kFeeCollected = 3,
};

// kAppRegistered: subject = app
// kLockSettled:   subject = session holder
// kFeeCollected:  subject = app, currency, amount, recipient
struct VaultEvent {
  EventKind kind{EventKind::kAppRegistered};
  common::Address subject{};
  common::Currency currency{};
  common::Amount amount{0};
  common::Address recipient{};
};

// Receives events once the operation that raised them has committed.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const VaultEvent& event) = 0;
};

}  // namespace vault
}  // namespace flashvault
