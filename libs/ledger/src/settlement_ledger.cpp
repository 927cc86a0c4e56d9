#include "flashvault/ledger/settlement_ledger.hpp"

#include "flashvault/common/checked_math.hpp"
#include "flashvault/common/errors.hpp"

namespace flashvault {
namespace ledger {

void SettlementLedger::acquire_session(const common::Address& holder) {
  if (holder_) {
    throw common::VaultError(common::ErrorCode::kAlreadyLocked,
                             "session held by " + holder_->to_hex());
  }
  journal_.record([this] { holder_.reset(); });
  holder_ = holder;
}

void SettlementLedger::release_session() {
  if (outstanding_ != 0) {
    throw common::VaultError(common::ErrorCode::kUnsettledBalance,
                             std::to_string(outstanding_) + " non-zero deltas outstanding");
  }
  const auto previous = holder_;
  journal_.record([this, previous] { holder_ = previous; });
  holder_.reset();
}

void SettlementLedger::account_delta(const common::Address& account,
                                     const common::Currency& currency,
                                     common::SignedAmount delta) {
  if (delta == 0) {
    return;
  }

  const common::HolderCurrencyKey key{.holder = account, .currency = currency};
  const common::SignedAmount previous = delta_of(account, currency);
  const common::SignedAmount next = common::checked_add(previous, delta);

  std::uint64_t outstanding = outstanding_;
  if (previous == 0) {
    ++outstanding;
  } else if (next == 0) {
    --outstanding;
  }

  const std::uint64_t previous_outstanding = outstanding_;
  journal_.record([this, key, previous, previous_outstanding] {
    deltas_[key] = previous;
    outstanding_ = previous_outstanding;
  });
  deltas_[key] = next;
  outstanding_ = outstanding;
}

common::SignedAmount SettlementLedger::delta_of(const common::Address& account,
                                                const common::Currency& currency) const {
  if (auto it = deltas_.find({.holder = account, .currency = currency}); it != deltas_.end()) {
    return it->second;
  }
  return 0;
}

}  // namespace ledger
}  // namespace flashvault
