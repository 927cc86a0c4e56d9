#include "flashvault/ledger/app_reserve_ledger.hpp"

#include "flashvault/common/amount.hpp"
#include "flashvault/common/checked_math.hpp"

namespace flashvault {
namespace ledger {

void AppReserveLedger::adjust_app_reserve(const common::Address& app,
                                          const common::Currency& currency,
                                          common::SignedAmount delta) {
  if (delta == 0) {
    return;
  }
  if (delta > 0) {
    decrease(app, currency, common::magnitude(delta));
  } else {
    increase(app, currency, common::magnitude(delta));
  }
}

void AppReserveLedger::increase(const common::Address& app, const common::Currency& currency,
                                common::Amount amount) {
  const common::HolderCurrencyKey key{.holder = app, .currency = currency};
  const common::Amount previous = reserve_of(app, currency);
  write(key, previous, common::checked_add(previous, amount));
}

void AppReserveLedger::decrease(const common::Address& app, const common::Currency& currency,
                                common::Amount amount) {
  const common::HolderCurrencyKey key{.holder = app, .currency = currency};
  const common::Amount previous = reserve_of(app, currency);
  write(key, previous, common::checked_sub(previous, amount));
}

common::Amount AppReserveLedger::reserve_of(const common::Address& app,
                                            const common::Currency& currency) const {
  if (auto it = reserves_.find({.holder = app, .currency = currency}); it != reserves_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<AppReserveEntry> AppReserveLedger::entries() const {
  std::vector<AppReserveEntry> out;
  out.reserve(reserves_.size());
  for (const auto& [key, amount] : reserves_) {
    if (amount == 0) {
      continue;
    }
    out.push_back(AppReserveEntry{.app = key.holder, .currency = key.currency, .amount = amount});
  }
  return out;
}

void AppReserveLedger::load(const std::vector<AppReserveEntry>& entries) {
  reserves_.clear();
  for (const auto& entry : entries) {
    reserves_[{.holder = entry.app, .currency = entry.currency}] = entry.amount;
  }
}

void AppReserveLedger::write(const common::HolderCurrencyKey& key, common::Amount previous,
                             common::Amount next) {
  journal_.record([this, key, previous] { reserves_[key] = previous; });
  reserves_[key] = next;
}

}  // namespace ledger
}  // namespace flashvault
