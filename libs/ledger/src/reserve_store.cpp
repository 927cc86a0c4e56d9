#include "flashvault/ledger/reserve_store.hpp"

#include "flashvault/common/checked_math.hpp"

namespace flashvault {
namespace ledger {

common::Amount ReserveStore::set(const common::Currency& currency, common::Amount on_hand) {
  const common::Amount previous = reserve_of(currency);
  journal_.record([this, currency, previous] { reserves_[currency] = previous; });
  reserves_[currency] = on_hand;
  return previous;
}

void ReserveStore::increase(const common::Currency& currency, common::Amount amount) {
  set(currency, common::checked_add(reserve_of(currency), amount));
}

void ReserveStore::decrease(const common::Currency& currency, common::Amount amount) {
  set(currency, common::checked_sub(reserve_of(currency), amount));
}

common::Amount ReserveStore::reserve_of(const common::Currency& currency) const {
  if (auto it = reserves_.find(currency); it != reserves_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<ReserveEntry> ReserveStore::entries() const {
  std::vector<ReserveEntry> out;
  out.reserve(reserves_.size());
  for (const auto& [currency, amount] : reserves_) {
    out.push_back(ReserveEntry{.currency = currency, .amount = amount});
  }
  return out;
}

void ReserveStore::load(const std::vector<ReserveEntry>& entries) {
  reserves_.clear();
  for (const auto& entry : entries) {
    reserves_[entry.currency] = entry.amount;
  }
}

}  // namespace ledger
}  // namespace flashvault
