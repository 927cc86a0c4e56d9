#include "flashvault/custody/share_ledger.hpp"

#include "flashvault/common/amount.hpp"
#include "flashvault/common/checked_math.hpp"
#include "flashvault/common/errors.hpp"

namespace flashvault {
namespace custody {

void ShareLedger::issue(const common::Address& to, const common::Currency& currency,
                        common::Amount amount) {
  const common::Amount supply = common::checked_add(total_supply(currency), amount);
  write({.holder = to, .currency = currency}, balance_of(to, currency) + amount, supply);
}

void ShareLedger::redeem(const common::Address& from, const common::Currency& currency,
                         common::Amount amount) {
  const common::Amount balance = balance_of(from, currency);
  if (balance < amount) {
    throw common::VaultError(common::ErrorCode::kInsufficientBalance,
                             from.to_hex() + " holds " + common::to_string(balance) +
                                 " shares, redeeming " + common::to_string(amount));
  }
  write({.holder = from, .currency = currency}, balance - amount, total_supply(currency) - amount);
}

common::Amount ShareLedger::balance_of(const common::Address& holder,
                                       const common::Currency& currency) const {
  if (auto it = balances_.find({.holder = holder, .currency = currency}); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

common::Amount ShareLedger::total_supply(const common::Currency& currency) const {
  if (auto it = supply_.find(currency); it != supply_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<BalanceEntry> ShareLedger::entries() const {
  std::vector<BalanceEntry> out;
  out.reserve(balances_.size());
  for (const auto& [key, amount] : balances_) {
    if (amount != 0) {
      out.push_back(BalanceEntry{.holder = key.holder, .currency = key.currency, .amount = amount});
    }
  }
  return out;
}

void ShareLedger::load(const std::vector<BalanceEntry>& entries) {
  balances_.clear();
  supply_.clear();
  for (const auto& entry : entries) {
    balances_[{.holder = entry.holder, .currency = entry.currency}] = entry.amount;
    supply_[entry.currency] = common::checked_add(supply_[entry.currency], entry.amount);
  }
}

void ShareLedger::write(const common::HolderCurrencyKey& key, common::Amount balance,
                        common::Amount supply) {
  if (journal_) {
    const common::Amount previous_balance = balance_of(key.holder, key.currency);
    const common::Amount previous_supply = total_supply(key.currency);
    journal_->record([this, key, previous_balance, previous_supply] {
      balances_[key] = previous_balance;
      supply_[key.currency] = previous_supply;
    });
  }
  balances_[key] = balance;
  supply_[key.currency] = supply;
}

}  // namespace custody
}  // namespace flashvault
