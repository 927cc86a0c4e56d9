#include "flashvault/custody/in_memory_bank.hpp"

#include "flashvault/common/amount.hpp"
#include "flashvault/common/checked_math.hpp"
#include "flashvault/common/errors.hpp"

namespace flashvault {
namespace custody {

InMemoryBank::InMemoryBank(common::Address vault_address, ledger::Journal* journal)
    : vault_address_(vault_address), journal_(journal) {}

void InMemoryBank::transfer(const common::Currency& currency, const common::Address& to,
                            common::Amount amount) {
  transfer_from(vault_address_, currency, to, amount);
}

common::Amount InMemoryBank::balance_of_self(const common::Currency& currency) const {
  return balance_of(vault_address_, currency);
}

void InMemoryBank::transfer_from(const common::Address& from, const common::Currency& currency,
                                 const common::Address& to, common::Amount amount) {
  const common::Amount from_balance = balance_of(from, currency);
  if (from_balance < amount) {
    throw common::VaultError(common::ErrorCode::kInsufficientBalance,
                             from.to_hex() + " holds " + common::to_string(from_balance) +
                                 ", needs " + common::to_string(amount));
  }
  if (from == to || amount == 0) {
    return;
  }
  const common::Amount to_balance = common::checked_add(balance_of(to, currency), amount);
  write({.holder = from, .currency = currency}, from_balance - amount);
  write({.holder = to, .currency = currency}, to_balance);
}

void InMemoryBank::mint_to(const common::Address& holder, const common::Currency& currency,
                           common::Amount amount) {
  write({.holder = holder, .currency = currency},
        common::checked_add(balance_of(holder, currency), amount));
}

common::Amount InMemoryBank::balance_of(const common::Address& holder,
                                        const common::Currency& currency) const {
  if (auto it = balances_.find({.holder = holder, .currency = currency}); it != balances_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<BalanceEntry> InMemoryBank::entries() const {
  std::vector<BalanceEntry> out;
  out.reserve(balances_.size());
  for (const auto& [key, amount] : balances_) {
    if (amount != 0) {
      out.push_back(BalanceEntry{.holder = key.holder, .currency = key.currency, .amount = amount});
    }
  }
  return out;
}

void InMemoryBank::load(const std::vector<BalanceEntry>& entries) {
  balances_.clear();
  for (const auto& entry : entries) {
    balances_[{.holder = entry.holder, .currency = entry.currency}] = entry.amount;
  }
}

void InMemoryBank::write(const common::HolderCurrencyKey& key, common::Amount next) {
  if (journal_) {
    const common::Amount previous = balance_of(key.holder, key.currency);
    journal_->record([this, key, previous] { balances_[key] = previous; });
  }
  balances_[key] = next;
}

}  // namespace custody
}  // namespace flashvault
