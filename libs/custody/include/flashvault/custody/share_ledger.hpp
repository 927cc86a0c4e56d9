#pragma once

#include <unordered_map>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/vault/collaborators.hpp"

namespace flashvault {
namespace custody {

// Multi-asset receipt balances, one id per underlying currency.
class ShareLedger final : public vault::ShareToken {
 public:
  explicit ShareLedger(ledger::Journal* journal = nullptr) : journal_(journal) {}

  void issue(const common::Address& to, const common::Currency& currency,
             common::Amount amount) override;
  // Throws kInsufficientBalance if `from` holds fewer shares.
  void redeem(const common::Address& from, const common::Currency& currency,
              common::Amount amount) override;

  [[nodiscard]] common::Amount balance_of(const common::Address& holder,
                                          const common::Currency& currency) const;
  [[nodiscard]] common::Amount total_supply(const common::Currency& currency) const;

  [[nodiscard]] std::vector<BalanceEntry> entries() const;
  // Replaces every balance and recomputes supplies. Not journaled.
  void load(const std::vector<BalanceEntry>& entries);

 private:
  ledger::Journal* journal_;
  std::unordered_map<common::HolderCurrencyKey, common::Amount, common::HolderCurrencyKeyHash> balances_{};
  std::unordered_map<common::Currency, common::Amount, common::CurrencyHash> supply_{};

  void write(const common::HolderCurrencyKey& key, common::Amount balance, common::Amount supply);
};

}  // namespace custody
}  // namespace flashvault
