#pragma once

#include <unordered_map>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/vault/collaborators.hpp"

namespace flashvault {
namespace custody {

// One (holder, currency) balance, used to persist custody state.
struct BalanceEntry {
  common::Address holder{};
  common::Currency currency{};
  common::Amount amount{0};
};

// Holder balances for every currency, native included, standing in for the
// chain the vault custodies assets on. Sharing the vault's journal makes
// transfers roll back together with the session that made them.
class InMemoryBank final : public vault::CurrencyBank {
 public:
  explicit InMemoryBank(common::Address vault_address, ledger::Journal* journal = nullptr);

  void transfer(const common::Currency& currency, const common::Address& to,
                common::Amount amount) override;
  [[nodiscard]] common::Amount balance_of_self(const common::Currency& currency) const override;

  // Moves funds between arbitrary holders, e.g. a trader paying the vault.
  // Throws kInsufficientBalance.
  void transfer_from(const common::Address& from, const common::Currency& currency,
                     const common::Address& to, common::Amount amount);
  void mint_to(const common::Address& holder, const common::Currency& currency, common::Amount amount);

  [[nodiscard]] common::Amount balance_of(const common::Address& holder,
                                          const common::Currency& currency) const;
  [[nodiscard]] const common::Address& vault_address() const noexcept { return vault_address_; }

  // Non-zero balances. load() replaces every balance and is not journaled.
  [[nodiscard]] std::vector<BalanceEntry> entries() const;
  void load(const std::vector<BalanceEntry>& entries);

 private:
  common::Address vault_address_;
  ledger::Journal* journal_;
  std::unordered_map<common::HolderCurrencyKey, common::Amount, common::HolderCurrencyKeyHash> balances_{};

  void write(const common::HolderCurrencyKey& key, common::Amount next);
};

}  // namespace custody
}  // namespace flashvault
