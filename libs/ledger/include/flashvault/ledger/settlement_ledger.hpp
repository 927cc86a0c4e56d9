#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "flashvault/common/types.hpp"
#include "flashvault/ledger/journal.hpp"

namespace flashvault {
namespace ledger {

// Session slot plus the per-(settler, currency) signed balances that must net to
// zero before the session can be released.
//
// Sign convention: a positive delta means the vault owes the settler (the settler
// supplied value), a negative delta means the settler owes the vault.
class SettlementLedger {
 public:
  explicit SettlementLedger(Journal& journal) : journal_(journal) {}

  // Throws kAlreadyLocked if a session is active.
  void acquire_session(const common::Address& holder);
  // Throws kUnsettledBalance while any delta is non-zero.
  void release_session();

  [[nodiscard]] std::optional<common::Address> current_holder() const noexcept { return holder_; }
  [[nodiscard]] bool locked() const noexcept { return holder_.has_value(); }
  [[nodiscard]] std::uint64_t outstanding_count() const noexcept { return outstanding_; }

  // Adds delta to (account, currency). The outstanding count tracks entries
  // crossing into and out of zero, so it always equals the number of non-zero
  // entries. Throws kArithmeticOverflow without mutating.
  void account_delta(const common::Address& account, const common::Currency& currency,
                     common::SignedAmount delta);
  [[nodiscard]] common::SignedAmount delta_of(const common::Address& account,
                                              const common::Currency& currency) const;

 private:
  Journal& journal_;
  std::optional<common::Address> holder_{};
  std::uint64_t outstanding_{0};
  std::unordered_map<common::HolderCurrencyKey, common::SignedAmount, common::HolderCurrencyKeyHash> deltas_{};
};

}  // namespace ledger
}  // namespace flashvault
