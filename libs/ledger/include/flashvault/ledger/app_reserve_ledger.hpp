#pragma once

#include <unordered_map>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/ledger/journal.hpp"

namespace flashvault {
namespace ledger {

struct AppReserveEntry {
  common::Address app{};
  common::Currency currency{};
  common::Amount amount{0};
};

// Per-(app, currency) claim on vault-held funds. Never negative.
class AppReserveLedger {
 public:
  explicit AppReserveLedger(Journal& journal) : journal_(journal) {}

  // Sign convention is the inverse of SettlementLedger::account_delta:
  //   delta > 0  the app hands value out to a trader, its reserve shrinks by delta
  //              (kArithmeticUnderflow if the reserve is smaller);
  //   delta < 0  the app takes value in, its reserve grows by -delta
  //              (kArithmeticOverflow at the 128-bit bound).
  void adjust_app_reserve(const common::Address& app, const common::Currency& currency,
                          common::SignedAmount delta);

  void increase(const common::Address& app, const common::Currency& currency, common::Amount amount);
  void decrease(const common::Address& app, const common::Currency& currency, common::Amount amount);

  [[nodiscard]] common::Amount reserve_of(const common::Address& app,
                                          const common::Currency& currency) const;

  [[nodiscard]] std::vector<AppReserveEntry> entries() const;
  // Replaces the whole ledger. Not journaled.
  void load(const std::vector<AppReserveEntry>& entries);

 private:
  Journal& journal_;
  std::unordered_map<common::HolderCurrencyKey, common::Amount, common::HolderCurrencyKeyHash> reserves_{};

  void write(const common::HolderCurrencyKey& key, common::Amount previous, common::Amount next);
};

}  // namespace ledger
}  // namespace flashvault
