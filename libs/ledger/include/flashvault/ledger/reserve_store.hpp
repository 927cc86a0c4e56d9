#pragma once

#include <unordered_map>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/ledger/journal.hpp"

namespace flashvault {
namespace ledger {

struct ReserveEntry {
  common::Currency currency{};
  common::Amount amount{0};
};

// Last observed on-hand balance of the vault per currency. Settlement of token
// transfers is the difference between a fresh observation and this snapshot.
class ReserveStore {
 public:
  explicit ReserveStore(Journal& journal) : journal_(journal) {}

  // Replaces the snapshot, returns the previous value.
  common::Amount set(const common::Currency& currency, common::Amount on_hand);
  void increase(const common::Currency& currency, common::Amount amount);
  void decrease(const common::Currency& currency, common::Amount amount);

  [[nodiscard]] common::Amount reserve_of(const common::Currency& currency) const;

  [[nodiscard]] std::vector<ReserveEntry> entries() const;
  // Replaces the whole store. Not journaled.
  void load(const std::vector<ReserveEntry>& entries);

 private:
  Journal& journal_;
  std::unordered_map<common::Currency, common::Amount, common::CurrencyHash> reserves_{};
};

}  // namespace ledger
}  // namespace flashvault
