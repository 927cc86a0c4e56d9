#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace flashvault {
namespace ledger {

// Undo log shared by every store of a vault (and optionally by in-memory
// collaborators). Mutations are recorded only while a Transaction is open.
class Journal {
 public:
  using Undo = std::function<void()>;

  void record(Undo undo);

  [[nodiscard]] bool recording() const noexcept { return open_transactions_ > 0; }
  [[nodiscard]] std::size_t open_transactions() const noexcept { return open_transactions_; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  friend class Transaction;

  std::vector<Undo> entries_{};
  std::size_t open_transactions_{0};

  void revert_to(std::size_t checkpoint) noexcept;
};

// Scoped all-or-nothing region. Destroying an uncommitted transaction undoes
// every mutation recorded since it was opened. Transactions nest; entries are
// dropped only when the outermost one commits.
class Transaction {
 public:
  explicit Transaction(Journal& journal);
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;
  ~Transaction();

  void commit() noexcept;

 private:
  Journal& journal_;
  std::size_t checkpoint_;
  bool committed_{false};
};

}  // namespace ledger
}  // namespace flashvault
