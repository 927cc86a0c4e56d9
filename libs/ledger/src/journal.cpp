#include "flashvault/ledger/journal.hpp"

#include <utility>

namespace flashvault {
namespace ledger {

void Journal::record(Undo undo) {
  if (!recording()) {
    return;
  }
  entries_.push_back(std::move(undo));
}

void Journal::revert_to(std::size_t checkpoint) noexcept {
  while (entries_.size() > checkpoint) {
    auto undo = std::move(entries_.back());
    entries_.pop_back();
    undo();
  }
}

Transaction::Transaction(Journal& journal)
    : journal_(journal), checkpoint_(journal.entries_.size()) {
  ++journal_.open_transactions_;
}

Transaction::~Transaction() {
  if (!committed_) {
    journal_.revert_to(checkpoint_);
    --journal_.open_transactions_;
  }
}

void Transaction::commit() noexcept {
  if (committed_) {
    return;
  }
  committed_ = true;
  --journal_.open_transactions_;
  if (journal_.open_transactions_ == 0) {
    journal_.entries_.clear();
  }
}

}  // namespace ledger
}  // namespace flashvault
