#include "flashvault/vault/vault.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "flashvault/common/checked_math.hpp"
#include "flashvault/common/errors.hpp"
#include "flashvault/common/time_utils.hpp"

namespace flashvault {
namespace vault {

using common::ErrorCode;
using common::VaultError;

Vault::Vault(common::Address self, common::Address owner, CurrencyBank& bank, ShareToken& shares,
             ledger::Journal& journal)
    : self_(self),
      owner_(owner),
      bank_(bank),
      shares_(shares),
      journal_(journal),
      settlement_(journal),
      app_reserves_(journal),
      reserves_(journal) {}

void Vault::register_app(const common::Address& caller, const common::Address& app) {
  if (caller != owner_) {
    throw VaultError(ErrorCode::kNotOwner, caller.to_hex() + " cannot register apps");
  }

  ledger::Transaction tx(journal_);
  if (!is_app_registered(app)) {
    journal_.record([this, app] { apps_.erase(app); });
    apps_.insert(app);
  }
  emit(VaultEvent{.kind = EventKind::kAppRegistered, .subject = app});
  tx.commit();

  count(telemetry::Metric::kAppsRegistered);
  publish_committed();
}

std::vector<std::byte> Vault::lock(const common::Address& caller, LockCallback& callback,
                                   std::span<const std::byte> data) {
  ledger::Transaction tx(journal_);
  settlement_.acquire_session(caller);
  const auto started = common::now_steady();

  std::vector<std::byte> result;
  try {
    result = callback.on_lock_acquired(data);
    settlement_.release_session();
  } catch (...) {
    count(telemetry::Metric::kSessionsReverted);
    throw;
  }

  emit(VaultEvent{.kind = EventKind::kLockSettled, .subject = caller});
  tx.commit();

  if (telemetry_) {
    telemetry_->record_latency(telemetry::Metric::kLockLatency, common::now_steady() - started);
  }
  count(telemetry::Metric::kSessionsSettled);
  publish_committed();
  return result;
}

void Vault::account_app_balance_delta(const common::Address& caller, const PoolKey& key,
                                      BalanceDelta delta, const common::Address& settler) {
  require_locked();
  require_app(caller);

  ledger::Transaction tx(journal_);
  apply_app_delta(caller, key.currency0, delta.amount0, settler);
  apply_app_delta(caller, key.currency1, delta.amount1, settler);
  tx.commit();
}

void Vault::account_app_balance_delta(const common::Address& caller,
                                      const common::Currency& currency,
                                      common::SignedAmount delta, const common::Address& settler) {
  require_locked();
  require_app(caller);

  ledger::Transaction tx(journal_);
  apply_app_delta(caller, currency, delta, settler);
  tx.commit();
}

void Vault::take(const common::Address& caller, const common::Currency& currency,
                 const common::Address& to, common::Amount amount) {
  require_locked();

  ledger::Transaction tx(journal_);
  settlement_.account_delta(caller, currency, common::to_negative(amount));
  reserves_.decrease(currency, amount);
  bank_.transfer(currency, to, amount);
  tx.commit();
}

void Vault::mint(const common::Address& caller, const common::Address& to,
                 const common::Currency& currency, common::Amount amount) {
  require_locked();

  ledger::Transaction tx(journal_);
  settlement_.account_delta(caller, currency, common::to_negative(amount));
  shares_.issue(to, currency, amount);
  tx.commit();
}

void Vault::burn(const common::Address& caller, const common::Address& from,
                 const common::Currency& currency, common::Amount amount) {
  require_locked();

  ledger::Transaction tx(journal_);
  settlement_.account_delta(caller, currency, common::to_signed(amount));
  shares_.redeem(from, currency, amount);
  tx.commit();
}

common::Amount Vault::settle(const common::Address& caller, const common::Currency& currency,
                             common::Amount value) {
  require_locked();

  ledger::Transaction tx(journal_);
  common::Amount paid = 0;
  if (currency.is_native()) {
    paid = value;
    reserves_.increase(currency, paid);
  } else {
    if (value != 0) {
      throw VaultError(ErrorCode::kSettleNonNativeCurrencyWithValue,
                       "native value sent with " + currency.address.to_hex());
    }
    const common::Amount on_hand = bank_.balance_of_self(currency);
    const common::Amount prior = reserves_.set(currency, on_hand);
    paid = common::checked_sub(on_hand, prior);
  }
  settlement_.account_delta(caller, currency, common::to_signed(paid));
  tx.commit();

  count(telemetry::Metric::kSettlements);
  return paid;
}

common::Amount Vault::sync(const common::Currency& currency) {
  ledger::Transaction tx(journal_);
  const common::Amount on_hand = bank_.balance_of_self(currency);
  reserves_.set(currency, on_hand);
  tx.commit();
  return on_hand;
}

void Vault::collect_fee(const common::Address& caller, const common::Currency& currency,
                        common::Amount amount, const common::Address& recipient) {
  require_app(caller);

  ledger::Transaction tx(journal_);
  app_reserves_.decrease(caller, currency, amount);
  reserves_.decrease(currency, amount);
  bank_.transfer(currency, recipient, amount);
  emit(VaultEvent{.kind = EventKind::kFeeCollected,
                  .subject = caller,
                  .currency = currency,
                  .amount = amount,
                  .recipient = recipient});
  tx.commit();

  count(telemetry::Metric::kFeesCollected);
  publish_committed();
}

common::SignedAmount Vault::currency_delta(const common::Address& settler,
                                           const common::Currency& currency) const {
  return settlement_.delta_of(settler, currency);
}

common::Amount Vault::reserves_of_vault(const common::Currency& currency) const {
  return reserves_.reserve_of(currency);
}

common::Amount Vault::reserves_of_app(const common::Address& app,
                                      const common::Currency& currency) const {
  return app_reserves_.reserve_of(app, currency);
}

bool Vault::is_app_registered(const common::Address& app) const {
  return apps_.find(app) != apps_.end();
}

VaultImage Vault::export_image() const {
  require_idle();

  VaultImage image;
  image.apps.assign(apps_.begin(), apps_.end());
  std::sort(image.apps.begin(), image.apps.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.bytes < rhs.bytes;
  });
  image.app_reserves = app_reserves_.entries();
  image.reserves = reserves_.entries();
  return image;
}

void Vault::restore_image(const VaultImage& image) {
  require_idle();

  apps_.clear();
  apps_.insert(image.apps.begin(), image.apps.end());
  app_reserves_.load(image.app_reserves);
  reserves_.load(image.reserves);
}

void Vault::require_locked() const {
  if (!settlement_.locked()) {
    throw VaultError(ErrorCode::kNoLocker, "no active session");
  }
}

void Vault::require_app(const common::Address& caller) const {
  if (!is_app_registered(caller)) {
    throw VaultError(ErrorCode::kAppUnregistered, caller.to_hex());
  }
}

void Vault::require_idle() const {
  if (settlement_.locked() || journal_.open_transactions() != 0) {
    throw std::runtime_error("vault image requires an unlocked, idle vault");
  }
}

void Vault::apply_app_delta(const common::Address& app, const common::Currency& currency,
                            common::SignedAmount delta, const common::Address& settler) {
  app_reserves_.adjust_app_reserve(app, currency, delta);
  settlement_.account_delta(settler, currency, delta);
}

void Vault::emit(VaultEvent event) {
  pending_events_.push_back(event);
  try {
    journal_.record([this] { pending_events_.pop_back(); });
  } catch (...) {
    pending_events_.pop_back();
    throw;
  }
}

std::size_t Vault::publish_pending() {
  publish_committed();
  return pending_events_.size();
}

void Vault::publish_committed() {
  if (journal_.open_transactions() != 0 || pending_events_.empty()) {
    return;
  }
  if (!events_) {
    pending_events_.clear();
    return;
  }

  std::size_t delivered = 0;
  try {
    for (; delivered < pending_events_.size(); ++delivered) {
      events_->publish(pending_events_[delivered]);
    }
  } catch (const std::exception&) {
    count(telemetry::Metric::kEventPublishFailures);
  }
  pending_events_.erase(pending_events_.begin(),
                        pending_events_.begin() + static_cast<std::ptrdiff_t>(delivered));
}

void Vault::count(telemetry::Metric metric) {
  if (telemetry_) {
    telemetry_->increment(metric);
  }
}

}  // namespace vault
}  // namespace flashvault
