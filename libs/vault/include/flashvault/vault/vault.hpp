#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_set>
#include <vector>

#include "flashvault/common/types.hpp"
#include "flashvault/ledger/app_reserve_ledger.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/ledger/reserve_store.hpp"
#include "flashvault/ledger/settlement_ledger.hpp"
#include "flashvault/telemetry/telemetry_sink.hpp"
#include "flashvault/vault/collaborators.hpp"
#include "flashvault/vault/events.hpp"
#include "flashvault/vault/pool_key.hpp"

namespace flashvault {
namespace vault {

// Persistent part of the vault. Settlement deltas are always zero outside a
// session, so they are not part of the image.
struct VaultImage {
  std::vector<common::Address> apps{};
  std::vector<ledger::AppReserveEntry> app_reserves{};
  std::vector<ledger::ReserveEntry> reserves{};
};

// Central ledger shared by registered apps. Asset movement is deferred until
// every delta opened inside a lock() session nets to zero.
//
// Every mutating operation is all-or-nothing: on failure a common::VaultError
// (or the collaborator's exception) propagates and no effect is retained.
// `caller` is the identity of the immediate invoker.
class Vault {
 public:
  Vault(common::Address self, common::Address owner, CurrencyBank& bank, ShareToken& shares,
        ledger::Journal& journal);
  Vault(const Vault&) = delete;
  Vault& operator=(const Vault&) = delete;

  void set_event_sink(EventSink* sink) noexcept { events_ = sink; }
  void set_telemetry(telemetry::TelemetrySink* sink) noexcept { telemetry_ = sink; }

  // Owner only (kNotOwner). Idempotent; every call emits kAppRegistered.
  void register_app(const common::Address& caller, const common::Address& app);

  // Opens the single session for `caller`, runs the callback and requires every
  // delta to be settled on return (kUnsettledBalance). Returns the callback's
  // result unchanged.
  std::vector<std::byte> lock(const common::Address& caller, LockCallback& callback,
                              std::span<const std::byte> data);

  // Registered apps only, inside a session. App reserves of `caller` move by
  // the inverse of delta, the settlement balance of `settler` by delta.
  void account_app_balance_delta(const common::Address& caller, const PoolKey& key,
                                 BalanceDelta delta, const common::Address& settler);
  void account_app_balance_delta(const common::Address& caller, const common::Currency& currency,
                                 common::SignedAmount delta, const common::Address& settler);

  // Session holder operations.
  void take(const common::Address& caller, const common::Currency& currency,
            const common::Address& to, common::Amount amount);
  void mint(const common::Address& caller, const common::Address& to,
            const common::Currency& currency, common::Amount amount);
  void burn(const common::Address& caller, const common::Address& from,
            const common::Currency& currency, common::Amount amount);
  // `value` is the native amount delivered with the call; it must be zero for
  // token currencies. Returns the amount credited to the caller.
  common::Amount settle(const common::Address& caller, const common::Currency& currency,
                        common::Amount value = 0);

  // Refreshes the reserve snapshot from the bank. Open to anyone, any time.
  common::Amount sync(const common::Currency& currency);

  // Registered apps only, no session required.
  void collect_fee(const common::Address& caller, const common::Currency& currency,
                   common::Amount amount, const common::Address& recipient);

  [[nodiscard]] std::optional<common::Address> locker() const noexcept { return settlement_.current_holder(); }
  [[nodiscard]] std::uint64_t unsettled_deltas_count() const noexcept { return settlement_.outstanding_count(); }
  [[nodiscard]] common::SignedAmount currency_delta(const common::Address& settler,
                                                    const common::Currency& currency) const;
  [[nodiscard]] common::Amount reserves_of_vault(const common::Currency& currency) const;
  [[nodiscard]] common::Amount reserves_of_app(const common::Address& app,
                                               const common::Currency& currency) const;
  [[nodiscard]] bool is_app_registered(const common::Address& app) const;
  [[nodiscard]] const common::Address& owner() const noexcept { return owner_; }
  [[nodiscard]] const common::Address& address() const noexcept { return self_; }

  // Committed events the sink has not accepted yet. A sink failure never fails
  // the operation that raised the events; they stay queued in order and are
  // offered again after the next commit or by publish_pending().
  [[nodiscard]] std::size_t undelivered_events() const noexcept { return pending_events_.size(); }
  // Retries delivery outside any operation. Returns the events still queued.
  std::size_t publish_pending();

  // Only valid while unlocked and outside any operation.
  [[nodiscard]] VaultImage export_image() const;
  void restore_image(const VaultImage& image);

 private:
  common::Address self_;
  common::Address owner_;
  CurrencyBank& bank_;
  ShareToken& shares_;
  ledger::Journal& journal_;
  EventSink* events_{nullptr};
  telemetry::TelemetrySink* telemetry_{nullptr};

  ledger::SettlementLedger settlement_;
  ledger::AppReserveLedger app_reserves_;
  ledger::ReserveStore reserves_;
  std::unordered_set<common::Address, common::AddressHash> apps_{};
  std::vector<VaultEvent> pending_events_{};

  void require_locked() const;
  void require_app(const common::Address& caller) const;
  void require_idle() const;
  void apply_app_delta(const common::Address& app, const common::Currency& currency,
                       common::SignedAmount delta, const common::Address& settler);

  void emit(VaultEvent event);
  void publish_committed();
  void count(telemetry::Metric metric);
};

}  // namespace vault
}  // namespace flashvault
