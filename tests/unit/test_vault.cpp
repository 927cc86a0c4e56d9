#include "test_vault.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/custody/share_ledger.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/telemetry/telemetry_sink.hpp"
#include "flashvault/vault/vault.hpp"
#include "test_support.hpp"

namespace flashvault::tests {

using common::ErrorCode;

namespace {

const common::Address kVaultAddress = address(0xf1a5);
const common::Address kOwner = address(0x0e);
const common::Address kApp = address(0xa0001);
const common::Address kTrader = address(0x1001);
const common::Currency kUsdc = token(0xc1);
const common::Currency kWbtc = token(0xc2);

// Fails every publish while `failing` is set.
class FlakySink final : public vault::EventSink {
 public:
  void publish(const vault::VaultEvent& event) override {
    if (failing) {
      throw std::runtime_error("disk full");
    }
    events.push_back(event);
  }

  bool failing{true};
  std::vector<vault::VaultEvent> events;
};

struct Harness {
  ledger::Journal journal;
  custody::InMemoryBank bank{kVaultAddress, &journal};
  custody::ShareLedger shares{&journal};
  vault::Vault vault{kVaultAddress, kOwner, bank, shares, journal};

  Harness() { vault.register_app(kOwner, kApp); }

  // Runs body inside a session held by `holder`.
  template <typename Body>
  void session(const common::Address& holder, Body body) {
    LambdaLocker locker([&](std::span<const std::byte>) {
      body();
      return std::vector<std::byte>{};
    });
    vault.lock(holder, locker, {});
  }
};

}  // namespace

void test_register_app() {
  Harness h;
  RecordingSink sink;
  h.vault.set_event_sink(&sink);

  assert(h.vault.is_app_registered(kApp));
  assert(!h.vault.is_app_registered(kTrader));
  assert(h.vault.owner() == kOwner);

  expect_error(ErrorCode::kNotOwner, [&] { h.vault.register_app(kTrader, kTrader); });
  assert(!h.vault.is_app_registered(kTrader));

  // Idempotent, still observable.
  h.vault.register_app(kOwner, kApp);
  assert(h.vault.is_app_registered(kApp));
  assert(sink.events.size() == 1);
  assert(sink.events[0].kind == vault::EventKind::kAppRegistered);
  assert(sink.events[0].subject == kApp);
}

void test_lock_lifecycle() {
  Harness h;
  assert(!h.vault.locker().has_value());

  LambdaLocker locker([&](std::span<const std::byte> data) {
    assert(h.vault.locker() == kTrader);
    expect_error(ErrorCode::kAlreadyLocked, [&] {
      LambdaLocker inner([](std::span<const std::byte>) { return std::vector<std::byte>{}; });
      h.vault.lock(kApp, inner, {});
    });
    std::vector<std::byte> echoed(data.begin(), data.end());
    echoed.push_back(std::byte{0xff});
    return echoed;
  });

  const std::vector<std::byte> data{std::byte{1}, std::byte{2}};
  const auto result = h.vault.lock(kTrader, locker, data);
  assert(locker.calls == 1);
  assert(result.size() == 3);
  assert(result[0] == std::byte{1});
  assert(result[2] == std::byte{0xff});
  assert(!h.vault.locker().has_value());
  assert(h.vault.unsettled_deltas_count() == 0);

  // A second session can start once the first released.
  h.session(kApp, [] {});
  assert(!h.vault.locker().has_value());
}

void test_permission_tiers() {
  Harness h;

  expect_error(ErrorCode::kNoLocker, [&] { h.vault.take(kTrader, kUsdc, kTrader, 1); });
  expect_error(ErrorCode::kNoLocker, [&] { h.vault.settle(kTrader, kUsdc); });
  expect_error(ErrorCode::kNoLocker, [&] { h.vault.mint(kTrader, kTrader, kUsdc, 1); });
  expect_error(ErrorCode::kNoLocker, [&] { h.vault.burn(kTrader, kTrader, kUsdc, 1); });
  expect_error(ErrorCode::kNoLocker,
               [&] { h.vault.account_app_balance_delta(kApp, kUsdc, -1, kTrader); });
  // Session check comes first for app-only, session-gated calls.
  expect_error(ErrorCode::kNoLocker,
               [&] { h.vault.account_app_balance_delta(kTrader, kUsdc, -1, kTrader); });

  h.session(kTrader, [&] {
    expect_error(ErrorCode::kAppUnregistered,
                 [&] { h.vault.account_app_balance_delta(kTrader, kUsdc, -1, kTrader); });
    const vault::PoolKey key{.currency0 = kUsdc, .currency1 = kWbtc, .app = kTrader};
    expect_error(ErrorCode::kAppUnregistered, [&] {
      h.vault.account_app_balance_delta(kTrader, key, {.amount0 = -1, .amount1 = 1}, kTrader);
    });
    // Any caller may operate on its own deltas while a session is open.
    assert(h.vault.settle(kApp, kUsdc) == 0);
  });

  expect_error(ErrorCode::kAppUnregistered, [&] { h.vault.collect_fee(kTrader, kUsdc, 1, kTrader); });
  // sync needs neither.
  assert(h.vault.sync(kUsdc) == 0);
}

void test_app_credit_scenario() {
  Harness h;
  h.bank.mint_to(kApp, kUsdc, 100);

  h.session(kApp, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -100, kApp);
    assert(h.vault.reserves_of_app(kApp, kUsdc) == 100);
    assert(h.vault.currency_delta(kApp, kUsdc) == -100);
    assert(h.vault.unsettled_deltas_count() == 1);

    h.bank.transfer_from(kApp, kUsdc, kVaultAddress, 100);
    assert(h.vault.settle(kApp, kUsdc) == 100);
    assert(h.vault.currency_delta(kApp, kUsdc) == 0);
    assert(h.vault.unsettled_deltas_count() == 0);
  });

  assert(!h.vault.locker().has_value());
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 100);
  assert(h.vault.reserves_of_vault(kUsdc) == 100);
}

void test_app_underflow_scenario() {
  Harness h;
  h.bank.mint_to(kTrader, kUsdc, 20);

  h.session(kTrader, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -20, kTrader);
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 20);
    h.vault.settle(kTrader, kUsdc);
  });
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 20);

  h.session(kTrader, [&] {
    expect_error(ErrorCode::kArithmeticUnderflow,
                 [&] { h.vault.account_app_balance_delta(kApp, kUsdc, 50, kTrader); });
    assert(h.vault.reserves_of_app(kApp, kUsdc) == 20);
    assert(h.vault.currency_delta(kTrader, kUsdc) == 0);
    assert(h.vault.unsettled_deltas_count() == 0);
  });
}

void test_pool_key_all_or_nothing() {
  Harness h;
  h.bank.mint_to(kTrader, kUsdc, 300);

  const vault::PoolKey key{.currency0 = kUsdc, .currency1 = kWbtc, .app = kApp, .fee = 3000};
  h.session(kTrader, [&] {
    // amount0 alone would succeed; amount1 underflows, so neither applies.
    expect_error(ErrorCode::kArithmeticUnderflow, [&] {
      h.vault.account_app_balance_delta(kApp, key, {.amount0 = -300, .amount1 = 1}, kTrader);
    });
    assert(h.vault.reserves_of_app(kApp, kUsdc) == 0);
    assert(h.vault.currency_delta(kTrader, kUsdc) == 0);
    assert(h.vault.unsettled_deltas_count() == 0);

    h.vault.account_app_balance_delta(kApp, key, {.amount0 = -300, .amount1 = 0}, kTrader);
    assert(h.vault.reserves_of_app(kApp, kUsdc) == 300);
    assert(h.vault.currency_delta(kTrader, kUsdc) == -300);
    assert(h.vault.unsettled_deltas_count() == 1);

    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 300);
    h.vault.settle(kTrader, kUsdc);
  });
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 300);
}

void test_take_settle_round_trip() {
  Harness h;
  h.bank.mint_to(kVaultAddress, kUsdc, 1000);
  h.vault.sync(kUsdc);

  h.session(kTrader, [&] {
    h.vault.take(kTrader, kUsdc, kTrader, 400);
    assert(h.bank.balance_of(kTrader, kUsdc) == 400);
    assert(h.vault.currency_delta(kTrader, kUsdc) == -400);
    assert(h.vault.reserves_of_vault(kUsdc) == 600);

    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 400);
    assert(h.vault.settle(kTrader, kUsdc) == 400);
    assert(h.vault.currency_delta(kTrader, kUsdc) == 0);
  });
  assert(h.vault.reserves_of_vault(kUsdc) == 1000);
  assert(h.bank.balance_of_self(kUsdc) == 1000);

  // Unpaid flash loan: the whole session reverts, the transfer included.
  expect_error(ErrorCode::kUnsettledBalance,
               [&] { h.session(kTrader, [&] { h.vault.take(kTrader, kUsdc, kTrader, 250); }); });
  assert(h.bank.balance_of(kTrader, kUsdc) == 0);
  assert(h.vault.reserves_of_vault(kUsdc) == 1000);

  h.session(kTrader, [&] {
    expect_error(ErrorCode::kArithmeticUnderflow, [&] { h.vault.take(kTrader, kUsdc, kTrader, 1001); });
    assert(h.vault.unsettled_deltas_count() == 0);
  });

  // The bank has the final word when the snapshot overstates custody.
  h.bank.transfer_from(kVaultAddress, kUsdc, kTrader, 900);
  h.session(kTrader, [&] {
    expect_error(ErrorCode::kInsufficientBalance, [&] { h.vault.take(kTrader, kUsdc, kTrader, 500); });
    assert(h.vault.reserves_of_vault(kUsdc) == 1000);
  });
}

void test_sync_then_settle_pays_nothing() {
  Harness h;
  h.bank.mint_to(kTrader, kUsdc, 50);

  h.session(kTrader, [&] {
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 50);
    // Anyone may sync mid-session; it swallows the pending deposit.
    assert(h.vault.sync(kUsdc) == 50);
    assert(h.vault.settle(kTrader, kUsdc) == 0);
    assert(h.vault.unsettled_deltas_count() == 0);
  });
  assert(h.vault.reserves_of_vault(kUsdc) == 50);

  // Funds leaving behind the vault's back make a diff settlement impossible.
  h.bank.transfer_from(kVaultAddress, kUsdc, kTrader, 10);
  h.session(kTrader, [&] {
    expect_error(ErrorCode::kArithmeticUnderflow, [&] { h.vault.settle(kTrader, kUsdc); });
  });
  assert(h.vault.reserves_of_vault(kUsdc) == 50);
  assert(h.vault.sync(kUsdc) == 40);
}

void test_settle_native_value() {
  Harness h;
  h.bank.mint_to(kTrader, common::kNativeCurrency, 5);

  h.session(kTrader, [&] {
    expect_error(ErrorCode::kSettleNonNativeCurrencyWithValue,
                 [&] { h.vault.settle(kTrader, kUsdc, 1); });

    h.vault.account_app_balance_delta(kApp, common::kNativeCurrency, -5, kTrader);
    h.bank.transfer_from(kTrader, common::kNativeCurrency, kVaultAddress, 5);
    assert(h.vault.settle(kTrader, common::kNativeCurrency, 5) == 5);
    assert(h.vault.currency_delta(kTrader, common::kNativeCurrency) == 0);
  });
  assert(h.vault.reserves_of_vault(common::kNativeCurrency) == 5);
  assert(h.vault.reserves_of_app(kApp, common::kNativeCurrency) == 5);

  // Values beyond the signed range cannot be credited.
  h.session(kTrader, [&] {
    expect_error(ErrorCode::kArithmeticOverflow,
                 [&] { h.vault.settle(kTrader, common::kNativeCurrency, common::kMaxAmount); });
  });
}

void test_mint_and_burn() {
  Harness h;

  h.session(kTrader, [&] {
    h.vault.mint(kTrader, kTrader, kUsdc, 100);
    assert(h.shares.balance_of(kTrader, kUsdc) == 100);
    assert(h.vault.currency_delta(kTrader, kUsdc) == -100);

    expect_error(ErrorCode::kInsufficientBalance, [&] { h.vault.burn(kTrader, kTrader, kUsdc, 101); });
    assert(h.vault.currency_delta(kTrader, kUsdc) == -100);

    h.vault.burn(kTrader, kTrader, kUsdc, 100);
    assert(h.shares.total_supply(kUsdc) == 0);
    assert(h.vault.unsettled_deltas_count() == 0);
  });

  // Shares minted against a real deposit survive the session.
  h.bank.mint_to(kTrader, kUsdc, 70);
  h.session(kTrader, [&] {
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 70);
    h.vault.settle(kTrader, kUsdc);
    h.vault.mint(kTrader, kTrader, kUsdc, 70);
  });
  assert(h.shares.balance_of(kTrader, kUsdc) == 70);
  assert(h.vault.reserves_of_vault(kUsdc) == 70);
}

void test_nested_failure_inside_session() {
  Harness h;
  h.bank.mint_to(kVaultAddress, kWbtc, 10);
  h.vault.sync(kWbtc);

  h.session(kTrader, [&] {
    h.vault.take(kTrader, kWbtc, kTrader, 3);
    // Reentrant failure caught by the holder leaves no trace.
    expect_error(ErrorCode::kArithmeticUnderflow,
                 [&] { h.vault.account_app_balance_delta(kApp, kWbtc, 1, kTrader); });
    assert(h.vault.currency_delta(kTrader, kWbtc) == -3);
    assert(h.vault.unsettled_deltas_count() == 1);

    h.bank.transfer_from(kTrader, kWbtc, kVaultAddress, 3);
    assert(h.vault.settle(kTrader, kWbtc) == 3);
  });
  assert(h.vault.reserves_of_vault(kWbtc) == 10);
}

void test_lock_rollback() {
  Harness h;
  telemetry::TelemetrySink telemetry;
  h.vault.set_telemetry(&telemetry);
  h.bank.mint_to(kTrader, kUsdc, 100);

  bool thrown = false;
  try {
    h.session(kTrader, [&] {
      h.vault.account_app_balance_delta(kApp, kUsdc, -100, kTrader);
      h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 100);
      h.vault.settle(kTrader, kUsdc);
      throw std::runtime_error("callback failed");
    });
  } catch (const std::runtime_error& e) {
    thrown = true;
    assert(std::string(e.what()) == "callback failed");
  }
  assert(thrown);
  assert(!h.vault.locker().has_value());
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 0);
  assert(h.vault.reserves_of_vault(kUsdc) == 0);
  assert(h.bank.balance_of(kTrader, kUsdc) == 100);

  expect_error(ErrorCode::kUnsettledBalance, [&] {
    h.session(kTrader, [&] { h.vault.account_app_balance_delta(kApp, kUsdc, -40, kTrader); });
  });
  assert(!h.vault.locker().has_value());
  assert(h.vault.unsettled_deltas_count() == 0);
  assert(h.vault.currency_delta(kTrader, kUsdc) == 0);
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 0);

  assert(telemetry.total(telemetry::Metric::kSessionsReverted) == 2);
  assert(telemetry.total(telemetry::Metric::kSessionsSettled) == 0);
}

void test_collect_fee() {
  Harness h;
  const auto treasury = address(0x2001);
  h.bank.mint_to(kTrader, kUsdc, 500);

  h.session(kTrader, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -500, kTrader);
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 500);
    h.vault.settle(kTrader, kUsdc);
  });

  // No session required.
  h.vault.collect_fee(kApp, kUsdc, 30, treasury);
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 470);
  assert(h.vault.reserves_of_vault(kUsdc) == 470);
  assert(h.bank.balance_of(treasury, kUsdc) == 30);

  expect_error(ErrorCode::kArithmeticUnderflow, [&] { h.vault.collect_fee(kApp, kUsdc, 471, treasury); });
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 470);
  assert(h.bank.balance_of(treasury, kUsdc) == 30);

  // Later deposits still settle by difference.
  h.bank.mint_to(kTrader, kUsdc, 5);
  h.session(kTrader, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -5, kTrader);
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 5);
    assert(h.vault.settle(kTrader, kUsdc) == 5);
  });
}

void test_event_publication() {
  Harness h;
  RecordingSink sink;
  h.vault.set_event_sink(&sink);
  const auto treasury = address(0x2001);
  const auto other_app = address(0xa0002);

  h.session(kTrader, [&] {
    h.vault.register_app(kOwner, other_app);
    // Held back until the session commits.
    assert(sink.events.empty());
  });
  assert(sink.events.size() == 2);
  assert(sink.events[0].kind == vault::EventKind::kAppRegistered);
  assert(sink.events[0].subject == other_app);
  assert(sink.events[1].kind == vault::EventKind::kLockSettled);
  assert(sink.events[1].subject == kTrader);

  // A reverted session drops its events and its registrations.
  const auto third_app = address(0xa0003);
  bool thrown = false;
  try {
    h.session(kTrader, [&] {
      h.vault.register_app(kOwner, third_app);
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(!h.vault.is_app_registered(third_app));
  assert(sink.events.size() == 2);

  h.bank.mint_to(kVaultAddress, kUsdc, 10);
  h.session(kTrader, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -10, kTrader);
    h.vault.settle(kTrader, kUsdc);
  });
  h.vault.collect_fee(kApp, kUsdc, 4, treasury);
  assert(sink.events.size() == 4);
  const auto& fee = sink.events.back();
  assert(fee.kind == vault::EventKind::kFeeCollected);
  assert(fee.subject == kApp);
  assert(fee.currency == kUsdc);
  assert(fee.amount == 4);
  assert(fee.recipient == treasury);
}

void test_event_sink_failure() {
  Harness h;
  FlakySink sink;
  telemetry::TelemetrySink telemetry;
  h.vault.set_event_sink(&sink);
  h.vault.set_telemetry(&telemetry);
  const auto treasury = address(0x2001);
  h.bank.mint_to(kTrader, kUsdc, 100);

  // Committed work is reported as committed even though nothing was delivered.
  h.session(kTrader, [&] {
    h.vault.account_app_balance_delta(kApp, kUsdc, -100, kTrader);
    h.bank.transfer_from(kTrader, kUsdc, kVaultAddress, 100);
    h.vault.settle(kTrader, kUsdc);
  });
  assert(!h.vault.locker().has_value());
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 100);
  assert(h.vault.undelivered_events() == 1);

  h.vault.collect_fee(kApp, kUsdc, 30, treasury);
  assert(h.vault.reserves_of_app(kApp, kUsdc) == 70);
  assert(h.bank.balance_of(treasury, kUsdc) == 30);
  assert(h.vault.undelivered_events() == 2);
  assert(telemetry.total(telemetry::Metric::kEventPublishFailures) == 2);
  assert(telemetry.total(telemetry::Metric::kSessionsSettled) == 1);
  assert(telemetry.total(telemetry::Metric::kFeesCollected) == 1);

  // A reverted session does not disturb the queue.
  expect_error(ErrorCode::kUnsettledBalance, [&] {
    h.session(kTrader, [&] {
      h.vault.register_app(kOwner, address(0xa0009));
      h.vault.account_app_balance_delta(kApp, kUsdc, 10, kTrader);
    });
  });
  assert(h.vault.undelivered_events() == 2);
  assert(h.vault.publish_pending() == 2);

  // Once the sink recovers the backlog goes out in commit order.
  sink.failing = false;
  assert(h.vault.publish_pending() == 0);
  assert(sink.events.size() == 2);
  assert(sink.events[0].kind == vault::EventKind::kLockSettled);
  assert(sink.events[1].kind == vault::EventKind::kFeeCollected);
  assert(sink.events[1].amount == 30);

  h.vault.register_app(kOwner, address(0xa0002));
  assert(sink.events.size() == 3);
  assert(h.vault.undelivered_events() == 0);
}

}  // namespace flashvault::tests
