#include "test_ledger.hpp"

#include <cassert>

#include "flashvault/common/amount.hpp"
#include "flashvault/ledger/app_reserve_ledger.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/ledger/reserve_store.hpp"
#include "flashvault/ledger/settlement_ledger.hpp"
#include "test_support.hpp"

namespace flashvault::tests {

using common::ErrorCode;

void test_settlement_counter() {
  ledger::Journal journal;
  ledger::SettlementLedger settlement(journal);
  const auto alice = address(1);
  const auto bob = address(2);
  const auto usdc = token(0xc1);

  settlement.account_delta(alice, usdc, 0);
  assert(settlement.outstanding_count() == 0);

  settlement.account_delta(alice, usdc, -100);
  assert(settlement.outstanding_count() == 1);
  settlement.account_delta(alice, usdc, -50);
  assert(settlement.outstanding_count() == 1);
  assert(settlement.delta_of(alice, usdc) == -150);

  settlement.account_delta(bob, common::kNativeCurrency, 7);
  assert(settlement.outstanding_count() == 2);

  // Crossing straight through zero keeps the entry outstanding.
  settlement.account_delta(alice, usdc, 200);
  assert(settlement.delta_of(alice, usdc) == 50);
  assert(settlement.outstanding_count() == 2);

  settlement.account_delta(alice, usdc, -50);
  settlement.account_delta(bob, common::kNativeCurrency, -7);
  assert(settlement.outstanding_count() == 0);
  assert(settlement.delta_of(alice, usdc) == 0);
  assert(settlement.delta_of(address(3), usdc) == 0);
}

void test_settlement_overflow() {
  ledger::Journal journal;
  ledger::SettlementLedger settlement(journal);
  const auto alice = address(1);
  const auto usdc = token(0xc1);

  settlement.account_delta(alice, usdc, common::kMaxSignedAmount);
  expect_error(ErrorCode::kArithmeticOverflow, [&] { settlement.account_delta(alice, usdc, 1); });
  assert(settlement.delta_of(alice, usdc) == common::kMaxSignedAmount);
  assert(settlement.outstanding_count() == 1);

  settlement.account_delta(alice, usdc, -common::kMaxSignedAmount);
  settlement.account_delta(alice, usdc, common::kMinSignedAmount);
  expect_error(ErrorCode::kArithmeticOverflow, [&] { settlement.account_delta(alice, usdc, -1); });
  assert(settlement.delta_of(alice, usdc) == common::kMinSignedAmount);
  assert(common::magnitude(common::kMinSignedAmount) == static_cast<common::Amount>(common::kMaxSignedAmount) + 1);
}

void test_session_slot() {
  ledger::Journal journal;
  ledger::SettlementLedger settlement(journal);
  const auto alice = address(1);
  const auto usdc = token(0xc1);

  assert(!settlement.locked());
  settlement.acquire_session(alice);
  assert(settlement.current_holder() == alice);
  expect_error(ErrorCode::kAlreadyLocked, [&] { settlement.acquire_session(address(2)); });
  expect_error(ErrorCode::kAlreadyLocked, [&] { settlement.acquire_session(alice); });

  settlement.account_delta(alice, usdc, 5);
  expect_error(ErrorCode::kUnsettledBalance, [&] { settlement.release_session(); });
  assert(settlement.locked());

  settlement.account_delta(alice, usdc, -5);
  settlement.release_session();
  assert(!settlement.current_holder().has_value());
}

void test_app_reserve_sign_convention() {
  ledger::Journal journal;
  ledger::AppReserveLedger reserves(journal);
  const auto amm = address(0xa0001);
  const auto usdc = token(0xc1);

  reserves.adjust_app_reserve(amm, usdc, 0);
  assert(reserves.reserve_of(amm, usdc) == 0);
  assert(reserves.entries().empty());

  // Negative delta: value flows into the app.
  reserves.adjust_app_reserve(amm, usdc, -1000);
  assert(reserves.reserve_of(amm, usdc) == 1000);

  // Positive delta: value flows out.
  reserves.adjust_app_reserve(amm, usdc, 400);
  assert(reserves.reserve_of(amm, usdc) == 600);

  expect_error(ErrorCode::kArithmeticUnderflow, [&] { reserves.adjust_app_reserve(amm, usdc, 601); });
  assert(reserves.reserve_of(amm, usdc) == 600);
  expect_error(ErrorCode::kArithmeticUnderflow, [&] { reserves.decrease(amm, usdc, 700); });

  reserves.decrease(amm, usdc, 600);
  assert(reserves.reserve_of(amm, usdc) == 0);

  reserves.increase(amm, usdc, common::kMaxAmount);
  expect_error(ErrorCode::kArithmeticOverflow, [&] { reserves.adjust_app_reserve(amm, usdc, -1); });
  assert(reserves.reserve_of(amm, usdc) == common::kMaxAmount);

  // The most negative delta adds 2^127 without overflowing the negation.
  ledger::AppReserveLedger fresh(journal);
  fresh.adjust_app_reserve(amm, usdc, common::kMinSignedAmount);
  assert(fresh.reserve_of(amm, usdc) == static_cast<common::Amount>(common::kMaxSignedAmount) + 1);
}

void test_reserve_store() {
  ledger::Journal journal;
  ledger::ReserveStore store(journal);
  const auto usdc = token(0xc1);

  assert(store.reserve_of(usdc) == 0);
  assert(store.set(usdc, 500) == 0);
  assert(store.set(usdc, 800) == 500);
  store.increase(usdc, 200);
  store.decrease(usdc, 1000);
  assert(store.reserve_of(usdc) == 0);
  expect_error(ErrorCode::kArithmeticUnderflow, [&] { store.decrease(usdc, 1); });

  store.load({{.currency = usdc, .amount = 42}, {.currency = common::kNativeCurrency, .amount = 7}});
  assert(store.reserve_of(usdc) == 42);
  assert(store.reserve_of(common::kNativeCurrency) == 7);
  assert(store.entries().size() == 2);
}

void test_journal_rollback() {
  ledger::Journal journal;
  ledger::SettlementLedger settlement(journal);
  ledger::AppReserveLedger reserves(journal);
  const auto alice = address(1);
  const auto amm = address(0xa0001);
  const auto usdc = token(0xc1);

  // Outside a transaction nothing is recorded.
  reserves.adjust_app_reserve(amm, usdc, -10);
  assert(journal.size() == 0);

  {
    ledger::Transaction outer(journal);
    settlement.acquire_session(alice);
    settlement.account_delta(alice, usdc, -25);
    {
      ledger::Transaction inner(journal);
      reserves.adjust_app_reserve(amm, usdc, -25);
      settlement.account_delta(alice, usdc, 25);
      assert(settlement.outstanding_count() == 0);
    }
    // Inner rolled back only its own writes.
    assert(reserves.reserve_of(amm, usdc) == 10);
    assert(settlement.delta_of(alice, usdc) == -25);
    assert(settlement.outstanding_count() == 1);
    assert(journal.recording());
  }
  assert(!settlement.locked());
  assert(settlement.outstanding_count() == 0);
  assert(settlement.delta_of(alice, usdc) == 0);
  assert(journal.size() == 0);
  assert(!journal.recording());

  {
    ledger::Transaction outer(journal);
    reserves.adjust_app_reserve(amm, usdc, -5);
    {
      ledger::Transaction inner(journal);
      reserves.adjust_app_reserve(amm, usdc, -5);
      inner.commit();
    }
    assert(journal.size() > 0);
    outer.commit();
  }
  assert(journal.size() == 0);
  assert(reserves.reserve_of(amm, usdc) == 20);
}

}  // namespace flashvault::tests
