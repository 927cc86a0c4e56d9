#include "test_script.hpp"

#include <cassert>
#include <string>

#include "flashvault/config/config_loader.hpp"
#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/custody/share_ledger.hpp"
#include "flashvault/script/session_runner.hpp"
#include "flashvault/vault/vault.hpp"
#include "test_support.hpp"

namespace flashvault::tests {

namespace {

const common::Address kVaultAddress = address(0xf1a5);
const common::Address kOwner = address(0x0e);
const common::Address kApp = address(0xa0001);
const common::Address kTrader = address(0x1001);
const common::Currency kUsdc = token(0xc1);

struct Node {
  ledger::Journal journal;
  custody::InMemoryBank bank{kVaultAddress, &journal};
  custody::ShareLedger shares{&journal};
  vault::Vault vault{kVaultAddress, kOwner, bank, shares, journal};

  Node() {
    vault.register_app(kOwner, kApp);
    bank.mint_to(kTrader, kUsdc, 5000);
    bank.mint_to(kTrader, common::kNativeCurrency, 10);
  }
};

config::SessionStep step(config::StepOp op, common::Currency currency, common::Amount amount) {
  config::SessionStep out;
  out.op = op;
  out.currency = currency;
  out.amount = amount;
  return out;
}

}  // namespace

void test_default_sessions() {
  const auto loaded = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(loaded.success);
  Node node;

  const auto liquidity = script::run_session(node.vault, node.bank, node.journal, loaded.config.sessions[0]);
  assert(liquidity.committed);
  assert(liquidity.error.empty());
  assert(liquidity.steps.size() == 3);
  assert(liquidity.steps[2].result == 1000);
  assert(node.vault.reserves_of_app(kApp, kUsdc) == 1000);

  const auto mixed = script::run_session(node.vault, node.bank, node.journal, loaded.config.sessions[1]);
  assert(mixed.committed);
  assert(mixed.steps.size() == 8);
  assert(mixed.steps[0].error == common::ErrorCode::kArithmeticUnderflow);
  assert(mixed.steps[3].result == 400);
  assert(mixed.steps[5].result == 2);

  assert(node.vault.reserves_of_vault(kUsdc) == 1000);
  assert(node.vault.reserves_of_vault(common::kNativeCurrency) == 2);
  assert(node.vault.reserves_of_app(kApp, common::kNativeCurrency) == 2);
  assert(node.bank.balance_of(kTrader, kUsdc) == 4000);
  assert(node.bank.balance_of(kTrader, common::kNativeCurrency) == 8);
  assert(node.shares.total_supply(kUsdc) == 0);
  assert(!node.vault.locker().has_value());
}

void test_unexpected_step_error() {
  Node node;
  config::SessionConfig session{.locker = kTrader};
  session.steps.push_back(step(config::StepOp::kDeposit, kUsdc, 100));
  session.steps.push_back(step(config::StepOp::kSettle, kUsdc, 0));
  session.steps.push_back(step(config::StepOp::kTake, kUsdc, 500));

  const auto outcome = script::run_session(node.vault, node.bank, node.journal, session);
  assert(!outcome.committed);
  assert(!outcome.error.empty());
  assert(outcome.steps.size() == 2);

  // The deposit made before the failure is unwound too.
  assert(node.bank.balance_of(kTrader, kUsdc) == 5000);
  assert(node.bank.balance_of_self(kUsdc) == 0);
  assert(node.vault.reserves_of_vault(kUsdc) == 0);
  assert(!node.vault.locker().has_value());
}

void test_expected_error_not_raised() {
  Node node;
  config::SessionConfig session{.locker = kTrader};
  auto sync = step(config::StepOp::kSync, kUsdc, 0);
  sync.expect_error = common::ErrorCode::kNoLocker;
  session.steps.push_back(sync);

  const auto outcome = script::run_session(node.vault, node.bank, node.journal, session);
  assert(!outcome.committed);
  assert(outcome.error.find("NoLocker") != std::string::npos);

  // An app credit nobody pays for fails the release.
  config::SessionConfig unsettled{.locker = kTrader};
  auto account = step(config::StepOp::kAccount, kUsdc, 0);
  account.caller = kApp;
  account.delta = -10;
  unsettled.steps.push_back(account);
  const auto rejected = script::run_session(node.vault, node.bank, node.journal, unsettled);
  assert(!rejected.committed);
  assert(rejected.error.find("UnsettledBalance") != std::string::npos);
  assert(rejected.steps.size() == 1);
  assert(node.vault.reserves_of_app(kApp, kUsdc) == 0);
}

}  // namespace flashvault::tests
