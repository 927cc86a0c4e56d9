#include "flashvault/script/session_runner.hpp"

#include <stdexcept>

#include "flashvault/common/byte_codec.hpp"

namespace flashvault {
namespace script {

ScriptedLocker::ScriptedLocker(vault::Vault& vault, custody::InMemoryBank& bank,
                               ledger::Journal& journal, const config::SessionConfig& session)
    : vault_(vault), bank_(bank), journal_(journal), session_(session) {}

std::vector<std::byte> ScriptedLocker::on_lock_acquired(std::span<const std::byte>) {
  outcomes_.clear();
  for (std::size_t index = 0; index < session_.steps.size(); ++index) {
    const auto& step = session_.steps[index];
    StepOutcome outcome{.op = step.op};

    ledger::Transaction tx(journal_);
    try {
      outcome.result = run_step(step);
    } catch (const common::VaultError& e) {
      if (!step.expect_error || *step.expect_error != e.code()) {
        throw;
      }
      outcome.error = e.code();
      outcomes_.push_back(outcome);
      continue;
    }

    if (step.expect_error) {
      throw std::runtime_error("step " + std::to_string(index) + " (" + config::to_string(step.op) +
                               ") succeeded, expected " + common::to_string(*step.expect_error));
    }
    tx.commit();
    outcomes_.push_back(outcome);
  }

  common::ByteWriter result;
  result.put_u32(static_cast<std::uint32_t>(outcomes_.size()));
  return result.release();
}

common::Amount ScriptedLocker::run_step(const config::SessionStep& step) {
  const common::Address caller = step.caller.value_or(session_.locker);
  const common::Address target = step.target.value_or(caller);

  switch (step.op) {
    case config::StepOp::kDeposit:
      bank_.transfer_from(caller, step.currency, vault_.address(), step.amount);
      return step.amount;
    case config::StepOp::kAccount:
      vault_.account_app_balance_delta(caller, step.currency, step.delta, target);
      return 0;
    case config::StepOp::kTake:
      vault_.take(caller, step.currency, target, step.amount);
      return step.amount;
    case config::StepOp::kSettle:
      if (step.currency.is_native() && step.value != 0) {
        bank_.transfer_from(caller, step.currency, vault_.address(), step.value);
      }
      return vault_.settle(caller, step.currency, step.value);
    case config::StepOp::kSync:
      return vault_.sync(step.currency);
    case config::StepOp::kMint:
      vault_.mint(caller, target, step.currency, step.amount);
      return step.amount;
    case config::StepOp::kBurn:
      vault_.burn(caller, target, step.currency, step.amount);
      return step.amount;
  }
  throw std::logic_error("unhandled step op");
}

SessionOutcome run_session(vault::Vault& vault, custody::InMemoryBank& bank, ledger::Journal& journal,
                           const config::SessionConfig& session) {
  SessionOutcome outcome{.locker = session.locker};
  ScriptedLocker locker(vault, bank, journal, session);
  try {
    vault.lock(session.locker, locker, {});
    outcome.committed = true;
  } catch (const std::exception& e) {
    outcome.error = e.what();
  }
  outcome.steps = locker.outcomes();
  return outcome;
}

}  // namespace script
}  // namespace flashvault
