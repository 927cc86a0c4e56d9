#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "flashvault/common/errors.hpp"
#include "flashvault/config/config_loader.hpp"
#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/vault/vault.hpp"

namespace flashvault {
namespace script {

struct StepOutcome {
  config::StepOp op{config::StepOp::kSync};
  std::optional<common::ErrorCode> error;  // expected failure that was observed
  common::Amount result{0};                // settle: paid, sync: on-hand balance
};

struct SessionOutcome {
  common::Address locker;
  bool committed{false};
  std::string error;
  std::vector<StepOutcome> steps;
};

// Session holder that replays configured steps from inside its lock callback.
// Each step is its own journal transaction: a step that fails with its
// `expect_error` is undone and the script continues; any other failure
// propagates and reverts the whole session.
class ScriptedLocker final : public vault::LockCallback {
 public:
  ScriptedLocker(vault::Vault& vault, custody::InMemoryBank& bank, ledger::Journal& journal,
                 const config::SessionConfig& session);

  std::vector<std::byte> on_lock_acquired(std::span<const std::byte> data) override;

  [[nodiscard]] const std::vector<StepOutcome>& outcomes() const noexcept { return outcomes_; }

 private:
  vault::Vault& vault_;
  custody::InMemoryBank& bank_;
  ledger::Journal& journal_;
  const config::SessionConfig& session_;
  std::vector<StepOutcome> outcomes_{};

  common::Amount run_step(const config::SessionStep& step);
};

SessionOutcome run_session(vault::Vault& vault, custody::InMemoryBank& bank, ledger::Journal& journal,
                           const config::SessionConfig& session);

}  // namespace script
}  // namespace flashvault
