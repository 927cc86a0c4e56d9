#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flashvault/common/errors.hpp"
#include "flashvault/common/types.hpp"

namespace flashvault {
namespace config {

using Key32 = std::array<std::uint8_t, 32>;
using Signature64 = std::array<std::uint8_t, 64>;

struct VaultSection {
  common::Address address{common::Address::from_index(0xf1a5)};
  std::optional<Key32> owner_public_key;
  // Development only: derive the owner keypair locally and self-sign registrations.
  std::optional<Key32> owner_seed;
};

struct PersistenceConfig {
  std::filesystem::path event_log_path{"/var/lib/flashvault/events.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/flashvault/snapshots"};
  std::size_t flush_threshold{128};
};

struct TelemetryConfig {
  bool enabled{true};
  std::size_t buffer_size{1024};
};

struct CurrencyConfig {
  std::string symbol;
  common::Currency currency;
};

struct GenesisBalance {
  common::Address holder;
  common::Currency currency;
  common::Amount amount{0};
};

struct AppRegistration {
  common::Address app;
  std::optional<Signature64> signature;
};

enum class StepOp : std::uint8_t {
  kDeposit,  // caller pays `amount` into the vault outside the ledger
  kAccount,  // account_app_balance_delta(caller, currency, delta, target)
  kTake,     // take(caller, currency, target, amount)
  kSettle,   // settle(caller, currency, value)
  kSync,     // sync(currency)
  kMint,     // mint(caller, target, currency, amount)
  kBurn,     // burn(caller, target, currency, amount)
};

std::optional<StepOp> parse_step_op(std::string_view name);
const char* to_string(StepOp op) noexcept;
std::optional<common::ErrorCode> parse_error_code(std::string_view name);

struct SessionStep {
  StepOp op{StepOp::kSync};
  std::optional<common::Address> caller;  // defaults to the session locker
  common::Currency currency;
  std::optional<common::Address> target;  // defaults to the caller
  common::SignedAmount delta{0};          // kAccount only
  common::Amount amount{0};
  common::Amount value{0};                // native value delivered with kSettle
  std::optional<common::ErrorCode> expect_error;
};

struct SessionConfig {
  common::Address locker;
  std::vector<SessionStep> steps;
};

struct FeeCollection {
  common::Address app;
  common::Currency currency;
  common::Amount amount{0};
  common::Address recipient;
};

struct VaultConfig {
  VaultSection vault;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
  std::vector<CurrencyConfig> currencies;
  std::vector<GenesisBalance> genesis;
  std::vector<AppRegistration> apps;
  std::vector<SessionConfig> sessions;
  std::vector<FeeCollection> fees;

  [[nodiscard]] std::string symbol_of(const common::Currency& currency) const;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  VaultConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const VaultConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace flashvault
