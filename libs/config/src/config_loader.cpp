#include "flashvault/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "flashvault/common/amount.hpp"

namespace flashvault {
namespace config {

namespace {

using Errors = std::vector<ValidationError>;

struct ParseContext {
  Errors& errors;
  std::unordered_map<std::string, common::Currency> symbols{};
};

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> get_fixed_hex(const toml::table& tbl, std::string_view key,
                                                        const std::string& field, Errors& errors) {
  auto text = tbl[key].value<std::string_view>();
  if (!text) {
    return std::nullopt;
  }
  auto decoded = common::decode_hex(*text);
  if (!decoded || decoded->size() != N) {
    errors.push_back({field, "expected " + std::to_string(N) + " hex-encoded bytes"});
    return std::nullopt;
  }
  std::array<std::uint8_t, N> out{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

std::optional<common::Address> get_address(const toml::table& tbl, std::string_view key,
                                           const std::string& field, Errors& errors, bool required) {
  auto text = tbl[key].value<std::string_view>();
  if (!text) {
    if (required) {
      errors.push_back({field, "address is required"});
    }
    return std::nullopt;
  }
  auto address = common::Address::from_hex(*text);
  if (!address) {
    errors.push_back({field, "invalid address '" + std::string(*text) + "'"});
  }
  return address;
}

// Accepts a currency symbol from [[currencies]] or a hex address.
common::Currency get_currency(const toml::table& tbl, std::string_view key, const std::string& field,
                              ParseContext& ctx) {
  auto text = tbl[key].value<std::string_view>();
  if (!text) {
    ctx.errors.push_back({field, "currency is required"});
    return {};
  }
  if (auto it = ctx.symbols.find(std::string(*text)); it != ctx.symbols.end()) {
    return it->second;
  }
  if (auto address = common::Address::from_hex(*text)) {
    return common::Currency{*address};
  }
  ctx.errors.push_back({field, "unknown currency '" + std::string(*text) + "'"});
  return {};
}

// Integers for small amounts, decimal strings for the full 128-bit range.
common::Amount get_amount(const toml::table& tbl, std::string_view key, const std::string& field,
                          Errors& errors) {
  auto node = tbl[key];
  if (!node) {
    return 0;
  }
  if (auto val = node.value<std::int64_t>()) {
    if (*val >= 0) {
      return static_cast<common::Amount>(*val);
    }
  } else if (auto text = node.value<std::string_view>()) {
    if (auto parsed = common::parse_amount(*text)) {
      return *parsed;
    }
  }
  errors.push_back({field, "must be a non-negative integer"});
  return 0;
}

common::SignedAmount get_signed_amount(const toml::table& tbl, std::string_view key,
                                       const std::string& field, Errors& errors) {
  auto node = tbl[key];
  if (!node) {
    return 0;
  }
  if (auto val = node.value<std::int64_t>()) {
    return static_cast<common::SignedAmount>(*val);
  }
  if (auto text = node.value<std::string_view>()) {
    if (auto parsed = common::parse_signed_amount(*text)) {
      return *parsed;
    }
  }
  errors.push_back({field, "must be a signed 128-bit integer"});
  return 0;
}

VaultSection parse_vault(const toml::table& root, Errors& errors) {
  VaultSection cfg;
  if (auto* vault = root["vault"].as_table()) {
    if (auto address = get_address(*vault, "address", "vault.address", errors, false)) {
      cfg.address = *address;
    }
    cfg.owner_public_key = get_fixed_hex<32>(*vault, "owner_public_key", "vault.owner_public_key", errors);
    cfg.owner_seed = get_fixed_hex<32>(*vault, "owner_seed", "vault.owner_seed", errors);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.event_log_path = get_str_or(*persistence, "event_log_path", cfg.event_log_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.flush_threshold = static_cast<std::size_t>(
        get_int_or(*persistence, "flush_threshold", static_cast<std::int64_t>(cfg.flush_threshold)));
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    if (auto val = (*telemetry)["enabled"].value<bool>()) {
      cfg.enabled = *val;
    }
    cfg.buffer_size = static_cast<std::size_t>(
        get_int_or(*telemetry, "buffer_size", static_cast<std::int64_t>(cfg.buffer_size)));
  }
  return cfg;
}

std::vector<CurrencyConfig> parse_currencies(const toml::table& root, ParseContext& ctx) {
  std::vector<CurrencyConfig> currencies;
  if (auto* arr = root["currencies"].as_array()) {
    std::size_t index = 0;
    for (const auto& elem : *arr) {
      const std::string prefix = "currencies[" + std::to_string(index++) + "]";
      auto* tbl = elem.as_table();
      if (!tbl) {
        ctx.errors.push_back({prefix, "expected a table"});
        continue;
      }
      CurrencyConfig currency;
      currency.symbol = get_str_or(*tbl, "symbol", "");
      if (auto address = get_address(*tbl, "address", prefix + ".address", ctx.errors, true)) {
        currency.currency = common::Currency{*address};
      }
      ctx.symbols.emplace(currency.symbol, currency.currency);
      currencies.push_back(std::move(currency));
    }
  }
  return currencies;
}

std::vector<GenesisBalance> parse_genesis(const toml::table& root, ParseContext& ctx) {
  std::vector<GenesisBalance> genesis;
  if (auto* arr = root["genesis"].as_array()) {
    std::size_t index = 0;
    for (const auto& elem : *arr) {
      const std::string prefix = "genesis[" + std::to_string(index++) + "]";
      if (auto* tbl = elem.as_table()) {
        GenesisBalance balance;
        if (auto holder = get_address(*tbl, "holder", prefix + ".holder", ctx.errors, true)) {
          balance.holder = *holder;
        }
        balance.currency = get_currency(*tbl, "currency", prefix + ".currency", ctx);
        balance.amount = get_amount(*tbl, "amount", prefix + ".amount", ctx.errors);
        genesis.push_back(balance);
      }
    }
  }
  return genesis;
}

std::vector<AppRegistration> parse_apps(const toml::table& root, Errors& errors) {
  std::vector<AppRegistration> apps;
  if (auto* arr = root["apps"].as_array()) {
    std::size_t index = 0;
    for (const auto& elem : *arr) {
      const std::string prefix = "apps[" + std::to_string(index++) + "]";
      if (auto* tbl = elem.as_table()) {
        AppRegistration app;
        if (auto address = get_address(*tbl, "address", prefix + ".address", errors, true)) {
          app.app = *address;
        }
        app.signature = get_fixed_hex<64>(*tbl, "signature", prefix + ".signature", errors);
        apps.push_back(app);
      }
    }
  }
  return apps;
}

SessionStep parse_step(const toml::table& tbl, const std::string& prefix, ParseContext& ctx) {
  SessionStep step;
  const std::string op_name = get_str_or(tbl, "op", "");
  if (auto op = parse_step_op(op_name)) {
    step.op = *op;
  } else {
    ctx.errors.push_back({prefix + ".op", "unknown op '" + op_name + "'"});
  }

  step.caller = get_address(tbl, "caller", prefix + ".caller", ctx.errors, false);
  step.target = get_address(tbl, "target", prefix + ".target", ctx.errors, false);
  step.currency = get_currency(tbl, "currency", prefix + ".currency", ctx);
  if (step.op == StepOp::kAccount) {
    step.delta = get_signed_amount(tbl, "amount", prefix + ".amount", ctx.errors);
  } else {
    step.amount = get_amount(tbl, "amount", prefix + ".amount", ctx.errors);
  }
  step.value = get_amount(tbl, "value", prefix + ".value", ctx.errors);

  if (auto expected = tbl["expect_error"].value<std::string_view>()) {
    step.expect_error = parse_error_code(*expected);
    if (!step.expect_error) {
      ctx.errors.push_back({prefix + ".expect_error", "unknown error '" + std::string(*expected) + "'"});
    }
  }
  return step;
}

std::vector<SessionConfig> parse_sessions(const toml::table& root, ParseContext& ctx) {
  std::vector<SessionConfig> sessions;
  if (auto* arr = root["sessions"].as_array()) {
    std::size_t index = 0;
    for (const auto& elem : *arr) {
      const std::string prefix = "sessions[" + std::to_string(index++) + "]";
      auto* tbl = elem.as_table();
      if (!tbl) {
        continue;
      }
      SessionConfig session;
      if (auto locker = get_address(*tbl, "locker", prefix + ".locker", ctx.errors, true)) {
        session.locker = *locker;
      }
      if (auto* steps = (*tbl)["steps"].as_array()) {
        std::size_t step_index = 0;
        for (const auto& step_elem : *steps) {
          const std::string step_prefix = prefix + ".steps[" + std::to_string(step_index++) + "]";
          if (auto* step_tbl = step_elem.as_table()) {
            session.steps.push_back(parse_step(*step_tbl, step_prefix, ctx));
          }
        }
      }
      sessions.push_back(std::move(session));
    }
  }
  return sessions;
}

std::vector<FeeCollection> parse_fees(const toml::table& root, ParseContext& ctx) {
  std::vector<FeeCollection> fees;
  if (auto* arr = root["fees"].as_array()) {
    std::size_t index = 0;
    for (const auto& elem : *arr) {
      const std::string prefix = "fees[" + std::to_string(index++) + "]";
      if (auto* tbl = elem.as_table()) {
        FeeCollection fee;
        if (auto app = get_address(*tbl, "app", prefix + ".app", ctx.errors, true)) {
          fee.app = *app;
        }
        fee.currency = get_currency(*tbl, "currency", prefix + ".currency", ctx);
        fee.amount = get_amount(*tbl, "amount", prefix + ".amount", ctx.errors);
        if (auto recipient = get_address(*tbl, "recipient", prefix + ".recipient", ctx.errors, true)) {
          fee.recipient = *recipient;
        }
        fees.push_back(fee);
      }
    }
  }
  return fees;
}

VaultConfig parse_config(const toml::table& root, Errors& errors) {
  ParseContext ctx{.errors = errors};
  VaultConfig cfg;
  cfg.vault = parse_vault(root, errors);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.currencies = parse_currencies(root, ctx);
  cfg.genesis = parse_genesis(root, ctx);
  cfg.apps = parse_apps(root, errors);
  cfg.sessions = parse_sessions(root, ctx);
  cfg.fees = parse_fees(root, ctx);
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  result.config = parse_config(root, result.errors);
  auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

std::optional<StepOp> parse_step_op(std::string_view name) {
  if (name == "deposit") return StepOp::kDeposit;
  if (name == "account") return StepOp::kAccount;
  if (name == "take") return StepOp::kTake;
  if (name == "settle") return StepOp::kSettle;
  if (name == "sync") return StepOp::kSync;
  if (name == "mint") return StepOp::kMint;
  if (name == "burn") return StepOp::kBurn;
  return std::nullopt;
}

const char* to_string(StepOp op) noexcept {
  switch (op) {
    case StepOp::kDeposit:
      return "deposit";
    case StepOp::kAccount:
      return "account";
    case StepOp::kTake:
      return "take";
    case StepOp::kSettle:
      return "settle";
    case StepOp::kSync:
      return "sync";
    case StepOp::kMint:
      return "mint";
    case StepOp::kBurn:
      return "burn";
  }
  return "unknown";
}

std::optional<common::ErrorCode> parse_error_code(std::string_view name) {
  for (auto code : {common::ErrorCode::kAppUnregistered, common::ErrorCode::kNoLocker,
                    common::ErrorCode::kAlreadyLocked, common::ErrorCode::kUnsettledBalance,
                    common::ErrorCode::kArithmeticOverflow, common::ErrorCode::kArithmeticUnderflow,
                    common::ErrorCode::kSettleNonNativeCurrencyWithValue, common::ErrorCode::kNotOwner,
                    common::ErrorCode::kInsufficientBalance}) {
    if (name == common::to_string(code)) {
      return code;
    }
  }
  return std::nullopt;
}

std::string VaultConfig::symbol_of(const common::Currency& currency) const {
  for (const auto& entry : currencies) {
    if (entry.currency == currency) {
      return entry.symbol;
    }
  }
  return currency.address.to_hex();
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const VaultConfig& config) {
  std::vector<ValidationError> errors;

  if (config.vault.address.is_zero()) {
    errors.push_back({"vault.address", "vault address cannot be the native currency address"});
  }

  if (!config.vault.owner_public_key && !config.vault.owner_seed) {
    errors.push_back({"vault", "one of owner_public_key or owner_seed is required"});
  }

  if (config.persistence.event_log_path.empty()) {
    errors.push_back({"persistence.event_log_path", "event_log_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  std::unordered_set<std::string> symbols;
  for (std::size_t i = 0; i < config.currencies.size(); ++i) {
    const auto& currency = config.currencies[i];
    const std::string prefix = "currencies[" + std::to_string(i) + "]";
    if (currency.symbol.empty()) {
      errors.push_back({prefix + ".symbol", "symbol cannot be empty"});
    } else if (!symbols.insert(currency.symbol).second) {
      errors.push_back({prefix + ".symbol", "duplicate symbol '" + currency.symbol + "'"});
    }
  }

  for (std::size_t i = 0; i < config.apps.size(); ++i) {
    if (!config.apps[i].signature && !config.vault.owner_seed) {
      errors.push_back({"apps[" + std::to_string(i) + "].signature",
                        "signature required when no owner_seed is configured"});
    }
  }

  for (std::size_t i = 0; i < config.sessions.size(); ++i) {
    const auto& session = config.sessions[i];
    for (std::size_t j = 0; j < session.steps.size(); ++j) {
      const auto& step = session.steps[j];
      const std::string prefix = "sessions[" + std::to_string(i) + "].steps[" + std::to_string(j) + "]";
      if (step.value != 0 && step.op != StepOp::kSettle) {
        errors.push_back({prefix + ".value", "only settle carries a native value"});
      }
      if (step.op == StepOp::kAccount && step.delta == 0) {
        errors.push_back({prefix + ".amount", "account step needs a non-zero delta"});
      }
    }
  }

  for (std::size_t i = 0; i < config.fees.size(); ++i) {
    if (config.fees[i].amount == 0) {
      errors.push_back({"fees[" + std::to_string(i) + "].amount", "must be greater than 0"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# flashvault configuration
# Generated default: one AMM app and one trader exercising a few sessions.

[vault]
address = "0x000000000000000000000000000000000000f1a5"
owner_seed = "0x0101010101010101010101010101010101010101010101010101010101010101"

[persistence]
event_log_path = "/var/lib/flashvault/events.wal"
snapshot_dir = "/var/lib/flashvault/snapshots"
flush_threshold = 128

[telemetry]
enabled = true
buffer_size = 1024

[[currencies]]
symbol = "ETH"
address = "0x0000000000000000000000000000000000000000"

[[currencies]]
symbol = "USDC"
address = "0x00000000000000000000000000000000000000c1"

[[currencies]]
symbol = "WBTC"
address = "0x00000000000000000000000000000000000000c2"

[[genesis]]
holder = "0x0000000000000000000000000000000000001001"
currency = "USDC"
amount = 5000

[[genesis]]
holder = "0x0000000000000000000000000000000000001001"
currency = "ETH"
amount = 10

[[apps]]
address = "0x00000000000000000000000000000000000a0001"

# Liquidity: the AMM takes 1000 USDC in on behalf of the trader, who pays it.
[[sessions]]
locker = "0x0000000000000000000000000000000000001001"

[[sessions.steps]]
op = "account"
caller = "0x00000000000000000000000000000000000a0001"
currency = "USDC"
amount = -1000
target = "0x0000000000000000000000000000000000001001"

[[sessions.steps]]
op = "deposit"
currency = "USDC"
amount = 1000

[[sessions.steps]]
op = "settle"
currency = "USDC"

# Flash loan, a rejected over-withdrawal, native settlement and receipt shares.
[[sessions]]
locker = "0x0000000000000000000000000000000000001001"

[[sessions.steps]]
op = "account"
caller = "0x00000000000000000000000000000000000a0001"
currency = "WBTC"
amount = 5
target = "0x0000000000000000000000000000000000001001"
expect_error = "ArithmeticUnderflow"

[[sessions.steps]]
op = "take"
currency = "USDC"
amount = 400

[[sessions.steps]]
op = "deposit"
currency = "USDC"
amount = 400

[[sessions.steps]]
op = "settle"
currency = "USDC"

[[sessions.steps]]
op = "account"
caller = "0x00000000000000000000000000000000000a0001"
currency = "ETH"
amount = -2
target = "0x0000000000000000000000000000000000001001"

[[sessions.steps]]
op = "settle"
currency = "ETH"
value = 2

[[sessions.steps]]
op = "mint"
currency = "USDC"
amount = 100

[[sessions.steps]]
op = "burn"
currency = "USDC"
amount = 100

[[fees]]
app = "0x00000000000000000000000000000000000a0001"
currency = "USDC"
amount = 10
recipient = "0x0000000000000000000000000000000000002001"
)";
}

}  // namespace config
}  // namespace flashvault
