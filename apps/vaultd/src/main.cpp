#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include "flashvault/auth/authenticator.hpp"
#include "flashvault/common/amount.hpp"
#include "flashvault/common/errors.hpp"
#include "flashvault/config/config_loader.hpp"
#include "flashvault/custody/in_memory_bank.hpp"
#include "flashvault/custody/share_ledger.hpp"
#include "flashvault/ledger/journal.hpp"
#include "flashvault/replay/replay_driver.hpp"
#include "flashvault/script/session_runner.hpp"
#include "flashvault/snapshot/snapshot_store.hpp"
#include "flashvault/telemetry/telemetry_sink.hpp"
#include "flashvault/vault/vault.hpp"
#include "flashvault/wal/event_log.hpp"
#include "flashvault/wal/wal_writer.hpp"

namespace {

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./vaultd.toml",
      "/etc/flashvault/vaultd.toml",
      std::filesystem::path{home ? home : ""} / ".config/flashvault/vaultd.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<flashvault::config::VaultConfig> load_config(int argc, char* argv[]) {
  using namespace flashvault;

  auto config_path = find_config_path(argc, argv);
  config::LoadResult result;
  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    result = config::ConfigLoader::load(config_path);
  }

  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return std::move(result.config);
}

struct OwnerKeys {
  flashvault::auth::PublicKey public_key{};
  std::optional<flashvault::auth::SecretKey> secret_key;
};

// Returns nullopt when a configured public key does not belong to the seed.
std::optional<OwnerKeys> owner_keys(const flashvault::config::VaultSection& section) {
  OwnerKeys keys;
  if (section.owner_seed) {
    flashvault::auth::SecretKey secret{};
    flashvault::auth::Authenticator::keypair_from_seed(*section.owner_seed, keys.public_key, secret);
    keys.secret_key = secret;
    if (section.owner_public_key && *section.owner_public_key != keys.public_key) {
      return std::nullopt;
    }
  } else if (section.owner_public_key) {
    keys.public_key = *section.owner_public_key;
  }
  return keys;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace flashvault;

  auto loaded = load_config(argc, argv);
  if (!loaded) {
    return 1;
  }
  const config::VaultConfig cfg = std::move(*loaded);

  std::cout << "Config loaded successfully\n";
  std::cout << "  Vault address: " << cfg.vault.address.to_hex() << "\n";
  std::cout << "  Currencies: " << cfg.currencies.size() << "\n";
  std::cout << "  Event log: " << cfg.persistence.event_log_path << "\n";

  auth::Authenticator authenticator;
  const auto owner_key = owner_keys(cfg.vault);
  if (!owner_key) {
    std::cerr << "owner_public_key does not match owner_seed\n";
    return 1;
  }
  const OwnerKeys& keys = *owner_key;
  const common::Address owner = authenticator.register_key(keys.public_key);
  std::cout << "  Owner: " << owner.to_hex() << "\n";

  ledger::Journal journal;
  custody::InMemoryBank bank{cfg.vault.address, &journal};
  custody::ShareLedger shares{&journal};
  vault::Vault vault{cfg.vault.address, owner, bank, shares, journal};

  std::filesystem::create_directories(cfg.persistence.snapshot_dir);
  if (cfg.persistence.event_log_path.has_parent_path()) {
    std::filesystem::create_directories(cfg.persistence.event_log_path.parent_path());
  }

  snapshot::Store custody_store{cfg.persistence.snapshot_dir / "custody"};
  bool custody_restored = false;
  try {
    const auto restored = replay::restore_vault(vault, cfg.persistence.snapshot_dir,
                                                cfg.persistence.event_log_path);
    std::cout << "Restored state through sequence " << restored.last_sequence
              << (restored.from_snapshot ? " (snapshot" : " (no snapshot") << ", "
              << restored.registrations_replayed << " registrations replayed)\n";

    if (auto record = custody_store.latest()) {
      const auto custody = snapshot::decode_custody(record->payload);
      bank.load(custody.balances);
      shares.load(custody.shares);
      custody_restored = true;
      std::cout << "Restored " << custody.balances.size() << " custody balances\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "Restore failed: " << e.what() << "\n";
    return 1;
  }

  if (!custody_restored) {
    // First run: the simulated chain holds what the vault already custodies
    // plus the genesis allocations.
    for (const auto& entry : vault.export_image().reserves) {
      bank.mint_to(vault.address(), entry.currency, entry.amount);
    }
    for (const auto& balance : cfg.genesis) {
      bank.mint_to(balance.holder, balance.currency, balance.amount);
    }
  }

  telemetry::TelemetrySink telemetry{cfg.telemetry.buffer_size};
  if (cfg.telemetry.enabled) {
    vault.set_telemetry(&telemetry);
  }

  wal::Writer writer{cfg.persistence.event_log_path, cfg.persistence.flush_threshold};
  wal::EventLog event_log{writer};
  vault.set_event_sink(&event_log);

  for (const auto& registration : cfg.apps) {
    if (vault.is_app_registered(registration.app)) {
      std::cout << "  App " << registration.app.to_hex() << " already registered\n";
      continue;
    }
    auth::Signature signature{};
    if (registration.signature) {
      signature = *registration.signature;
    } else if (keys.secret_key) {
      const auto message = auth::registration_message(vault.address(), registration.app);
      if (!auth::Authenticator::sign(*keys.secret_key, message, signature)) {
        std::cerr << "Failed to sign registration for " << registration.app.to_hex() << "\n";
        return 1;
      }
    }

    if (!authenticator.verify_registration(owner, vault.address(), registration.app, signature)) {
      std::cerr << "Rejected registration for " << registration.app.to_hex() << ": bad owner signature\n";
      continue;
    }
    vault.register_app(owner, registration.app);
    std::cout << "  Registered app " << registration.app.to_hex() << "\n";
  }

  std::size_t committed = 0;
  for (std::size_t i = 0; i < cfg.sessions.size(); ++i) {
    const auto outcome = script::run_session(vault, bank, journal, cfg.sessions[i]);
    std::cout << "Session " << i << " (locker " << outcome.locker.to_hex() << "): "
              << (outcome.committed ? "settled" : "reverted") << "\n";
    for (const auto& step : outcome.steps) {
      std::cout << "    " << config::to_string(step.op);
      if (step.error) {
        std::cout << " failed as expected: " << common::to_string(*step.error);
      } else {
        std::cout << " -> " << common::to_string(step.result);
      }
      std::cout << "\n";
    }
    if (outcome.committed) {
      ++committed;
    } else {
      std::cerr << "    " << outcome.error << "\n";
    }
  }

  for (const auto& fee : cfg.fees) {
    try {
      vault.collect_fee(fee.app, fee.currency, fee.amount, fee.recipient);
      std::cout << "Collected " << common::to_string(fee.amount) << " " << cfg.symbol_of(fee.currency)
                << " for " << fee.app.to_hex() << "\n";
    } catch (const common::VaultError& e) {
      std::cerr << "Fee collection failed: " << e.what() << "\n";
    }
  }

  if (const auto undelivered = vault.publish_pending(); undelivered != 0) {
    std::cerr << undelivered << " events could not be written to the event log\n";
  }

  try {
    writer.sync();
    snapshot::Store store{cfg.persistence.snapshot_dir};
    store.persist(writer.last_sequence(), snapshot::encode_image(vault.export_image()));
    custody_store.persist(writer.last_sequence(),
                          snapshot::encode_custody({.balances = bank.entries(), .shares = shares.entries()}));
  } catch (const std::exception& e) {
    std::cerr << "Persisting state failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "Sessions settled: " << committed << "/" << cfg.sessions.size() << "\n";
  std::cout << "Events logged: " << event_log.published() << "\n";
  for (const auto& currency : cfg.currencies) {
    std::cout << "  " << currency.symbol << " vault reserve "
              << common::to_string(vault.reserves_of_vault(currency.currency)) << ", on hand "
              << common::to_string(bank.balance_of_self(currency.currency)) << "\n";
    for (const auto& registration : cfg.apps) {
      const auto reserve = vault.reserves_of_app(registration.app, currency.currency);
      if (reserve != 0) {
        std::cout << "    app " << registration.app.to_hex() << " reserve " << common::to_string(reserve)
                  << "\n";
      }
    }
  }

  if (cfg.telemetry.enabled) {
    for (auto metric : {telemetry::Metric::kSessionsSettled, telemetry::Metric::kSessionsReverted,
                        telemetry::Metric::kSettlements, telemetry::Metric::kFeesCollected,
                        telemetry::Metric::kEventPublishFailures}) {
      std::cout << "  " << telemetry::metric_name(metric) << ": " << telemetry.total(metric) << "\n";
    }
    for (const auto& summary : telemetry.drain_latency()) {
      std::cout << "  " << telemetry::metric_name(summary.metric) << " mean " << summary.mean_ns
                << "ns p99 " << summary.p99_ns << "ns over " << summary.count << " sessions\n";
    }
  }

  return 0;
}
