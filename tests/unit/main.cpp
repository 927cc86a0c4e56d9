// Unit test runner - calls test functions from per-component test files

#include "test_auth.hpp"
#include "test_config.hpp"
#include "test_custody.hpp"
#include "test_ledger.hpp"
#include "test_persistence.hpp"
#include "test_script.hpp"
#include "test_telemetry.hpp"
#include "test_vault.hpp"

int main() {
  using namespace flashvault::tests;

  // Ledger tests
  test_settlement_counter();
  test_settlement_overflow();
  test_session_slot();
  test_app_reserve_sign_convention();
  test_reserve_store();
  test_journal_rollback();

  // Custody tests
  test_in_memory_bank();
  test_share_ledger();

  // Vault tests
  test_register_app();
  test_lock_lifecycle();
  test_permission_tiers();
  test_app_credit_scenario();
  test_app_underflow_scenario();
  test_pool_key_all_or_nothing();
  test_take_settle_round_trip();
  test_sync_then_settle_pays_nothing();
  test_settle_native_value();
  test_mint_and_burn();
  test_nested_failure_inside_session();
  test_lock_rollback();
  test_collect_fee();
  test_event_publication();
  test_event_sink_failure();

  // Telemetry tests
  test_telemetry_sink();
  test_vault_telemetry();

  // Auth tests
  test_authenticator();
  test_registration_signature();

  // Config tests
  test_default_config();
  test_config_validation();
  test_config_parse_errors();

  // Script tests
  test_default_sessions();
  test_unexpected_step_error();
  test_expected_error_not_raised();

  // Persistence/replay tests
  test_event_log();
  test_snapshot_image();
  test_custody_restart();
  test_restore_vault();

  return 0;
}
