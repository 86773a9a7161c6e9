#include "internal/db/sql/migrations.hpp"

namespace settlement::db::sql {

const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS sequences (name TEXT PRIMARY KEY, value BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS decryption_requests (id BIGINT PRIMARY KEY, issuer TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "resolved_at_ms BIGINT NOT NULL, status INTEGER NOT NULL, selector INTEGER NOT NULL, correlation_kind INTEGER NOT NULL, "
      "asset_id BIGINT NOT NULL, license_id BIGINT NOT NULL, payment_index BIGINT NOT NULL, failure_reason TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS request_handles (request_id BIGINT NOT NULL REFERENCES decryption_requests(id), position INTEGER NOT NULL, "
      "handle TEXT NOT NULL, PRIMARY KEY (request_id, position));",

      "CREATE TABLE IF NOT EXISTS bidding_sessions (asset_id BIGINT PRIMARY KEY, controller TEXT NOT NULL, phase INTEGER NOT NULL, "
      "started_at_ms BIGINT NOT NULL, end_time_ms BIGINT NOT NULL, request_id BIGINT NOT NULL, winner TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS session_bids (asset_id BIGINT NOT NULL REFERENCES bidding_sessions(asset_id), position INTEGER NOT NULL, "
      "bidder TEXT NOT NULL, escrow BIGINT NOT NULL, handle TEXT NOT NULL, submitted_at_ms BIGINT NOT NULL, PRIMARY KEY (asset_id, position));",

      "CREATE TABLE IF NOT EXISTS royalty_payments (license_id BIGINT NOT NULL, payment_index BIGINT NOT NULL, payer TEXT NOT NULL, "
      "revenue_handle TEXT NOT NULL, paid_amount BIGINT NOT NULL, paid_handle TEXT NOT NULL, reporting_period BIGINT NOT NULL, "
      "paid_at_ms BIGINT NOT NULL, outcome INTEGER NOT NULL, request_id BIGINT NOT NULL, expected_amount BIGINT, "
      "PRIMARY KEY (license_id, payment_index));",

      "CREATE TABLE IF NOT EXISTS refund_balances (account TEXT PRIMARY KEY, balance BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS accounts (account TEXT PRIMARY KEY, balance BIGINT NOT NULL, accepts_payouts INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS custody (id INTEGER PRIMARY KEY, balance BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS patents (id BIGINT PRIMARY KEY, owner TEXT NOT NULL, royalty_rate_handle TEXT NOT NULL, "
      "min_license_fee BIGINT NOT NULL, exclusivity_days INTEGER NOT NULL, validity_years INTEGER NOT NULL, patent_hash TEXT NOT NULL, "
      "territory_code BIGINT NOT NULL, confidential INTEGER NOT NULL, status INTEGER NOT NULL, status_before_pause INTEGER, "
      "registered_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, exclusive_licensee TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS patents_owner_idx ON patents(owner);",

      "CREATE TABLE IF NOT EXISTS licenses (id BIGINT PRIMARY KEY, patent_id BIGINT NOT NULL REFERENCES patents(id), licensee TEXT NOT NULL, "
      "licensor TEXT NOT NULL, proposed_fee BIGINT NOT NULL, royalty_rate_handle TEXT NOT NULL, revenue_cap BIGINT NOT NULL, "
      "duration_days INTEGER NOT NULL, is_exclusive INTEGER NOT NULL, auto_renewal INTEGER NOT NULL, territory_mask BIGINT NOT NULL, "
      "status INTEGER NOT NULL, requested_at_ms BIGINT NOT NULL, starts_at_ms BIGINT NOT NULL, ends_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS licenses_licensee_idx ON licenses(licensee);",

      "CREATE TABLE IF NOT EXISTS events (sequence BIGINT PRIMARY KEY, kind INTEGER NOT NULL, occurred_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS event_attributes (sequence BIGINT NOT NULL REFERENCES events(sequence), position INTEGER NOT NULL, "
      "attr_key TEXT NOT NULL, attr_value TEXT NOT NULL, PRIMARY KEY (sequence, position));",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor) {
  for (const auto& sql : SchemaStatements()) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace settlement::db::sql
