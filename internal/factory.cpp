#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/oracle_callback_server.hpp"
#include "internal/grpc/refund_server.hpp"
#include "internal/grpc/registry_server.hpp"
#include "internal/grpc/royalty_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/oracle/attestation.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/oracle_callback_service.hpp"
#include "internal/service/refund_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/royalty_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"
#if SETTLEMENT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SETTLEMENT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace settlement::factory {

using settlement::runtime::config::RuntimeConfig;

namespace {

#if SETTLEMENT_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if SETTLEMENT_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

private:
  pqxx::work& tx_;
};
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SETTLEMENT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor);
    SETTLEMENT_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SETTLEMENT_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    {
      // pooled connections prepare statements against the schema, so it
      // must exist first
      pqxx::connection conn(database.postgres().connection_uri());
      pqxx::work       tx(conn);
      PostgresMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor);
      tx.commit();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    SETTLEMENT_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SETTLEMENT_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
  Used when the oracle runs out of process. The request is already in the
  event log (RequestIssued) which is what the external oracle follows, so
  dispatch only needs to be visible in the logs.
*/
class ExternalOracleClient final : public oracle::OracleClient {
public:
  void RequestDecryption(model::RequestId id, const std::vector<model::CiphertextHandle>& handles,
                         model::CallbackSelector selector) override {
    SETTLEMENT_LOG_INFO("Decryption request published",
                        {observability::IntField("request_id", static_cast<std::int64_t>(id)),
                         observability::IntField("handles", static_cast<std::int64_t>(handles.size())),
                         observability::StringField("selector", model::ToString(selector))});
  }
};

std::string DecodeKey(const std::string& hex, const char* what) {
  auto raw = util::FromHex(hex);
  if (raw.size() != oracle::kEd25519KeyBytes) {
    throw util::InvalidInput(std::string(what) + " must be 32 bytes of hex");
  }
  return raw;
}

core::EngineOptions BuildEngineOptions(const RuntimeConfig& config) {
  core::EngineOptions options;

  if (config.coordinator().has_request_timeout()) {
    options.coordinator.request_timeout = util::FromProto(config.coordinator().request_timeout());
  }

  const auto& bidding = config.bidding();
  options.bidding.min_hours  = bidding.min_duration_hours();
  options.bidding.max_hours  = bidding.max_duration_hours();
  options.bidding.min_escrow = bidding.min_escrow();

  const auto& verification = config.verification();
  options.verification.rate_denominator      = verification.rate_denominator();
  options.verification.tolerance_numerator   = verification.tolerance_numerator();
  options.verification.tolerance_denominator = verification.tolerance_denominator();

  options.registry.operator_account = config.registry().operator_account();
  return options;
}

} // namespace

void Application::Stop() {
  if (local_oracle) {
    local_oracle->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and clock
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto clock      = std::make_shared<util::SystemTimeSource>();
  auto vault      = std::make_shared<cipher::CiphertextVault>();

  // ------------------------------------------------------------------
  // Oracle
  // ------------------------------------------------------------------
  const auto& oracle_config = config.oracle();
  const bool  local_enabled = oracle_config.local().enabled();

  std::shared_ptr<oracle::Ed25519Signer> signer;
  if (local_enabled) {
    if (oracle_config.local().signing_seed().empty()) {
      throw util::InvalidInput("oracle.local.signing_seed is required when the local oracle is enabled");
    }
    signer = std::make_shared<oracle::Ed25519Signer>(DecodeKey(oracle_config.local().signing_seed(), "oracle.local.signing_seed"));
  }

  std::string public_key;
  if (!oracle_config.attestation_public_key().empty()) {
    public_key = DecodeKey(oracle_config.attestation_public_key(), "oracle.attestation_public_key");
  } else if (signer) {
    public_key = signer->PublicKey();
  } else {
    throw util::InvalidInput("oracle.attestation_public_key is required without a local oracle");
  }
  auto verifier = std::make_shared<oracle::Ed25519Verifier>(public_key);

  std::shared_ptr<oracle::OracleClient> oracle_client;
  if (local_enabled) {
    oracle::LocalOracleOptions local_options;
    local_options.auto_deliver   = oracle_config.local().auto_deliver();
    local_options.delivery_delay = std::chrono::milliseconds(oracle_config.local().delivery_delay_ms());
    app.local_oracle = std::make_shared<oracle::LocalOracle>(vault, signer, clock, local_options);
    oracle_client    = app.local_oracle;
  } else {
    oracle_client = std::make_shared<ExternalOracleClient>();
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.engine = std::make_shared<core::SettlementEngine>(repository, oracle_client, verifier, vault, clock, BuildEngineOptions(config));

  if (app.local_oracle) {
    app.local_oracle->SetSink(std::make_shared<core::EngineCallbackSink>(app.engine));
    app.local_oracle->Start();
  }

  SETTLEMENT_LOG_INFO("Settlement engine ready",
                      {observability::BoolField("local_oracle", local_enabled),
                       observability::BoolField("auto_deliver", local_enabled && oracle_config.local().auto_deliver()),
                       observability::IntField("request_timeout_s",
                                               std::chrono::duration_cast<std::chrono::seconds>(app.engine->RequestTimeout()).count())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine       = app.engine;
  ctx.local_oracle = app.local_oracle;

  auto registry_service = std::make_shared<service::RegistryService>(ctx);
  auto auction_service  = std::make_shared<service::AuctionService>(ctx);
  auto royalty_service  = std::make_shared<service::RoyaltyService>(ctx);
  auto refund_service   = std::make_shared<service::RefundService>(ctx);
  auto callback_service = std::make_shared<service::OracleCallbackService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RegistryServer>(registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::AuctionServer>(auction_service));
  app.grpc_services.push_back(std::make_unique<grpc::RoyaltyServer>(royalty_service));
  app.grpc_services.push_back(std::make_unique<grpc::RefundServer>(refund_service));
  app.grpc_services.push_back(std::make_unique<grpc::OracleCallbackServer>(callback_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace settlement::factory
