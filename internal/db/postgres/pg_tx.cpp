#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace settlement::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  // must be the first statement of the transaction
  tx_ = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SET TRANSACTION ISOLATION LEVEL SERIALIZABLE");
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace settlement::db::postgres
