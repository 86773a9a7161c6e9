#include "pg_pool.hpp"

#include <exception>

namespace settlement::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("next_sequence",
               "INSERT INTO sequences(name,value) VALUES($1,1) "
               "ON CONFLICT(name) DO UPDATE SET value=sequences.value+1 RETURNING value");

  conn.prepare("get_refund_balance", "SELECT balance FROM refund_balances WHERE account=$1");

  conn.prepare("set_refund_balance",
               "INSERT INTO refund_balances(account,balance) VALUES($1,$2) "
               "ON CONFLICT(account) DO UPDATE SET balance=EXCLUDED.balance");

  conn.prepare("clear_refund_balance", "DELETE FROM refund_balances WHERE account=$1");

  conn.prepare("get_account", "SELECT account,balance,accepts_payouts FROM accounts WHERE account=$1");

  conn.prepare("upsert_account",
               "INSERT INTO accounts(account,balance,accepts_payouts) VALUES($1,$2,$3) "
               "ON CONFLICT(account) DO UPDATE SET balance=EXCLUDED.balance,accepts_payouts=EXCLUDED.accepts_payouts");

  conn.prepare("get_custody", "SELECT balance FROM custody WHERE id=1");

  conn.prepare("set_custody", "INSERT INTO custody(id,balance) VALUES(1,$1) ON CONFLICT(id) DO UPDATE SET balance=EXCLUDED.balance");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace settlement::db::postgres
