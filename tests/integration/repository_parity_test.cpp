#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if SETTLEMENT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SETTLEMENT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using settlement::db::Repository;
using settlement::db::memory::MemoryRepository;
using settlement::db::model::AccountRecord;
using settlement::db::model::BidRecord;
using settlement::db::model::EventRecord;
using settlement::db::model::LicenseRecord;
using settlement::db::model::PatentRecord;
using settlement::db::model::PaymentRecord;
using settlement::db::model::RequestRecord;
using settlement::db::model::SessionRecord;
using settlement::model::BiddingCorrelation;
using settlement::model::CallbackSelector;
using settlement::model::EventKind;
using settlement::model::LicenseStatus;
using settlement::model::PatentStatus;
using settlement::model::RequestStatus;
using settlement::model::SessionPhase;
using settlement::model::VerificationCorrelation;
using settlement::model::VerificationOutcome;

constexpr std::uint64_t kMaxU64 = std::numeric_limits<std::uint64_t>::max();

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// How a backend treats a second writer while the first is still open.
enum class WriterModel {
  kFirstCommitterWins, // the later commit throws
  kSerialized,         // the second Begin throws on the shared connection
  kLastWriterWins,     // both commit
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  WriterModel                                       writers = WriterModel::kFirstCommitterWins;
};

std::uint64_t Next(Repository& repo, settlement::db::Transaction& tx, const std::string& name) {
  std::uint64_t value = 0;
  assert(repo.NextSequence(tx, name, value));
  return value;
}

void VerifyRequestLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  RequestRecord bidding;
  bidding.id            = Next(repo, *tx, "requests");
  bidding.issuer        = "owner";
  bidding.created_at_ms = 1000;
  bidding.correlation   = BiddingCorrelation{.asset_id = 9};
  bidding.selector      = CallbackSelector::kCompleteBidding;
  bidding.handles       = {"h-b", "h-a", "h-c"};
  assert(repo.InsertRequest(*tx, bidding));

  RequestRecord verification;
  verification.id            = Next(repo, *tx, "requests");
  verification.issuer        = "licensee";
  verification.created_at_ms = 2000;
  verification.correlation   = VerificationCorrelation{.license_id = 4, .payment_index = 2};
  verification.selector      = CallbackSelector::kCompleteVerification;
  verification.handles       = {"h-rev", "h-rate"};
  assert(repo.InsertRequest(*tx, verification));
  assert(verification.id == bidding.id + 1);

  auto read = repo.GetRequest(*tx, bidding.id);
  assert(read.has_value());
  assert(read->status == RequestStatus::kPending);
  assert(read->resolved_at_ms == 0);
  assert((read->handles == std::vector<std::string>{"h-b", "h-a", "h-c"}));
  assert(std::get<BiddingCorrelation>(read->correlation).asset_id == 9);

  auto other = repo.GetRequest(*tx, verification.id);
  assert(other.has_value());
  assert(other->selector == CallbackSelector::kCompleteVerification);
  assert((std::get<VerificationCorrelation>(other->correlation) == VerificationCorrelation{.license_id = 4, .payment_index = 2}));

  read->status         = RequestStatus::kFailed;
  read->resolved_at_ms = 3000;
  read->failure_reason = "attestation invalid";
  assert(repo.UpdateRequest(*tx, *read));
  tx->Commit();

  auto check = repo.Begin();
  const auto failed = repo.ListRequests(*check, RequestStatus::kFailed);
  assert(failed.size() == 1);
  assert(failed[0].failure_reason == "attestation invalid");
  assert(failed[0].resolved_at_ms == 3000);

  const auto pending = repo.ListRequests(*check, RequestStatus::kPending);
  assert(pending.size() == 1);
  assert(pending[0].id == verification.id);

  const auto all = repo.ListRequests(*check, std::nullopt);
  assert(all.size() == 2);
  assert(all[0].id < all[1].id);

  assert(!repo.GetRequest(*check, verification.id + 100).has_value());
  check->Commit();

  // a failed statement can poison the transaction, so it gets its own
  auto duplicate = repo.Begin();
  assert(!repo.InsertRequest(*duplicate, bidding));
  duplicate->Rollback();
}

void VerifySessionReplacement(Repository& repo) {
  auto tx = repo.Begin();

  SessionRecord session;
  session.asset_id      = 21;
  session.controller    = "owner";
  session.started_at_ms = 100;
  session.end_time_ms   = 3600100;
  session.bids          = {BidRecord{.bidder = "alice", .escrow = 10, .handle = "h1", .submitted_at_ms = 200},
                           BidRecord{.bidder = "bob", .escrow = kMaxU64, .handle = "h2", .submitted_at_ms = 300}};
  assert(repo.UpsertSession(*tx, session));

  auto read = repo.GetSession(*tx, 21);
  assert(read.has_value());
  assert(read->phase == SessionPhase::kOpen);
  assert(read->bids.size() == 2);
  assert(read->bids[0].bidder == "alice");
  assert(read->bids[1].escrow == kMaxU64);

  read->phase      = SessionPhase::kResolved;
  read->request_id = 7;
  read->winner     = "bob";
  read->bids.pop_back();
  assert(repo.UpsertSession(*tx, *read));

  auto updated = repo.GetSession(*tx, 21);
  assert(updated->phase == SessionPhase::kResolved);
  assert(updated->winner == "bob");
  assert(updated->request_id == 7);
  assert(updated->bids.size() == 1);

  assert(repo.ListSessions(*tx).size() == 1);
  assert(!repo.GetSession(*tx, 22).has_value());
  tx->Commit();
}

void VerifyPayments(Repository& repo) {
  auto tx = repo.Begin();

  for (std::uint64_t i = 0; i < 3; ++i) {
    PaymentRecord payment;
    payment.license_id       = 5;
    payment.index            = i;
    payment.payer            = "licensee";
    payment.revenue_handle   = "rev-" + std::to_string(i);
    payment.paid_amount      = 100 + i;
    payment.paid_handle      = "paid-" + std::to_string(i);
    payment.reporting_period = 202601 + i;
    payment.paid_at_ms       = 1000 * i;
    assert(repo.InsertPayment(*tx, payment));
  }

  auto payment = repo.GetPayment(*tx, 5, 1);
  assert(payment.has_value());
  assert(payment->outcome == VerificationOutcome::kUnverified);
  assert(!payment->expected_amount.has_value());
  assert(payment->request_id == 0);

  payment->request_id      = 12;
  payment->outcome         = VerificationOutcome::kValid;
  payment->expected_amount = 95;
  assert(repo.UpdatePayment(*tx, *payment));

  const auto listed = repo.ListPayments(*tx, 5);
  assert(listed.size() == 3);
  assert(listed[0].index == 0 && listed[2].index == 2);
  assert(listed[1].expected_amount.value() == 95);
  assert(listed[1].outcome == VerificationOutcome::kValid);
  assert(listed[1].request_id == 12);

  assert(repo.ListPayments(*tx, 6).empty());
  assert(!repo.GetPayment(*tx, 5, 3).has_value());
  tx->Commit();
}

void VerifyBalancesAndCustody(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.GetRefundBalance(*tx, "carol") == 0);
  assert(repo.SetRefundBalance(*tx, "carol", 30));
  assert(repo.SetRefundBalance(*tx, "bob", 20));
  assert(repo.SetRefundBalance(*tx, "dave", 0));

  const auto refunds = repo.ListRefundBalances(*tx);
  assert(refunds.size() == 2);
  assert(refunds[0].account == "bob" && refunds[0].balance == 20);
  assert(refunds[1].account == "carol" && refunds[1].balance == 30);

  assert(repo.SetRefundBalance(*tx, "bob", 0));
  assert(repo.ListRefundBalances(*tx).size() == 1);

  assert(!repo.GetAccount(*tx, "alice").has_value());
  assert(repo.UpsertAccount(*tx, AccountRecord{.account = "alice", .balance = kMaxU64, .accepts_payouts = false}));
  auto alice = repo.GetAccount(*tx, "alice");
  assert(alice.has_value());
  assert(alice->balance == kMaxU64);
  assert(!alice->accepts_payouts);

  assert(repo.GetCustody(*tx) == 0);
  assert(repo.SetCustody(*tx, 50));
  assert(repo.GetCustody(*tx) == 50);
  tx->Commit();
}

void VerifyAgreements(Repository& repo) {
  auto tx = repo.Begin();

  PatentRecord patent;
  patent.id                  = Next(repo, *tx, "patents");
  patent.owner               = "owner";
  patent.royalty_rate_handle = "rate-handle";
  patent.min_license_fee     = 10;
  patent.validity_years      = 20;
  patent.patent_hash         = "sha256:abc";
  patent.confidential        = true;
  patent.registered_at_ms    = 1;
  patent.expires_at_ms       = 2;
  assert(repo.InsertPatent(*tx, patent));

  auto read = repo.GetPatent(*tx, patent.id);
  assert(read.has_value());
  assert(read->confidential);
  assert(!read->status_before_pause.has_value());

  read->status              = PatentStatus::kSuspended;
  read->status_before_pause = PatentStatus::kExclusivelyLicensed;
  read->exclusive_licensee  = "licensee";
  assert(repo.UpdatePatent(*tx, *read));

  auto paused = repo.GetPatent(*tx, patent.id);
  assert(paused->status == PatentStatus::kSuspended);
  assert(paused->status_before_pause == PatentStatus::kExclusivelyLicensed);
  assert(paused->exclusive_licensee == "licensee");
  assert((repo.ListPatentsByOwner(*tx, "owner") == std::vector<std::uint64_t>{patent.id}));
  assert(repo.ListPatentsByOwner(*tx, "nobody").empty());

  LicenseRecord license;
  license.id                  = Next(repo, *tx, "licenses");
  license.patent_id           = patent.id;
  license.licensee            = "licensee";
  license.licensor            = "owner";
  license.royalty_rate_handle = "license-rate";
  license.duration_days       = 365;
  license.exclusive           = true;
  license.territory_mask      = 0xff;
  assert(repo.InsertLicense(*tx, license));

  auto lic = repo.GetLicense(*tx, license.id);
  assert(lic.has_value());
  assert(lic->status == LicenseStatus::kPending);
  lic->status       = LicenseStatus::kActive;
  lic->starts_at_ms = 10;
  lic->ends_at_ms   = 20;
  assert(repo.UpdateLicense(*tx, *lic));
  assert(repo.GetLicense(*tx, license.id)->status == LicenseStatus::kActive);
  assert(repo.GetLicense(*tx, license.id)->territory_mask == 0xff);
  assert((repo.ListLicensesByLicensee(*tx, "licensee") == std::vector<std::uint64_t>{license.id}));
  tx->Commit();
}

void VerifyEvents(Repository& repo) {
  auto tx = repo.Begin();

  std::uint64_t last = 0;
  for (int i = 0; i < 3; ++i) {
    EventRecord event;
    event.kind           = i == 0 ? EventKind::kRequestIssued : EventKind::kRefundCredited;
    event.occurred_at_ms = 500 + i;
    event.attributes     = {{"account", "bob"}, {"amount", std::to_string(i)}};
    assert(repo.AppendEvent(*tx, event));
    assert(event.sequence > last);
    last = event.sequence;
  }
  tx->Commit();

  auto check = repo.Begin();
  const auto all = repo.ListEvents(*check, 0, 100);
  assert(all.size() >= 3);

  const auto tail = repo.ListEvents(*check, last - 2, 1);
  assert(tail.size() == 1);
  assert(tail[0].sequence == last - 1);
  assert(tail[0].kind == EventKind::kRefundCredited);
  assert(tail[0].attributes.size() == 2);
  assert(tail[0].attributes[0].key == "account");
  assert(tail[0].attributes[1].value == "1");

  assert(repo.ListEvents(*check, last, 10).empty());
  check->Commit();
}

void VerifyRollbackLeavesNoTrace(Repository& repo) {
  std::uint64_t burned = 0;
  {
    auto tx = repo.Begin();
    burned  = Next(repo, *tx, "rollback");
    assert(repo.SetRefundBalance(*tx, "rolled", 99));
    assert(repo.SetCustody(*tx, 12345));
    tx->Rollback();
  }

  auto check = repo.Begin();
  assert(repo.GetRefundBalance(*check, "rolled") == 0);
  assert(repo.GetCustody(*check) != 12345);
  assert(Next(repo, *check, "rollback") == burned);
  check->Commit();
}

void VerifyConcurrentWriters(Repository& repo, WriterModel writers) {
  auto tx1 = repo.Begin();

  if (writers == WriterModel::kSerialized) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.SetRefundBalance(*tx1, "racer", 1));
  tx1->Commit();

  // tx2 started before tx1 committed
  assert(repo.SetRefundBalance(*tx2, "racer", 2));

  if (writers == WriterModel::kFirstCommitterWins) {
    bool threw = false;
    try {
      tx2->Commit();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  } else {
    tx2->Commit();
  }

  auto verify = repo.Begin();
  assert(repo.GetRefundBalance(*verify, "racer") == (writers == WriterModel::kFirstCommitterWins ? 1u : 2u));
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto          repo = backend.make_repository();
  std::uint64_t request_id = 0;
  {
    auto tx    = repo->Begin();
    request_id = Next(*repo, *tx, "durable");

    RequestRecord request;
    request.id          = request_id + 1000000;
    request.issuer      = "durable";
    request.correlation = BiddingCorrelation{.asset_id = 77};
    request.handles     = {"d1"};
    assert(repo->InsertRequest(*tx, request));
    assert(repo->SetRefundBalance(*tx, "durable", 42));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetRequest(*tx, request_id + 1000000);
  assert(r.has_value());
  assert(r->issuer == "durable");
  assert((r->handles == std::vector<std::string>{"d1"}));
  assert(repo->GetRefundBalance(*tx, "durable") == 42);
  assert(Next(*repo, *tx, "durable") == request_id + 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .writers          = WriterModel::kFirstCommitterWins,
  };
}

#if SETTLEMENT_DB_SQLITE
class SqliteMigrationExecutor final : public settlement::db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(settlement::db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  settlement::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("settlement_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto                    db = std::make_shared<settlement::db::sqlite::SqliteDB>(db_path);
    SqliteMigrationExecutor executor(*db);
    settlement::db::sql::RunMigrations(executor);
    return std::make_shared<settlement::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .writers = WriterModel::kSerialized,
  };
}
#endif

#if SETTLEMENT_DB_POSTGRES
class PostgresMigrationExecutor final : public settlement::db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SETTLEMENT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SETTLEMENT_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  {
    // start from an empty schema so the suite's fixed keys do not collide
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    tx.exec("DROP SCHEMA public CASCADE; CREATE SCHEMA public;");
    PostgresMigrationExecutor executor(tx);
    settlement::db::sql::RunMigrations(executor);
    tx.commit();
  }

  auto make_repo = [conninfo]() {
    return std::make_shared<settlement::db::postgres::PgRepository>(std::make_shared<settlement::db::postgres::PgPool>(conninfo, 4));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .writers          = WriterModel::kLastWriterWins,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyRequestLifecycle(*repo);
  VerifySessionReplacement(*repo);
  VerifyPayments(*repo);
  VerifyBalancesAndCustody(*repo);
  VerifyAgreements(*repo);
  VerifyEvents(*repo);
  VerifyRollbackLeavesNoTrace(*repo);
  VerifyConcurrentWriters(*repo, backend.writers);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SETTLEMENT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SETTLEMENT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "settlement_integration_repository_parity: pass\n";
  return 0;
}
