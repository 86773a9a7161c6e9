#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <variant>

namespace settlement::db::sqlite {

using settlement::db::ErrorCode;
using settlement::db::Result;
namespace domain = settlement::model;

namespace {

// Finalizes on every return path.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindNull(sqlite3_stmt* st, int idx) {
  sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// Reads cannot report a Result; a statement that fails to prepare is a
// schema bug, not a missing row.
void RequirePrepared(const Statement& st, sqlite3* db) {
  if (!st.Prepared()) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
}

constexpr int kBiddingCorrelation      = 1;
constexpr int kVerificationCorrelation = 2;

constexpr const char* kRequestColumns =
    "SELECT id,issuer,created_at_ms,resolved_at_ms,status,selector,correlation_kind,asset_id,license_id,payment_index,failure_reason "
    "FROM decryption_requests";

model::RequestRecord ReadRequestRow(sqlite3_stmt* st) {
  model::RequestRecord r;
  r.id             = ColU64(st, 0);
  r.issuer         = ColText(st, 1);
  r.created_at_ms  = ColU64(st, 2);
  r.resolved_at_ms = ColU64(st, 3);
  r.status         = static_cast<domain::RequestStatus>(ColI32(st, 4));
  r.selector       = static_cast<domain::CallbackSelector>(ColI32(st, 5));
  if (ColI32(st, 6) == kVerificationCorrelation) {
    r.correlation = domain::VerificationCorrelation{ColU64(st, 8), ColU64(st, 9)};
  } else {
    r.correlation = domain::BiddingCorrelation{ColU64(st, 7)};
  }
  r.failure_reason = ColText(st, 10);
  return r;
}

std::vector<std::string> LoadHandles(sqlite3* db, std::uint64_t request_id) {
  Statement st(db, "SELECT handle FROM request_handles WHERE request_id=? ORDER BY position;");
  RequirePrepared(st, db);
  BindU64(st.get(), 1, request_id);

  std::vector<std::string> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ColText(st.get(), 0));
  return out;
}

constexpr const char* kSessionColumns = "SELECT asset_id,controller,phase,started_at_ms,end_time_ms,request_id,winner FROM bidding_sessions";

model::SessionRecord ReadSessionRow(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.asset_id      = ColU64(st, 0);
  r.controller    = ColText(st, 1);
  r.phase         = static_cast<domain::SessionPhase>(ColI32(st, 2));
  r.started_at_ms = ColU64(st, 3);
  r.end_time_ms   = ColU64(st, 4);
  r.request_id    = ColU64(st, 5);
  r.winner        = ColText(st, 6);
  return r;
}

std::vector<model::BidRecord> LoadBids(sqlite3* db, std::uint64_t asset_id) {
  Statement st(db, "SELECT bidder,escrow,handle,submitted_at_ms FROM session_bids WHERE asset_id=? ORDER BY position;");
  RequirePrepared(st, db);
  BindU64(st.get(), 1, asset_id);

  std::vector<model::BidRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::BidRecord b;
    b.bidder          = ColText(st.get(), 0);
    b.escrow          = ColU64(st.get(), 1);
    b.handle          = ColText(st.get(), 2);
    b.submitted_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(b));
  }
  return out;
}

constexpr const char* kPaymentColumns =
    "SELECT license_id,payment_index,payer,revenue_handle,paid_amount,paid_handle,reporting_period,paid_at_ms,outcome,request_id,"
    "expected_amount FROM royalty_payments";

model::PaymentRecord ReadPaymentRow(sqlite3_stmt* st) {
  model::PaymentRecord r;
  r.license_id       = ColU64(st, 0);
  r.index            = ColU64(st, 1);
  r.payer            = ColText(st, 2);
  r.revenue_handle   = ColText(st, 3);
  r.paid_amount      = ColU64(st, 4);
  r.paid_handle      = ColText(st, 5);
  r.reporting_period = ColU64(st, 6);
  r.paid_at_ms       = ColU64(st, 7);
  r.outcome          = static_cast<domain::VerificationOutcome>(ColI32(st, 8));
  r.request_id       = ColU64(st, 9);
  if (!ColIsNull(st, 10)) r.expected_amount = ColU64(st, 10);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sequences
// ------------------------------------------------------------------

Result SqliteRepository::NextSequence(Transaction& t, const std::string& name, std::uint64_t& value) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "INSERT INTO sequences(name,value) VALUES(?,1) ON CONFLICT(name) DO UPDATE SET value=value+1;");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, name);
    auto rc = Translate(db, st.Step());
    if (!rc) return rc;
  }

  Statement st(db, "SELECT value FROM sequences WHERE name=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, name);
  if (st.Step() != SQLITE_ROW) return Result::Err(ErrorCode::InternalError, "sequence row missing: " + name);
  value = ColU64(st.get(), 0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result SqliteRepository::WriteRequest(Transaction& t, const model::RequestRecord& r, bool insert) {
  auto* db = TX(t).Handle();

  const char* sql = insert ? "INSERT INTO decryption_requests(issuer,created_at_ms,resolved_at_ms,status,selector,correlation_kind,"
                             "asset_id,license_id,payment_index,failure_reason,id) VALUES(?,?,?,?,?,?,?,?,?,?,?);"
                           : "UPDATE decryption_requests SET issuer=?,created_at_ms=?,resolved_at_ms=?,status=?,selector=?,"
                             "correlation_kind=?,asset_id=?,license_id=?,payment_index=?,failure_reason=? WHERE id=?;";

  Statement st(db, sql);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int           kind = kBiddingCorrelation;
  std::uint64_t asset_id = 0, license_id = 0, payment_index = 0;
  if (const auto* bidding = std::get_if<domain::BiddingCorrelation>(&r.correlation)) {
    asset_id = bidding->asset_id;
  } else {
    const auto& verification = std::get<domain::VerificationCorrelation>(r.correlation);
    kind                     = kVerificationCorrelation;
    license_id               = verification.license_id;
    payment_index            = verification.payment_index;
  }

  BindText(st.get(), 1, r.issuer);
  BindU64(st.get(), 2, r.created_at_ms);
  BindU64(st.get(), 3, r.resolved_at_ms);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindI32(st.get(), 5, static_cast<int>(r.selector));
  BindI32(st.get(), 6, kind);
  BindU64(st.get(), 7, asset_id);
  BindU64(st.get(), 8, license_id);
  BindU64(st.get(), 9, payment_index);
  BindText(st.get(), 10, r.failure_reason);
  BindU64(st.get(), 11, r.id);

  auto rc = Translate(db, st.Step());
  if (!rc) return rc;
  if (!insert) {
    return sqlite3_changes(db) == 0 ? Result::Err(ErrorCode::NotFound) : Result::Ok();
  }

  // handles are immutable after insert
  for (std::size_t i = 0; i < r.handles.size(); ++i) {
    Statement hs(db, "INSERT INTO request_handles(request_id,position,handle) VALUES(?,?,?);");
    if (!hs.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(hs.get(), 1, r.id);
    BindI32(hs.get(), 2, static_cast<int>(i));
    BindText(hs.get(), 3, r.handles[i]);
    rc = Translate(db, hs.Step());
    if (!rc) return rc;
  }
  return Result::Ok();
}

Result SqliteRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  return WriteRequest(t, r, true);
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  return WriteRequest(t, r, false);
}

std::optional<model::RequestRecord> SqliteRepository::GetRequest(Transaction& t, std::uint64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kRequestColumns) + " WHERE id=?;").c_str());
  RequirePrepared(st, db);
  BindU64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto r    = ReadRequestRow(st.get());
  r.handles = LoadHandles(db, r.id);
  return r;
}

std::vector<model::RequestRecord> SqliteRepository::ListRequests(Transaction& t, std::optional<domain::RequestStatus> status) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kRequestColumns) + (status ? " WHERE status=? ORDER BY id;" : " ORDER BY id;");
  Statement         st(db, sql.c_str());
  RequirePrepared(st, db);
  if (status) BindI32(st.get(), 1, static_cast<int>(*status));

  std::vector<model::RequestRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadRequestRow(st.get()));
  for (auto& r : out) r.handles = LoadHandles(db, r.id);
  return out;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();

  {
    Statement st(db,
                 "INSERT INTO bidding_sessions(asset_id,controller,phase,started_at_ms,end_time_ms,request_id,winner) VALUES(?,?,?,?,?,?,?) "
                 "ON CONFLICT(asset_id) DO UPDATE SET controller=excluded.controller,phase=excluded.phase,started_at_ms=excluded.started_at_ms,"
                 "end_time_ms=excluded.end_time_ms,request_id=excluded.request_id,winner=excluded.winner;");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, r.asset_id);
    BindText(st.get(), 2, r.controller);
    BindI32(st.get(), 3, static_cast<int>(r.phase));
    BindU64(st.get(), 4, r.started_at_ms);
    BindU64(st.get(), 5, r.end_time_ms);
    BindU64(st.get(), 6, r.request_id);
    BindText(st.get(), 7, r.winner);
    auto rc = Translate(db, st.Step());
    if (!rc) return rc;
  }

  {
    Statement st(db, "DELETE FROM session_bids WHERE asset_id=?;");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, r.asset_id);
    auto rc = Translate(db, st.Step());
    if (!rc) return rc;
  }

  for (std::size_t i = 0; i < r.bids.size(); ++i) {
    const auto& b = r.bids[i];
    Statement   st(db, "INSERT INTO session_bids(asset_id,position,bidder,escrow,handle,submitted_at_ms) VALUES(?,?,?,?,?,?);");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, r.asset_id);
    BindI32(st.get(), 2, static_cast<int>(i));
    BindText(st.get(), 3, b.bidder);
    BindU64(st.get(), 4, b.escrow);
    BindText(st.get(), 5, b.handle);
    BindU64(st.get(), 6, b.submitted_at_ms);
    auto rc = Translate(db, st.Step());
    if (!rc) return rc;
  }
  return Result::Ok();
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, std::uint64_t asset_id) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kSessionColumns) + " WHERE asset_id=?;").c_str());
  RequirePrepared(st, db);
  BindU64(st.get(), 1, asset_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto r = ReadSessionRow(st.get());
  r.bids = LoadBids(db, r.asset_id);
  return r;
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kSessionColumns) + " ORDER BY asset_id;").c_str());
  RequirePrepared(st, db);

  std::vector<model::SessionRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadSessionRow(st.get()));
  for (auto& r : out) r.bids = LoadBids(db, r.asset_id);
  return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result SqliteRepository::WritePayment(Transaction& t, const model::PaymentRecord& r, bool insert) {
  auto* db = TX(t).Handle();

  const char* sql = insert ? "INSERT INTO royalty_payments(payer,revenue_handle,paid_amount,paid_handle,reporting_period,paid_at_ms,outcome,"
                             "request_id,expected_amount,license_id,payment_index) VALUES(?,?,?,?,?,?,?,?,?,?,?);"
                           : "UPDATE royalty_payments SET payer=?,revenue_handle=?,paid_amount=?,paid_handle=?,reporting_period=?,"
                             "paid_at_ms=?,outcome=?,request_id=?,expected_amount=? WHERE license_id=? AND payment_index=?;";

  Statement st(db, sql);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.payer);
  BindText(st.get(), 2, r.revenue_handle);
  BindU64(st.get(), 3, r.paid_amount);
  BindText(st.get(), 4, r.paid_handle);
  BindU64(st.get(), 5, r.reporting_period);
  BindU64(st.get(), 6, r.paid_at_ms);
  BindI32(st.get(), 7, static_cast<int>(r.outcome));
  BindU64(st.get(), 8, r.request_id);
  if (r.expected_amount) {
    BindU64(st.get(), 9, *r.expected_amount);
  } else {
    BindNull(st.get(), 9);
  }
  BindU64(st.get(), 10, r.license_id);
  BindU64(st.get(), 11, r.index);

  auto rc = Translate(db, st.Step());
  if (!rc) return rc;
  if (!insert && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::InsertPayment(Transaction& t, const model::PaymentRecord& r) {
  return WritePayment(t, r, true);
}

Result SqliteRepository::UpdatePayment(Transaction& t, const model::PaymentRecord& r) {
  return WritePayment(t, r, false);
}

std::optional<model::PaymentRecord> SqliteRepository::GetPayment(Transaction& t, std::uint64_t license_id, std::uint64_t index) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kPaymentColumns) + " WHERE license_id=? AND payment_index=?;").c_str());
  RequirePrepared(st, db);
  BindU64(st.get(), 1, license_id);
  BindU64(st.get(), 2, index);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadPaymentRow(st.get());
}

std::vector<model::PaymentRecord> SqliteRepository::ListPayments(Transaction& t, std::uint64_t license_id) {
  auto* db = TX(t).Handle();

  Statement st(db, (std::string(kPaymentColumns) + " WHERE license_id=? ORDER BY payment_index;").c_str());
  RequirePrepared(st, db);
  BindU64(st.get(), 1, license_id);

  std::vector<model::PaymentRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadPaymentRow(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Refunds
// ------------------------------------------------------------------

std::uint64_t SqliteRepository::GetRefundBalance(Transaction& t, const std::string& account) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT balance FROM refund_balances WHERE account=?;");
  RequirePrepared(st, db);
  BindText(st.get(), 1, account);
  if (st.Step() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::SetRefundBalance(Transaction& t, const std::string& account, std::uint64_t balance) {
  auto* db = TX(t).Handle();

  const char* sql = balance == 0 ? "DELETE FROM refund_balances WHERE account=?;"
                                 : "INSERT INTO refund_balances(account,balance) VALUES(?,?) "
                                   "ON CONFLICT(account) DO UPDATE SET balance=excluded.balance;";
  Statement   st(db, sql);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, account);
  if (balance != 0) BindU64(st.get(), 2, balance);
  return Translate(db, st.Step());
}

std::vector<model::RefundRecord> SqliteRepository::ListRefundBalances(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT account,balance FROM refund_balances WHERE balance > 0 ORDER BY account;");
  RequirePrepared(st, db);

  std::vector<model::RefundRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back({ColText(st.get(), 0), ColU64(st.get(), 1)});
  return out;
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> SqliteRepository::GetAccount(Transaction& t, const std::string& account) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT account,balance,accepts_payouts FROM accounts WHERE account=?;");
  RequirePrepared(st, db);
  BindText(st.get(), 1, account);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::AccountRecord r;
  r.account         = ColText(st.get(), 0);
  r.balance         = ColU64(st.get(), 1);
  r.accepts_payouts = ColI32(st.get(), 2) != 0;
  return r;
}

Result SqliteRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO accounts(account,balance,accepts_payouts) VALUES(?,?,?) "
               "ON CONFLICT(account) DO UPDATE SET balance=excluded.balance,accepts_payouts=excluded.accepts_payouts;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, r.account);
  BindU64(st.get(), 2, r.balance);
  BindI32(st.get(), 3, r.accepts_payouts ? 1 : 0);
  return Translate(db, st.Step());
}

std::uint64_t SqliteRepository::GetCustody(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT balance FROM custody WHERE id=1;");
  RequirePrepared(st, db);
  if (st.Step() != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::SetCustody(Transaction& t, std::uint64_t balance) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO custody(id,balance) VALUES(1,?) ON CONFLICT(id) DO UPDATE SET balance=excluded.balance;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, balance);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result SqliteRepository::WritePatent(Transaction& t, const model::PatentRecord& r, bool insert) {
  auto* db = TX(t).Handle();

  const char* sql = insert ? "INSERT INTO patents(owner,royalty_rate_handle,min_license_fee,exclusivity_days,validity_years,patent_hash,"
                             "territory_code,confidential,status,status_before_pause,registered_at_ms,expires_at_ms,exclusive_licensee,id) "
                             "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);"
                           : "UPDATE patents SET owner=?,royalty_rate_handle=?,min_license_fee=?,exclusivity_days=?,validity_years=?,"
                             "patent_hash=?,territory_code=?,confidential=?,status=?,status_before_pause=?,registered_at_ms=?,"
                             "expires_at_ms=?,exclusive_licensee=? WHERE id=?;";

  Statement st(db, sql);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.owner);
  BindText(st.get(), 2, r.royalty_rate_handle);
  BindU64(st.get(), 3, r.min_license_fee);
  BindI32(st.get(), 4, static_cast<int>(r.exclusivity_days));
  BindI32(st.get(), 5, static_cast<int>(r.validity_years));
  BindText(st.get(), 6, r.patent_hash);
  BindU64(st.get(), 7, r.territory_code);
  BindI32(st.get(), 8, r.confidential ? 1 : 0);
  BindI32(st.get(), 9, static_cast<int>(r.status));
  if (r.status_before_pause) {
    BindI32(st.get(), 10, static_cast<int>(*r.status_before_pause));
  } else {
    BindNull(st.get(), 10);
  }
  BindU64(st.get(), 11, r.registered_at_ms);
  BindU64(st.get(), 12, r.expires_at_ms);
  BindText(st.get(), 13, r.exclusive_licensee);
  BindU64(st.get(), 14, r.id);

  auto rc = Translate(db, st.Step());
  if (!rc) return rc;
  if (!insert && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::InsertPatent(Transaction& t, const model::PatentRecord& r) {
  return WritePatent(t, r, true);
}

Result SqliteRepository::UpdatePatent(Transaction& t, const model::PatentRecord& r) {
  return WritePatent(t, r, false);
}

std::optional<model::PatentRecord> SqliteRepository::GetPatent(Transaction& t, std::uint64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,owner,royalty_rate_handle,min_license_fee,exclusivity_days,validity_years,patent_hash,territory_code,"
               "confidential,status,status_before_pause,registered_at_ms,expires_at_ms,exclusive_licensee FROM patents WHERE id=?;");
  RequirePrepared(st, db);
  BindU64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto*               s = st.get();
  model::PatentRecord r;
  r.id                  = ColU64(s, 0);
  r.owner               = ColText(s, 1);
  r.royalty_rate_handle = ColText(s, 2);
  r.min_license_fee     = ColU64(s, 3);
  r.exclusivity_days    = static_cast<std::uint32_t>(ColI32(s, 4));
  r.validity_years      = static_cast<std::uint32_t>(ColI32(s, 5));
  r.patent_hash         = ColText(s, 6);
  r.territory_code      = static_cast<std::uint32_t>(ColU64(s, 7));
  r.confidential        = ColI32(s, 8) != 0;
  r.status              = static_cast<domain::PatentStatus>(ColI32(s, 9));
  if (!ColIsNull(s, 10)) r.status_before_pause = static_cast<domain::PatentStatus>(ColI32(s, 10));
  r.registered_at_ms   = ColU64(s, 11);
  r.expires_at_ms      = ColU64(s, 12);
  r.exclusive_licensee = ColText(s, 13);
  return r;
}

std::vector<std::uint64_t> SqliteRepository::ListPatentsByOwner(Transaction& t, const std::string& owner) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id FROM patents WHERE owner=? ORDER BY id;");
  RequirePrepared(st, db);
  BindText(st.get(), 1, owner);

  std::vector<std::uint64_t> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ColU64(st.get(), 0));
  return out;
}

Result SqliteRepository::WriteLicense(Transaction& t, const model::LicenseRecord& r, bool insert) {
  auto* db = TX(t).Handle();

  const char* sql = insert ? "INSERT INTO licenses(patent_id,licensee,licensor,proposed_fee,royalty_rate_handle,revenue_cap,duration_days,"
                             "is_exclusive,auto_renewal,territory_mask,status,requested_at_ms,starts_at_ms,ends_at_ms,id) "
                             "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);"
                           : "UPDATE licenses SET patent_id=?,licensee=?,licensor=?,proposed_fee=?,royalty_rate_handle=?,revenue_cap=?,"
                             "duration_days=?,is_exclusive=?,auto_renewal=?,territory_mask=?,status=?,requested_at_ms=?,starts_at_ms=?,"
                             "ends_at_ms=? WHERE id=?;";

  Statement st(db, sql);
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.patent_id);
  BindText(st.get(), 2, r.licensee);
  BindText(st.get(), 3, r.licensor);
  BindU64(st.get(), 4, r.proposed_fee);
  BindText(st.get(), 5, r.royalty_rate_handle);
  BindU64(st.get(), 6, r.revenue_cap);
  BindI32(st.get(), 7, static_cast<int>(r.duration_days));
  BindI32(st.get(), 8, r.exclusive ? 1 : 0);
  BindI32(st.get(), 9, r.auto_renewal ? 1 : 0);
  BindU64(st.get(), 10, r.territory_mask);
  BindI32(st.get(), 11, static_cast<int>(r.status));
  BindU64(st.get(), 12, r.requested_at_ms);
  BindU64(st.get(), 13, r.starts_at_ms);
  BindU64(st.get(), 14, r.ends_at_ms);
  BindU64(st.get(), 15, r.id);

  auto rc = Translate(db, st.Step());
  if (!rc) return rc;
  if (!insert && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::InsertLicense(Transaction& t, const model::LicenseRecord& r) {
  return WriteLicense(t, r, true);
}

Result SqliteRepository::UpdateLicense(Transaction& t, const model::LicenseRecord& r) {
  return WriteLicense(t, r, false);
}

std::optional<model::LicenseRecord> SqliteRepository::GetLicense(Transaction& t, std::uint64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,patent_id,licensee,licensor,proposed_fee,royalty_rate_handle,revenue_cap,duration_days,is_exclusive,"
               "auto_renewal,territory_mask,status,requested_at_ms,starts_at_ms,ends_at_ms FROM licenses WHERE id=?;");
  RequirePrepared(st, db);
  BindU64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  auto*                s = st.get();
  model::LicenseRecord r;
  r.id                  = ColU64(s, 0);
  r.patent_id           = ColU64(s, 1);
  r.licensee            = ColText(s, 2);
  r.licensor            = ColText(s, 3);
  r.proposed_fee        = ColU64(s, 4);
  r.royalty_rate_handle = ColText(s, 5);
  r.revenue_cap         = ColU64(s, 6);
  r.duration_days       = static_cast<std::uint32_t>(ColI32(s, 7));
  r.exclusive           = ColI32(s, 8) != 0;
  r.auto_renewal        = ColI32(s, 9) != 0;
  r.territory_mask      = static_cast<std::uint32_t>(ColU64(s, 10));
  r.status              = static_cast<domain::LicenseStatus>(ColI32(s, 11));
  r.requested_at_ms     = ColU64(s, 12);
  r.starts_at_ms        = ColU64(s, 13);
  r.ends_at_ms          = ColU64(s, 14);
  return r;
}

std::vector<std::uint64_t> SqliteRepository::ListLicensesByLicensee(Transaction& t, const std::string& licensee) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT id FROM licenses WHERE licensee=? ORDER BY id;");
  RequirePrepared(st, db);
  BindText(st.get(), 1, licensee);

  std::vector<std::uint64_t> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ColU64(st.get(), 0));
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& record) {
  auto* db = TX(t).Handle();

  auto rc = NextSequence(t, "events", record.sequence);
  if (!rc) return rc;

  {
    Statement st(db, "INSERT INTO events(sequence,kind,occurred_at_ms) VALUES(?,?,?);");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, record.sequence);
    BindI32(st.get(), 2, static_cast<int>(record.kind));
    BindU64(st.get(), 3, record.occurred_at_ms);
    rc = Translate(db, st.Step());
    if (!rc) return rc;
  }

  for (std::size_t i = 0; i < record.attributes.size(); ++i) {
    Statement st(db, "INSERT INTO event_attributes(sequence,position,attr_key,attr_value) VALUES(?,?,?,?);");
    if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, record.sequence);
    BindI32(st.get(), 2, static_cast<int>(i));
    BindText(st.get(), 3, record.attributes[i].key);
    BindText(st.get(), 4, record.attributes[i].value);
    rc = Translate(db, st.Step());
    if (!rc) return rc;
  }
  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, std::uint64_t after_sequence, std::uint64_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT sequence,kind,occurred_at_ms FROM events WHERE sequence > ? ORDER BY sequence LIMIT ?;");
  RequirePrepared(st, db);
  BindU64(st.get(), 1, after_sequence);
  BindU64(st.get(), 2, limit);

  std::vector<model::EventRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::EventRecord e;
    e.sequence       = ColU64(st.get(), 0);
    e.kind           = static_cast<domain::EventKind>(ColI32(st.get(), 1));
    e.occurred_at_ms = ColU64(st.get(), 2);
    out.push_back(std::move(e));
  }

  for (auto& e : out) {
    Statement as(db, "SELECT attr_key,attr_value FROM event_attributes WHERE sequence=? ORDER BY position;");
    RequirePrepared(as, db);
    BindU64(as.get(), 1, e.sequence);
    while (as.Step() == SQLITE_ROW) e.attributes.push_back({ColText(as.get(), 0), ColText(as.get(), 1)});
  }
  return out;
}

} // namespace settlement::db::sqlite
