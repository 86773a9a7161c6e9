#include "pg_repository.hpp"

#include <variant>

namespace settlement::db::postgres {

namespace domain = settlement::model;

namespace {

// BIGINT is signed; u64 values round-trip through the same bit pattern.
std::int64_t I64(std::uint64_t v) {
  return static_cast<std::int64_t>(v);
}

std::uint64_t U64(const pqxx::field& f) {
  return static_cast<std::uint64_t>(f.as<std::int64_t>());
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

constexpr int kBiddingCorrelation      = 1;
constexpr int kVerificationCorrelation = 2;

constexpr const char* kRequestColumns =
    "SELECT id,issuer,created_at_ms,resolved_at_ms,status,selector,correlation_kind,asset_id,license_id,payment_index,failure_reason "
    "FROM decryption_requests";

model::RequestRecord ReadRequestRow(const pqxx::row& row) {
  model::RequestRecord r;
  r.id             = U64(row[0]);
  r.issuer         = Text(row[1]);
  r.created_at_ms  = U64(row[2]);
  r.resolved_at_ms = U64(row[3]);
  r.status         = static_cast<domain::RequestStatus>(row[4].as<int>());
  r.selector       = static_cast<domain::CallbackSelector>(row[5].as<int>());
  if (row[6].as<int>() == kVerificationCorrelation) {
    r.correlation = domain::VerificationCorrelation{U64(row[8]), U64(row[9])};
  } else {
    r.correlation = domain::BiddingCorrelation{U64(row[7])};
  }
  r.failure_reason = Text(row[10]);
  return r;
}

std::vector<std::string> LoadHandles(pqxx::work& w, std::uint64_t request_id) {
  auto res = w.exec_params("SELECT handle FROM request_handles WHERE request_id=$1 ORDER BY position;", I64(request_id));

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Text(row[0]));
  return out;
}

constexpr const char* kSessionColumns = "SELECT asset_id,controller,phase,started_at_ms,end_time_ms,request_id,winner FROM bidding_sessions";

model::SessionRecord ReadSessionRow(const pqxx::row& row) {
  model::SessionRecord r;
  r.asset_id      = U64(row[0]);
  r.controller    = Text(row[1]);
  r.phase         = static_cast<domain::SessionPhase>(row[2].as<int>());
  r.started_at_ms = U64(row[3]);
  r.end_time_ms   = U64(row[4]);
  r.request_id    = U64(row[5]);
  r.winner        = Text(row[6]);
  return r;
}

std::vector<model::BidRecord> LoadBids(pqxx::work& w, std::uint64_t asset_id) {
  auto res = w.exec_params("SELECT bidder,escrow,handle,submitted_at_ms FROM session_bids WHERE asset_id=$1 ORDER BY position;", I64(asset_id));

  std::vector<model::BidRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::BidRecord b;
    b.bidder          = Text(row[0]);
    b.escrow          = U64(row[1]);
    b.handle          = Text(row[2]);
    b.submitted_at_ms = U64(row[3]);
    out.push_back(std::move(b));
  }
  return out;
}

constexpr const char* kPaymentColumns =
    "SELECT license_id,payment_index,payer,revenue_handle,paid_amount,paid_handle,reporting_period,paid_at_ms,outcome,request_id,"
    "expected_amount FROM royalty_payments";

model::PaymentRecord ReadPaymentRow(const pqxx::row& row) {
  model::PaymentRecord r;
  r.license_id       = U64(row[0]);
  r.index            = U64(row[1]);
  r.payer            = Text(row[2]);
  r.revenue_handle   = Text(row[3]);
  r.paid_amount      = U64(row[4]);
  r.paid_handle      = Text(row[5]);
  r.reporting_period = U64(row[6]);
  r.paid_at_ms       = U64(row[7]);
  r.outcome          = static_cast<domain::VerificationOutcome>(row[8].as<int>());
  r.request_id       = U64(row[9]);
  if (!row[10].is_null()) r.expected_amount = U64(row[10]);
  return r;
}

constexpr const char* kPatentColumns =
    "SELECT id,owner,royalty_rate_handle,min_license_fee,exclusivity_days,validity_years,patent_hash,territory_code,confidential,"
    "status,status_before_pause,registered_at_ms,expires_at_ms,exclusive_licensee FROM patents";

constexpr const char* kLicenseColumns =
    "SELECT id,patent_id,licensee,licensor,proposed_fee,royalty_rate_handle,revenue_cap,duration_days,is_exclusive,auto_renewal,"
    "territory_mask,status,requested_at_ms,starts_at_ms,ends_at_ms FROM licenses";

std::optional<int> OptionalStatus(const std::optional<domain::PatentStatus>& status) {
  if (!status) return std::nullopt;
  return static_cast<int>(*status);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::NextSequence(Transaction& t, const std::string& name, std::uint64_t& value) {
  try {
    auto res = TX(t).Work().exec_prepared("next_sequence", name);
    value    = U64(res[0][0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result PgRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  int           kind     = kBiddingCorrelation;
  std::uint64_t asset_id = 0, license_id = 0, payment_index = 0;
  if (const auto* bidding = std::get_if<domain::BiddingCorrelation>(&r.correlation)) {
    asset_id = bidding->asset_id;
  } else {
    const auto& verification = std::get<domain::VerificationCorrelation>(r.correlation);
    kind                     = kVerificationCorrelation;
    license_id               = verification.license_id;
    payment_index            = verification.payment_index;
  }

  try {
    auto& w = TX(t).Work();
    w.exec_params(
        "INSERT INTO decryption_requests(id,issuer,created_at_ms,resolved_at_ms,status,selector,correlation_kind,asset_id,license_id,"
        "payment_index,failure_reason) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);",
        I64(r.id), r.issuer, I64(r.created_at_ms), I64(r.resolved_at_ms), static_cast<int>(r.status), static_cast<int>(r.selector), kind,
        I64(asset_id), I64(license_id), I64(payment_index), r.failure_reason);

    for (std::size_t i = 0; i < r.handles.size(); ++i) {
      w.exec_params("INSERT INTO request_handles(request_id,position,handle) VALUES($1,$2,$3);", I64(r.id), static_cast<int>(i),
                    r.handles[i]);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RequestRecord> PgRepository::GetRequest(Transaction& t, std::uint64_t id) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_params(std::string(kRequestColumns) + " WHERE id=$1;", I64(id));
  if (res.empty()) return std::nullopt;

  auto r    = ReadRequestRow(res[0]);
  r.handles = LoadHandles(w, r.id);
  return r;
}

Result PgRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  try {
    // correlation, selector and handles are fixed at issue time
    auto res = TX(t).Work().exec_params("UPDATE decryption_requests SET resolved_at_ms=$2,status=$3,failure_reason=$4 WHERE id=$1;", I64(r.id),
                                        I64(r.resolved_at_ms), static_cast<int>(r.status), r.failure_reason);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RequestRecord> PgRepository::ListRequests(Transaction& t, std::optional<domain::RequestStatus> status) {
  auto&        w = TX(t).Work();
  pqxx::result res;
  if (status) {
    res = w.exec_params(std::string(kRequestColumns) + " WHERE status=$1 ORDER BY id;", static_cast<int>(*status));
  } else {
    res = w.exec(std::string(kRequestColumns) + " ORDER BY id;");
  }

  std::vector<model::RequestRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRequestRow(row));
  for (auto& r : out) r.handles = LoadHandles(w, r.id);
  return out;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  try {
    auto& w = TX(t).Work();
    w.exec_params(
        "INSERT INTO bidding_sessions(asset_id,controller,phase,started_at_ms,end_time_ms,request_id,winner) VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(asset_id) DO UPDATE SET controller=EXCLUDED.controller,phase=EXCLUDED.phase,started_at_ms=EXCLUDED.started_at_ms,"
        "end_time_ms=EXCLUDED.end_time_ms,request_id=EXCLUDED.request_id,winner=EXCLUDED.winner;",
        I64(r.asset_id), r.controller, static_cast<int>(r.phase), I64(r.started_at_ms), I64(r.end_time_ms), I64(r.request_id), r.winner);

    w.exec_params("DELETE FROM session_bids WHERE asset_id=$1;", I64(r.asset_id));
    for (std::size_t i = 0; i < r.bids.size(); ++i) {
      const auto& b = r.bids[i];
      w.exec_params("INSERT INTO session_bids(asset_id,position,bidder,escrow,handle,submitted_at_ms) VALUES($1,$2,$3,$4,$5,$6);",
                    I64(r.asset_id), static_cast<int>(i), b.bidder, I64(b.escrow), b.handle, I64(b.submitted_at_ms));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& t, std::uint64_t asset_id) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_params(std::string(kSessionColumns) + " WHERE asset_id=$1;", I64(asset_id));
  if (res.empty()) return std::nullopt;

  auto r = ReadSessionRow(res[0]);
  r.bids = LoadBids(w, r.asset_id);
  return r;
}

std::vector<model::SessionRecord> PgRepository::ListSessions(Transaction& t) {
  auto& w   = TX(t).Work();
  auto  res = w.exec(std::string(kSessionColumns) + " ORDER BY asset_id;");

  std::vector<model::SessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSessionRow(row));
  for (auto& r : out) r.bids = LoadBids(w, r.asset_id);
  return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result PgRepository::InsertPayment(Transaction& t, const model::PaymentRecord& r) {
  try {
    std::optional<std::int64_t> expected;
    if (r.expected_amount) expected = I64(*r.expected_amount);
    TX(t).Work().exec_params(
        "INSERT INTO royalty_payments(license_id,payment_index,payer,revenue_handle,paid_amount,paid_handle,reporting_period,paid_at_ms,"
        "outcome,request_id,expected_amount) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);",
        I64(r.license_id), I64(r.index), r.payer, r.revenue_handle, I64(r.paid_amount), r.paid_handle, I64(r.reporting_period),
        I64(r.paid_at_ms), static_cast<int>(r.outcome), I64(r.request_id), expected);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPayment(Transaction& t, std::uint64_t license_id, std::uint64_t index) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentColumns) + " WHERE license_id=$1 AND payment_index=$2;", I64(license_id), I64(index));
  if (res.empty()) return std::nullopt;
  return ReadPaymentRow(res[0]);
}

Result PgRepository::UpdatePayment(Transaction& t, const model::PaymentRecord& r) {
  try {
    std::optional<std::int64_t> expected;
    if (r.expected_amount) expected = I64(*r.expected_amount);
    auto res = TX(t).Work().exec_params(
        "UPDATE royalty_payments SET outcome=$3,request_id=$4,expected_amount=$5 WHERE license_id=$1 AND payment_index=$2;",
        I64(r.license_id), I64(r.index), static_cast<int>(r.outcome), I64(r.request_id), expected);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PaymentRecord> PgRepository::ListPayments(Transaction& t, std::uint64_t license_id) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentColumns) + " WHERE license_id=$1 ORDER BY payment_index;", I64(license_id));

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPaymentRow(row));
  return out;
}

// ------------------------------------------------------------------
// Refunds
// ------------------------------------------------------------------

std::uint64_t PgRepository::GetRefundBalance(Transaction& t, const std::string& account) {
  auto res = TX(t).Work().exec_prepared("get_refund_balance", account);
  if (res.empty()) return 0;
  return U64(res[0][0]);
}

Result PgRepository::SetRefundBalance(Transaction& t, const std::string& account, std::uint64_t balance) {
  try {
    if (balance == 0) {
      TX(t).Work().exec_prepared("clear_refund_balance", account);
    } else {
      TX(t).Work().exec_prepared("set_refund_balance", account, I64(balance));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RefundRecord> PgRepository::ListRefundBalances(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT account,balance FROM refund_balances WHERE balance > 0 ORDER BY account;");

  std::vector<model::RefundRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({Text(row[0]), U64(row[1])});
  return out;
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& account) {
  auto res = TX(t).Work().exec_prepared("get_account", account);
  if (res.empty()) return std::nullopt;

  model::AccountRecord r;
  r.account         = Text(res[0][0]);
  r.balance         = U64(res[0][1]);
  r.accepts_payouts = res[0][2].as<int>() != 0;
  return r;
}

Result PgRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_account", r.account, I64(r.balance), r.accepts_payouts ? 1 : 0);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::uint64_t PgRepository::GetCustody(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_custody");
  if (res.empty()) return 0;
  return U64(res[0][0]);
}

Result PgRepository::SetCustody(Transaction& t, std::uint64_t balance) {
  try {
    TX(t).Work().exec_prepared("set_custody", I64(balance));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result PgRepository::InsertPatent(Transaction& t, const model::PatentRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO patents(id,owner,royalty_rate_handle,min_license_fee,exclusivity_days,validity_years,patent_hash,territory_code,"
        "confidential,status,status_before_pause,registered_at_ms,expires_at_ms,exclusive_licensee) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14);",
        I64(r.id), r.owner, r.royalty_rate_handle, I64(r.min_license_fee), static_cast<int>(r.exclusivity_days),
        static_cast<int>(r.validity_years), r.patent_hash, static_cast<std::int64_t>(r.territory_code), r.confidential ? 1 : 0, static_cast<int>(r.status),
        OptionalStatus(r.status_before_pause), I64(r.registered_at_ms), I64(r.expires_at_ms), r.exclusive_licensee);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PatentRecord> PgRepository::GetPatent(Transaction& t, std::uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kPatentColumns) + " WHERE id=$1;", I64(id));
  if (res.empty()) return std::nullopt;

  const auto&         row = res[0];
  model::PatentRecord r;
  r.id                  = U64(row[0]);
  r.owner               = Text(row[1]);
  r.royalty_rate_handle = Text(row[2]);
  r.min_license_fee     = U64(row[3]);
  r.exclusivity_days    = static_cast<std::uint32_t>(row[4].as<int>());
  r.validity_years      = static_cast<std::uint32_t>(row[5].as<int>());
  r.patent_hash         = Text(row[6]);
  r.territory_code      = static_cast<std::uint32_t>(U64(row[7]));
  r.confidential        = row[8].as<int>() != 0;
  r.status              = static_cast<domain::PatentStatus>(row[9].as<int>());
  if (!row[10].is_null()) r.status_before_pause = static_cast<domain::PatentStatus>(row[10].as<int>());
  r.registered_at_ms   = U64(row[11]);
  r.expires_at_ms      = U64(row[12]);
  r.exclusive_licensee = Text(row[13]);
  return r;
}

Result PgRepository::UpdatePatent(Transaction& t, const model::PatentRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE patents SET owner=$2,royalty_rate_handle=$3,min_license_fee=$4,status=$5,status_before_pause=$6,expires_at_ms=$7,"
        "exclusive_licensee=$8 WHERE id=$1;",
        I64(r.id), r.owner, r.royalty_rate_handle, I64(r.min_license_fee), static_cast<int>(r.status), OptionalStatus(r.status_before_pause),
        I64(r.expires_at_ms), r.exclusive_licensee);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::uint64_t> PgRepository::ListPatentsByOwner(Transaction& t, const std::string& owner) {
  auto res = TX(t).Work().exec_params("SELECT id FROM patents WHERE owner=$1 ORDER BY id;", owner);

  std::vector<std::uint64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(U64(row[0]));
  return out;
}

Result PgRepository::InsertLicense(Transaction& t, const model::LicenseRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO licenses(id,patent_id,licensee,licensor,proposed_fee,royalty_rate_handle,revenue_cap,duration_days,is_exclusive,"
        "auto_renewal,territory_mask,status,requested_at_ms,starts_at_ms,ends_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15);",
        I64(r.id), I64(r.patent_id), r.licensee, r.licensor, I64(r.proposed_fee), r.royalty_rate_handle, I64(r.revenue_cap),
        static_cast<int>(r.duration_days), r.exclusive ? 1 : 0, r.auto_renewal ? 1 : 0, static_cast<std::int64_t>(r.territory_mask),
        static_cast<int>(r.status), I64(r.requested_at_ms), I64(r.starts_at_ms), I64(r.ends_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LicenseRecord> PgRepository::GetLicense(Transaction& t, std::uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kLicenseColumns) + " WHERE id=$1;", I64(id));
  if (res.empty()) return std::nullopt;

  const auto&          row = res[0];
  model::LicenseRecord r;
  r.id                  = U64(row[0]);
  r.patent_id           = U64(row[1]);
  r.licensee            = Text(row[2]);
  r.licensor            = Text(row[3]);
  r.proposed_fee        = U64(row[4]);
  r.royalty_rate_handle = Text(row[5]);
  r.revenue_cap         = U64(row[6]);
  r.duration_days       = static_cast<std::uint32_t>(row[7].as<int>());
  r.exclusive           = row[8].as<int>() != 0;
  r.auto_renewal        = row[9].as<int>() != 0;
  r.territory_mask      = static_cast<std::uint32_t>(U64(row[10]));
  r.status              = static_cast<domain::LicenseStatus>(row[11].as<int>());
  r.requested_at_ms     = U64(row[12]);
  r.starts_at_ms        = U64(row[13]);
  r.ends_at_ms          = U64(row[14]);
  return r;
}

Result PgRepository::UpdateLicense(Transaction& t, const model::LicenseRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE licenses SET status=$2,duration_days=$3,starts_at_ms=$4,ends_at_ms=$5 WHERE id=$1;", I64(r.id),
                                        static_cast<int>(r.status), static_cast<int>(r.duration_days), I64(r.starts_at_ms),
                                        I64(r.ends_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::uint64_t> PgRepository::ListLicensesByLicensee(Transaction& t, const std::string& licensee) {
  auto res = TX(t).Work().exec_params("SELECT id FROM licenses WHERE licensee=$1 ORDER BY id;", licensee);

  std::vector<std::uint64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(U64(row[0]));
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& record) {
  auto rc = NextSequence(t, "events", record.sequence);
  if (!rc) return rc;

  try {
    auto& w = TX(t).Work();
    w.exec_params("INSERT INTO events(sequence,kind,occurred_at_ms) VALUES($1,$2,$3);", I64(record.sequence), static_cast<int>(record.kind),
                  I64(record.occurred_at_ms));
    for (std::size_t i = 0; i < record.attributes.size(); ++i) {
      w.exec_params("INSERT INTO event_attributes(sequence,position,attr_key,attr_value) VALUES($1,$2,$3,$4);", I64(record.sequence),
                    static_cast<int>(i), record.attributes[i].key, record.attributes[i].value);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, std::uint64_t after_sequence, std::uint64_t limit) {
  auto& w   = TX(t).Work();
  auto  res = w.exec_params("SELECT sequence,kind,occurred_at_ms FROM events WHERE sequence > $1 ORDER BY sequence LIMIT $2;",
                            I64(after_sequence), I64(limit));

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EventRecord e;
    e.sequence       = U64(row[0]);
    e.kind           = static_cast<domain::EventKind>(row[1].as<int>());
    e.occurred_at_ms = U64(row[2]);
    out.push_back(std::move(e));
  }

  for (auto& e : out) {
    auto attrs = w.exec_params("SELECT attr_key,attr_value FROM event_attributes WHERE sequence=$1 ORDER BY position;", I64(e.sequence));
    for (const auto& row : attrs) e.attributes.push_back({Text(row[0]), Text(row[1])});
  }
  return out;
}

} // namespace settlement::db::postgres
