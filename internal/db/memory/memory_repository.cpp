#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace settlement::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::NextSequence(Transaction& t, const std::string& name, std::uint64_t& value) {
  value = ++TX(t).Mutable().sequences[name];
  return Result::Ok();
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.requests.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.requests[r.id] = r;
  return Result::Ok();
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t, std::optional<settlement::model::RequestStatus> status) {
  std::vector<model::RequestRecord> out;
  for (const auto& [_, r] : TX(t).View().requests) {
    if (!status || r.status == *status) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSession(Transaction& t, const model::SessionRecord& r) {
  TX(t).Mutable().sessions[r.asset_id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, std::uint64_t asset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(asset_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  std::vector<model::SessionRecord> out;
  for (const auto& [_, r] : TX(t).View().sessions) out.push_back(r);
  return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayment(Transaction& t, const model::PaymentRecord& r) {
  auto&      s   = TX(t).Mutable();
  PaymentKey key{r.license_id, r.index};
  if (s.payments.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  s.payments[key] = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, std::uint64_t license_id, std::uint64_t index) {
  const auto& s  = TX(t).View();
  auto        it = s.payments.find(PaymentKey{license_id, index});
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePayment(Transaction& t, const model::PaymentRecord& r) {
  auto&      s   = TX(t).Mutable();
  PaymentKey key{r.license_id, r.index};
  if (!s.payments.contains(key)) return Result::Err(ErrorCode::NotFound);
  s.payments[key] = r;
  return Result::Ok();
}

std::vector<model::PaymentRecord> MemoryRepository::ListPayments(Transaction& t, std::uint64_t license_id) {
  std::vector<model::PaymentRecord> out;
  const auto&                       s = TX(t).View();
  for (auto it = s.payments.lower_bound(PaymentKey{license_id, 0}); it != s.payments.end() && it->first.first == license_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Refunds
// ------------------------------------------------------------------

std::uint64_t MemoryRepository::GetRefundBalance(Transaction& t, const std::string& account) {
  const auto& s  = TX(t).View();
  auto        it = s.refunds.find(account);
  return it == s.refunds.end() ? 0 : it->second;
}

Result MemoryRepository::SetRefundBalance(Transaction& t, const std::string& account, std::uint64_t balance) {
  auto& s = TX(t).Mutable();
  if (balance == 0) {
    s.refunds.erase(account);
  } else {
    s.refunds[account] = balance;
  }
  return Result::Ok();
}

std::vector<model::RefundRecord> MemoryRepository::ListRefundBalances(Transaction& t) {
  std::vector<model::RefundRecord> out;
  for (const auto& [account, balance] : TX(t).View().refunds) {
    out.push_back({account, balance});
  }
  return out;
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& account) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(account);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  TX(t).Mutable().accounts[r.account] = r;
  return Result::Ok();
}

std::uint64_t MemoryRepository::GetCustody(Transaction& t) {
  return TX(t).View().custody;
}

Result MemoryRepository::SetCustody(Transaction& t, std::uint64_t balance) {
  TX(t).Mutable().custody = balance;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result MemoryRepository::InsertPatent(Transaction& t, const model::PatentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.patents.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.patents[r.id] = r;
  return Result::Ok();
}

std::optional<model::PatentRecord> MemoryRepository::GetPatent(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.patents.find(id);
  if (it == s.patents.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdatePatent(Transaction& t, const model::PatentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.patents.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.patents[r.id] = r;
  return Result::Ok();
}

std::vector<std::uint64_t> MemoryRepository::ListPatentsByOwner(Transaction& t, const std::string& owner) {
  std::vector<std::uint64_t> out;
  for (const auto& [id, r] : TX(t).View().patents)
    if (r.owner == owner) out.push_back(id);
  return out;
}

Result MemoryRepository::InsertLicense(Transaction& t, const model::LicenseRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.licenses.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.licenses[r.id] = r;
  return Result::Ok();
}

std::optional<model::LicenseRecord> MemoryRepository::GetLicense(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.licenses.find(id);
  if (it == s.licenses.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateLicense(Transaction& t, const model::LicenseRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.licenses.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.licenses[r.id] = r;
  return Result::Ok();
}

std::vector<std::uint64_t> MemoryRepository::ListLicensesByLicensee(Transaction& t, const std::string& licensee) {
  std::vector<std::uint64_t> out;
  for (const auto& [id, r] : TX(t).View().licenses)
    if (r.licensee == licensee) out.push_back(id);
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& record) {
  auto rc = NextSequence(t, "events", record.sequence);
  if (!rc) return rc;
  TX(t).Mutable().events[record.sequence] = record;
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, std::uint64_t after_sequence, std::uint64_t limit) {
  std::vector<model::EventRecord> out;
  const auto&                     s = TX(t).View();
  for (auto it = s.events.upper_bound(after_sequence); it != s.events.end() && out.size() < limit; ++it) {
    out.push_back(it->second);
  }
  return out;
}

} // namespace settlement::db::memory
