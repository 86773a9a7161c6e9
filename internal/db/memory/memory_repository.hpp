#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace settlement::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result NextSequence(Transaction&, const std::string& name, std::uint64_t& value) override;

  Result InsertRequest(Transaction&, const model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, std::uint64_t id) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, std::optional<settlement::model::RequestStatus> status) override;

  Result UpsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, std::uint64_t asset_id) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&) override;

  Result InsertPayment(Transaction&, const model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, std::uint64_t license_id, std::uint64_t index) override;
  Result UpdatePayment(Transaction&, const model::PaymentRecord&) override;
  std::vector<model::PaymentRecord> ListPayments(Transaction&, std::uint64_t license_id) override;

  std::uint64_t GetRefundBalance(Transaction&, const std::string& account) override;
  Result SetRefundBalance(Transaction&, const std::string& account, std::uint64_t balance) override;
  std::vector<model::RefundRecord> ListRefundBalances(Transaction&) override;

  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& account) override;
  Result UpsertAccount(Transaction&, const model::AccountRecord&) override;
  std::uint64_t GetCustody(Transaction&) override;
  Result SetCustody(Transaction&, std::uint64_t balance) override;

  Result InsertPatent(Transaction&, const model::PatentRecord&) override;
  std::optional<model::PatentRecord> GetPatent(Transaction&, std::uint64_t id) override;
  Result UpdatePatent(Transaction&, const model::PatentRecord&) override;
  std::vector<std::uint64_t> ListPatentsByOwner(Transaction&, const std::string& owner) override;

  Result InsertLicense(Transaction&, const model::LicenseRecord&) override;
  std::optional<model::LicenseRecord> GetLicense(Transaction&, std::uint64_t id) override;
  Result UpdateLicense(Transaction&, const model::LicenseRecord&) override;
  std::vector<std::uint64_t> ListLicensesByLicensee(Transaction&, const std::string& licensee) override;

  Result AppendEvent(Transaction&, model::EventRecord& record) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, std::uint64_t after_sequence, std::uint64_t limit) override;

private:
  friend class MemoryTransaction;

  using PaymentKey = std::pair<std::uint64_t, std::uint64_t>;

  struct State {
    std::unordered_map<std::string, std::uint64_t> sequences;

    std::map<std::uint64_t, model::RequestRecord> requests;
    std::map<std::uint64_t, model::SessionRecord> sessions;
    std::map<PaymentKey, model::PaymentRecord>    payments;

    std::map<std::string, std::uint64_t>         refunds;
    std::map<std::string, model::AccountRecord> accounts;
    std::uint64_t                                custody = 0;

    std::map<std::uint64_t, model::PatentRecord>  patents;
    std::map<std::uint64_t, model::LicenseRecord> licenses;

    std::map<std::uint64_t, model::EventRecord> events;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

}
