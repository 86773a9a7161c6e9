#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace settlement::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
