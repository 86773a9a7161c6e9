#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/agreement_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/session_record.hpp"

namespace settlement::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A transaction that is not committed leaves no trace, including
    balances, custody and sequence values

  The DB is the source of truth for:
    decryption requests
    bidding sessions and escrows
    royalty payments
    refund balances, accounts, custody
    patents and licenses
    the event stream
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Next value of a named monotonic sequence. The first value is 1.
  virtual Result NextSequence(Transaction&, const std::string& name, std::uint64_t& value) = 0;

  // ---------------------------------------------------------------------
  // Decryption requests
  // ---------------------------------------------------------------------

  virtual Result InsertRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, std::uint64_t id) = 0;

  virtual Result UpdateRequest(Transaction&, const model::RequestRecord&) = 0;

  // Ordered by id. No filter returns every request.
  virtual std::vector<model::RequestRecord> ListRequests(Transaction&, std::optional<settlement::model::RequestStatus> status) = 0;

  // ---------------------------------------------------------------------
  // Bidding sessions
  // ---------------------------------------------------------------------

  virtual Result UpsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, std::uint64_t asset_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Royalty payments
  // ---------------------------------------------------------------------

  virtual Result InsertPayment(Transaction&, const model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, std::uint64_t license_id, std::uint64_t index) = 0;

  virtual Result UpdatePayment(Transaction&, const model::PaymentRecord&) = 0;

  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&, std::uint64_t license_id) = 0;

  // ---------------------------------------------------------------------
  // Refund balances
  // ---------------------------------------------------------------------

  // Absent accounts read as zero.
  virtual std::uint64_t GetRefundBalance(Transaction&, const std::string& account) = 0;

  virtual Result SetRefundBalance(Transaction&, const std::string& account, std::uint64_t balance) = 0;

  // Non-zero balances only, ordered by account.
  virtual std::vector<model::RefundRecord> ListRefundBalances(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Accounts + custody
  // ---------------------------------------------------------------------

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& account) = 0;

  virtual Result UpsertAccount(Transaction&, const model::AccountRecord&) = 0;

  virtual std::uint64_t GetCustody(Transaction&) = 0;

  virtual Result SetCustody(Transaction&, std::uint64_t balance) = 0;

  // ---------------------------------------------------------------------
  // Agreement registry
  // ---------------------------------------------------------------------

  virtual Result InsertPatent(Transaction&, const model::PatentRecord&) = 0;

  virtual std::optional<model::PatentRecord> GetPatent(Transaction&, std::uint64_t id) = 0;

  virtual Result UpdatePatent(Transaction&, const model::PatentRecord&) = 0;

  virtual std::vector<std::uint64_t> ListPatentsByOwner(Transaction&, const std::string& owner) = 0;

  virtual Result InsertLicense(Transaction&, const model::LicenseRecord&) = 0;

  virtual std::optional<model::LicenseRecord> GetLicense(Transaction&, std::uint64_t id) = 0;

  virtual Result UpdateLicense(Transaction&, const model::LicenseRecord&) = 0;

  virtual std::vector<std::uint64_t> ListLicensesByLicensee(Transaction&, const std::string& licensee) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Assigns record.sequence from the "events" sequence.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, std::uint64_t after_sequence, std::uint64_t limit) = 0;
};

} // namespace settlement::db
