#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/core/bidding_engine.hpp"
#include "internal/core/refund_ledger.hpp"
#include "internal/core/request_coordinator.hpp"
#include "internal/core/verification_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/registry/patent_registry.hpp"

namespace settlement::core {

struct EngineOptions {
  CoordinatorOptions        coordinator;
  BiddingOptions            bidding;
  VerificationOptions       verification;
  registry::RegistryOptions registry;
};

struct ClaimResult {
  db::model::RequestRecord request;
  model::Amount            withdrawn = 0;
  // why nothing was withdrawn; the refund stays claimable
  std::string withdraw_error;
};

struct EngineStats {
  model::Amount custody       = 0;
  model::Amount active_escrow = 0;
  model::Amount refundable    = 0;
  bool          balanced      = false;

  std::uint64_t requests_pending   = 0;
  std::uint64_t requests_completed = 0;
  std::uint64_t requests_failed    = 0;
  std::uint64_t requests_timed_out = 0;
  std::uint64_t sessions           = 0;
};

struct AccountView {
  model::Account account;
  model::Amount  balance         = 0;
  model::Amount  refundable      = 0;
  bool           accepts_payouts = true;
};

/*
  Every public operation of the coordinator.

  Each call takes the engine lock (one writer at a time), runs in its own
  UnitOfWork and commits only if it returns normally. Calls that move
  funds also raise the re-entrancy flag: a nested call into the engine
  from inside one of them (a payout observer calling back in) is rejected
  with InvalidState.
*/
class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<oracle::OracleClient> oracle,
                   std::shared_ptr<oracle::AttestationVerifier> verifier, std::shared_ptr<cipher::ValueSealer> sealer,
                   std::shared_ptr<util::TimeSource> clock, EngineOptions options = {});

  // registry
  model::AssetId              RegisterPatent(const model::Account& caller, const registry::PatentTerms& terms);
  db::model::PatentRecord     GetPatent(model::AssetId id);
  std::vector<model::AssetId> PatentsOf(const model::Account& owner);
  void                        UpdatePatentStatus(const model::Account& caller, model::AssetId id, model::PatentStatus status);
  model::PatentStatus         EmergencyPause(const model::Account& caller, model::AssetId id);
  model::PatentStatus         EmergencyResume(const model::Account& caller, model::AssetId id);

  model::LicenseId              RequestLicense(const model::Account& caller, const registry::LicenseTerms& terms);
  void                          ApproveLicense(const model::Account& caller, model::LicenseId id, std::uint32_t duration_days);
  void                          UpdateLicenseStatus(const model::Account& caller, model::LicenseId id, model::LicenseStatus status);
  db::model::LicenseRecord      GetLicense(model::LicenseId id);
  std::vector<model::LicenseId> LicensesOf(const model::Account& licensee);
  std::uint64_t                 RoyaltyPaymentCount(model::LicenseId id);

  // bidding
  db::model::SessionRecord StartBidding(const model::Account& caller, model::AssetId asset, std::uint32_t hours);
  std::size_t      SubmitBid(const model::Account& caller, model::AssetId asset, const model::CiphertextHandle& handle, model::Amount escrow);
  model::RequestId FinalizeBidding(const model::Account& caller, model::AssetId asset);
  db::model::SessionRecord GetSession(model::AssetId asset);

  // royalties
  std::uint64_t SubmitRoyaltyPayment(const model::Account& caller, model::LicenseId license, const model::CiphertextHandle& revenue_handle,
                                     model::Amount amount, std::uint64_t reporting_period);
  model::RequestId                      RequestVerification(const model::Account& caller, model::LicenseId license, std::uint64_t index);
  db::model::PaymentRecord              GetPayment(model::LicenseId license, std::uint64_t index);
  std::vector<db::model::PaymentRecord> ListPayments(model::LicenseId license);

  // refunds
  db::model::RequestRecord ClaimTimeout(model::RequestId id);
  model::Amount            Withdraw(const model::Account& caller);
  ClaimResult              Claim(const model::Account& caller, model::RequestId id);
  model::Amount            RefundBalanceOf(const model::Account& account);

  // oracle callbacks; AttestationInvalid after the failure has committed
  CompletionResult CompleteBidding(model::RequestId id, const std::string& cleartexts, const std::string& proof);
  CompletionResult CompleteVerification(model::RequestId id, const std::string& cleartexts, const std::string& proof);

  // admin
  EngineStats                           Stats();
  std::vector<db::model::EventRecord>   ListEvents(std::uint64_t after_sequence, std::uint64_t limit);
  db::model::RequestRecord              GetRequest(model::RequestId id);
  std::vector<db::model::RequestRecord> ListRequests(std::optional<model::RequestStatus> status);
  model::Amount                         Deposit(const model::Account& account, model::Amount amount);
  AccountView                           GetAccount(const model::Account& account);
  void                                  SetAcceptsPayouts(const model::Account& account, bool accepts);
  model::CiphertextHandle               SealValue(std::uint64_t value);

  void SetPayoutObserver(ledger::PayoutObserver observer);

  util::Duration RequestTimeout() const {
    return coordinator_->Timeout();
  }

 private:
  template <typename Fn>
  auto Run(bool moves_funds, Fn&& fn);

  CompletionResult Complete(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
                            const std::string& proof);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<cipher::ValueSealer>  sealer_;
  std::shared_ptr<util::TimeSource>     clock_;
  std::shared_ptr<events::EventLog>     events_;
  std::shared_ptr<ledger::AccountLedger> ledger_;
  std::shared_ptr<RefundLedger>          refunds_;
  std::shared_ptr<registry::PatentRegistry> registry_;
  std::shared_ptr<RequestCoordinator>    coordinator_;
  std::shared_ptr<BiddingEngine>         bidding_;
  std::shared_ptr<VerificationEngine>    verification_;

  std::recursive_mutex mutex_;
  bool                 in_fund_movement_ = false;
};

// Routes oracle deliveries to the engine's callback entry points.
class EngineCallbackSink final : public oracle::CallbackSink {
 public:
  explicit EngineCallbackSink(std::shared_ptr<SettlementEngine> engine);

  void Deliver(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts, const std::string& proof) override;

 private:
  std::weak_ptr<SettlementEngine> engine_;
};

} // namespace settlement::core
