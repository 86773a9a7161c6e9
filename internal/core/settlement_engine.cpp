#include "internal/core/settlement_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

namespace {

constexpr std::uint64_t kMaxEventPage = 1000;

// Raises the re-entrancy flag for the duration of a fund-moving call.
class FundMovementGuard {
 public:
  FundMovementGuard(bool& flag, bool moves_funds) : flag_(flag), owns_(moves_funds) {
    if (flag_) throw util::InvalidState("re-entrant call rejected");
    if (owns_) flag_ = true;
  }
  ~FundMovementGuard() {
    if (owns_) flag_ = false;
  }

  FundMovementGuard(const FundMovementGuard&)            = delete;
  FundMovementGuard& operator=(const FundMovementGuard&) = delete;

 private:
  bool& flag_;
  bool  owns_;
};

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<oracle::OracleClient> oracle,
                                   std::shared_ptr<oracle::AttestationVerifier> verifier, std::shared_ptr<cipher::ValueSealer> sealer,
                                   std::shared_ptr<util::TimeSource> clock, EngineOptions options)
    : repository_(std::move(repository)), sealer_(std::move(sealer)), clock_(std::move(clock)) {
  auto sequences = std::make_shared<RepositorySequenceGenerator>();

  events_   = std::make_shared<events::EventLog>(clock_);
  ledger_   = std::make_shared<ledger::AccountLedger>();
  refunds_  = std::make_shared<RefundLedger>(ledger_, events_);
  registry_ = std::make_shared<registry::PatentRegistry>(sequences, sealer_, events_, clock_, options.registry);

  coordinator_ = std::make_shared<RequestCoordinator>(sequences, std::move(oracle), std::move(verifier), events_, clock_, options.coordinator);
  bidding_     = std::make_shared<BiddingEngine>(coordinator_, registry_, ledger_, refunds_, events_, clock_, options.bidding);
  verification_ =
      std::make_shared<VerificationEngine>(coordinator_, registry_, ledger_, sealer_, events_, clock_, options.verification);

  coordinator_->BindHandlers(bidding_.get(), verification_.get());
}

template <typename Fn>
auto SettlementEngine::Run(bool moves_funds, Fn&& fn) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  UnitOfWork uow(*repository_);
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, UnitOfWork&>>) {
    {
      FundMovementGuard guard(in_fund_movement_, moves_funds);
      fn(uow);
    }
    uow.Commit();
  } else {
    auto result = [&] {
      FundMovementGuard guard(in_fund_movement_, moves_funds);
      return fn(uow);
    }();
    // hooks (oracle dispatch included) run with the flag lowered
    uow.Commit();
    return result;
  }
}

// ---------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------

model::AssetId SettlementEngine::RegisterPatent(const model::Account& caller, const registry::PatentTerms& terms) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->RegisterPatent(uow, caller, terms); });
}

db::model::PatentRecord SettlementEngine::GetPatent(model::AssetId id) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->GetPatent(uow, id); });
}

std::vector<model::AssetId> SettlementEngine::PatentsOf(const model::Account& owner) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->PatentsOf(uow, owner); });
}

void SettlementEngine::UpdatePatentStatus(const model::Account& caller, model::AssetId id, model::PatentStatus status) {
  Run(false, [&](UnitOfWork& uow) { registry_->UpdatePatentStatus(uow, caller, id, status); });
}

model::PatentStatus SettlementEngine::EmergencyPause(const model::Account& caller, model::AssetId id) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->EmergencyPause(uow, caller, id); });
}

model::PatentStatus SettlementEngine::EmergencyResume(const model::Account& caller, model::AssetId id) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->EmergencyResume(uow, caller, id); });
}

model::LicenseId SettlementEngine::RequestLicense(const model::Account& caller, const registry::LicenseTerms& terms) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->RequestLicense(uow, caller, terms); });
}

void SettlementEngine::ApproveLicense(const model::Account& caller, model::LicenseId id, std::uint32_t duration_days) {
  Run(false, [&](UnitOfWork& uow) { registry_->ApproveLicense(uow, caller, id, duration_days); });
}

void SettlementEngine::UpdateLicenseStatus(const model::Account& caller, model::LicenseId id, model::LicenseStatus status) {
  Run(false, [&](UnitOfWork& uow) { registry_->UpdateLicenseStatus(uow, caller, id, status); });
}

db::model::LicenseRecord SettlementEngine::GetLicense(model::LicenseId id) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->GetLicense(uow, id); });
}

std::vector<model::LicenseId> SettlementEngine::LicensesOf(const model::Account& licensee) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->LicensesOf(uow, licensee); });
}

std::uint64_t SettlementEngine::RoyaltyPaymentCount(model::LicenseId id) {
  return Run(false, [&](UnitOfWork& uow) { return registry_->RoyaltyPaymentCount(uow, id); });
}

// ---------------------------------------------------------------------
// Bidding
// ---------------------------------------------------------------------

db::model::SessionRecord SettlementEngine::StartBidding(const model::Account& caller, model::AssetId asset, std::uint32_t hours) {
  return Run(false, [&](UnitOfWork& uow) { return bidding_->Start(uow, caller, asset, hours); });
}

std::size_t SettlementEngine::SubmitBid(const model::Account& caller, model::AssetId asset, const model::CiphertextHandle& handle,
                                        model::Amount escrow) {
  return Run(true, [&](UnitOfWork& uow) { return bidding_->SubmitBid(uow, caller, asset, handle, escrow); });
}

model::RequestId SettlementEngine::FinalizeBidding(const model::Account& caller, model::AssetId asset) {
  return Run(true, [&](UnitOfWork& uow) { return bidding_->Finalize(uow, caller, asset); });
}

db::model::SessionRecord SettlementEngine::GetSession(model::AssetId asset) {
  return Run(false, [&](UnitOfWork& uow) { return bidding_->GetSession(uow, asset); });
}

// ---------------------------------------------------------------------
// Royalties
// ---------------------------------------------------------------------

std::uint64_t SettlementEngine::SubmitRoyaltyPayment(const model::Account& caller, model::LicenseId license,
                                                     const model::CiphertextHandle& revenue_handle, model::Amount amount,
                                                     std::uint64_t reporting_period) {
  return Run(true,
             [&](UnitOfWork& uow) { return verification_->SubmitPayment(uow, caller, license, revenue_handle, amount, reporting_period); });
}

model::RequestId SettlementEngine::RequestVerification(const model::Account& caller, model::LicenseId license, std::uint64_t index) {
  return Run(false, [&](UnitOfWork& uow) { return verification_->RequestVerification(uow, caller, license, index); });
}

db::model::PaymentRecord SettlementEngine::GetPayment(model::LicenseId license, std::uint64_t index) {
  return Run(false, [&](UnitOfWork& uow) { return verification_->GetPayment(uow, license, index); });
}

std::vector<db::model::PaymentRecord> SettlementEngine::ListPayments(model::LicenseId license) {
  return Run(false, [&](UnitOfWork& uow) {
    registry_->GetLicense(uow, license);
    return verification_->ListPayments(uow, license);
  });
}

// ---------------------------------------------------------------------
// Refunds
// ---------------------------------------------------------------------

db::model::RequestRecord SettlementEngine::ClaimTimeout(model::RequestId id) {
  return Run(false, [&](UnitOfWork& uow) { return coordinator_->ClaimTimeout(uow, id); });
}

model::Amount SettlementEngine::Withdraw(const model::Account& caller) {
  return Run(true, [&](UnitOfWork& uow) { return refunds_->Withdraw(uow, caller); });
}

ClaimResult SettlementEngine::Claim(const model::Account& caller, model::RequestId id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  FundMovementGuard                     guard(in_fund_movement_, true);

  ClaimResult result;
  {
    UnitOfWork uow(*repository_);
    result.request = coordinator_->ClaimTimeout(uow, id);
    uow.Commit();
  }

  // the timeout above stays committed whatever the withdrawal does
  UnitOfWork uow(*repository_);
  try {
    result.withdrawn = refunds_->Withdraw(uow, caller);
    uow.Commit();
  } catch (const util::NothingToWithdraw& e) {
    result.withdraw_error = e.what();
  } catch (const util::TransferFailure& e) {
    result.withdraw_error = e.what();
  }
  return result;
}

model::Amount SettlementEngine::RefundBalanceOf(const model::Account& account) {
  return Run(false, [&](UnitOfWork& uow) { return refunds_->BalanceOf(uow, account); });
}

// ---------------------------------------------------------------------
// Oracle callbacks
// ---------------------------------------------------------------------

CompletionResult SettlementEngine::Complete(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
                                            const std::string& proof) {
  const bool moves_funds = selector == model::CallbackSelector::kCompleteBidding;
  auto result = Run(moves_funds, [&](UnitOfWork& uow) { return coordinator_->Complete(uow, selector, id, cleartexts, proof); });
  if (result.attestation_rejected) {
    throw util::AttestationInvalid("attestation invalid for request " + std::to_string(id));
  }
  return result;
}

CompletionResult SettlementEngine::CompleteBidding(model::RequestId id, const std::string& cleartexts, const std::string& proof) {
  return Complete(model::CallbackSelector::kCompleteBidding, id, cleartexts, proof);
}

CompletionResult SettlementEngine::CompleteVerification(model::RequestId id, const std::string& cleartexts, const std::string& proof) {
  return Complete(model::CallbackSelector::kCompleteVerification, id, cleartexts, proof);
}

// ---------------------------------------------------------------------
// Admin
// ---------------------------------------------------------------------

EngineStats SettlementEngine::Stats() {
  return Run(false, [&](UnitOfWork& uow) {
    EngineStats stats;
    stats.custody       = ledger_->Custody(uow);
    stats.active_escrow = bidding_->ActiveEscrow(uow);
    stats.refundable    = refunds_->Total(uow);
    stats.balanced      = stats.custody == stats.active_escrow + stats.refundable;

    for (const auto& request : coordinator_->ListRequests(uow, std::nullopt)) {
      switch (request.status) {
        case model::RequestStatus::kPending:
          ++stats.requests_pending;
          break;
        case model::RequestStatus::kCompleted:
          ++stats.requests_completed;
          break;
        case model::RequestStatus::kFailed:
          ++stats.requests_failed;
          break;
        case model::RequestStatus::kTimedOut:
          ++stats.requests_timed_out;
          break;
      }
    }
    stats.sessions = bidding_->ListSessions(uow).size();

    if (!stats.balanced) {
      SETTLEMENT_LOG_ERROR("custody does not match escrows plus refunds",
                           {observability::IntField("custody", static_cast<std::int64_t>(stats.custody)),
                            observability::IntField("active_escrow", static_cast<std::int64_t>(stats.active_escrow)),
                            observability::IntField("refundable", static_cast<std::int64_t>(stats.refundable))});
    }
    return stats;
  });
}

std::vector<db::model::EventRecord> SettlementEngine::ListEvents(std::uint64_t after_sequence, std::uint64_t limit) {
  const auto page = limit == 0 ? kMaxEventPage : std::min(limit, kMaxEventPage);
  return Run(false, [&](UnitOfWork& uow) { return events_->List(uow, after_sequence, page); });
}

db::model::RequestRecord SettlementEngine::GetRequest(model::RequestId id) {
  return Run(false, [&](UnitOfWork& uow) { return coordinator_->GetRequest(uow, id); });
}

std::vector<db::model::RequestRecord> SettlementEngine::ListRequests(std::optional<model::RequestStatus> status) {
  return Run(false, [&](UnitOfWork& uow) { return coordinator_->ListRequests(uow, status); });
}

model::Amount SettlementEngine::Deposit(const model::Account& account, model::Amount amount) {
  return Run(false, [&](UnitOfWork& uow) {
    auto balance = ledger_->Deposit(uow, account, amount);
    events_->Append(uow, model::EventKind::kDeposited, {{"account", account}, {"amount", amount}});
    return balance;
  });
}

AccountView SettlementEngine::GetAccount(const model::Account& account) {
  return Run(false, [&](UnitOfWork& uow) {
    AccountView view;
    view.account         = account;
    view.balance         = ledger_->BalanceOf(uow, account);
    view.refundable      = refunds_->BalanceOf(uow, account);
    view.accepts_payouts = ledger_->AcceptsPayouts(uow, account);
    return view;
  });
}

void SettlementEngine::SetAcceptsPayouts(const model::Account& account, bool accepts) {
  if (account.empty()) throw util::InvalidInput("account required");
  Run(false, [&](UnitOfWork& uow) { ledger_->SetAcceptsPayouts(uow, account, accepts); });
}

model::CiphertextHandle SettlementEngine::SealValue(std::uint64_t value) {
  return sealer_->Seal(value);
}

void SettlementEngine::SetPayoutObserver(ledger::PayoutObserver observer) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  ledger_->SetPayoutObserver(std::move(observer));
}

// ---------------------------------------------------------------------
// EngineCallbackSink
// ---------------------------------------------------------------------

EngineCallbackSink::EngineCallbackSink(std::shared_ptr<SettlementEngine> engine) : engine_(engine) {
}

void EngineCallbackSink::Deliver(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
                                 const std::string& proof) {
  auto engine = engine_.lock();
  if (!engine) throw std::runtime_error("settlement engine is gone");

  switch (selector) {
    case model::CallbackSelector::kCompleteBidding:
      engine->CompleteBidding(id, cleartexts, proof);
      return;
    case model::CallbackSelector::kCompleteVerification:
      engine->CompleteVerification(id, cleartexts, proof);
      return;
  }
  throw util::InvalidRequest("unknown callback selector");
}

} // namespace settlement::core
