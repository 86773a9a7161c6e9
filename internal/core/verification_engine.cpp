#include "internal/core/verification_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

namespace {

constexpr std::uint64_t kMaxDenominator = 1ULL << 32;
constexpr std::size_t   kVerificationWords = 3; // revenue, rate, paid

} // namespace

std::uint64_t MulDivFloor(std::uint64_t value, std::uint64_t numerator, std::uint64_t denominator) {
  // value = q*d + r, so value*n/d = q*n + r*n/d with r*n < d*d <= 2^64
  return (value / denominator) * numerator + (value % denominator) * numerator / denominator;
}

VerificationEngine::VerificationEngine(std::shared_ptr<RequestCoordinator> coordinator, std::shared_ptr<registry::AgreementRegistry> registry,
                                       std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<cipher::ValueSealer> sealer,
                                       std::shared_ptr<events::EventLog> events, std::shared_ptr<util::TimeSource> clock,
                                       VerificationOptions options)
    : coordinator_(std::move(coordinator)),
      registry_(std::move(registry)),
      ledger_(std::move(ledger)),
      sealer_(std::move(sealer)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.rate_denominator == 0 || options_.rate_denominator > kMaxDenominator) {
    throw util::InvalidInput("rate denominator must be in [1, 2^32]");
  }
  if (options_.tolerance_denominator == 0 || options_.tolerance_denominator > kMaxDenominator ||
      options_.tolerance_numerator > options_.tolerance_denominator) {
    throw util::InvalidInput("tolerance must be a fraction no greater than 1");
  }
}

registry::AgreementView VerificationEngine::LoadAgreement(UnitOfWork& uow, model::LicenseId license) {
  auto view = registry_->FindAgreement(uow, license);
  if (!view) throw util::NotFound("invalid license id " + std::to_string(license));
  return *view;
}

// ---------------------------------------------------------------------
// Payments
// ---------------------------------------------------------------------

std::uint64_t VerificationEngine::SubmitPayment(UnitOfWork& uow, const model::Account& caller, model::LicenseId license,
                                                const model::CiphertextHandle& revenue_handle, model::Amount amount,
                                                std::uint64_t reporting_period) {
  auto view = LoadAgreement(uow, license);
  if (caller != view.licensee) throw util::Authorization("not the licensee");
  if (view.status != model::LicenseStatus::kActive) throw util::InvalidState("license not active");
  if (amount == 0) throw util::InvalidInput("payment amount must be positive");
  if (revenue_handle.empty()) throw util::InvalidInput("encrypted revenue required");

  ledger_->Escrow(uow, caller, amount);
  if (!ledger_->Payout(uow, view.licensor, amount)) {
    throw util::TransferFailure("royalty payout to " + view.licensor + " rejected");
  }

  db::model::PaymentRecord payment;
  payment.license_id       = license;
  payment.index            = uow.Repo().ListPayments(uow.Tx(), license).size();
  payment.payer            = caller;
  payment.revenue_handle   = revenue_handle;
  payment.paid_amount      = amount;
  payment.paid_handle      = sealer_->Seal(amount);
  payment.reporting_period = reporting_period;
  payment.paid_at_ms       = util::ToUnixMillis(clock_->Now());
  payment.outcome          = model::VerificationOutcome::kUnverified;
  Check(uow.Repo().InsertPayment(uow.Tx(), payment), "insert payment");

  events_->Append(uow, model::EventKind::kRoyaltyPaid,
                  {{"license_id", license},
                   {"index", payment.index},
                   {"amount", amount},
                   {"reporting_period", reporting_period}});
  return payment.index;
}

model::RequestId VerificationEngine::RequestVerification(UnitOfWork& uow, const model::Account& caller, model::LicenseId license,
                                                         std::uint64_t index) {
  auto view = LoadAgreement(uow, license);
  if (caller != view.licensor) throw util::Authorization("not the licensor");

  auto payment = uow.Repo().GetPayment(uow.Tx(), license, index);
  if (!payment) throw util::InvalidInput("invalid payment index " + std::to_string(index));
  if (payment->outcome != model::VerificationOutcome::kUnverified) throw util::InvalidState("payment already verified");
  if (payment->request_id != 0) throw util::InvalidState("verification already in progress");

  auto id = coordinator_->Issue(uow, caller, model::VerificationCorrelation{license, index},
                                {payment->revenue_handle, view.rate_handle, payment->paid_handle},
                                model::CallbackSelector::kCompleteVerification);

  payment->request_id = id;
  Check(uow.Repo().UpdatePayment(uow.Tx(), *payment), "mark verification");

  events_->Append(uow, model::EventKind::kVerificationRequested, {{"license_id", license}, {"index", index}, {"request_id", id}});
  return id;
}

db::model::PaymentRecord VerificationEngine::GetPayment(UnitOfWork& uow, model::LicenseId license, std::uint64_t index) {
  auto payment = uow.Repo().GetPayment(uow.Tx(), license, index);
  if (!payment) throw util::NotFound("no payment " + std::to_string(index) + " for license " + std::to_string(license));
  return *payment;
}

std::vector<db::model::PaymentRecord> VerificationEngine::ListPayments(UnitOfWork& uow, model::LicenseId license) {
  return uow.Repo().ListPayments(uow.Tx(), license);
}

// ---------------------------------------------------------------------
// Oracle outcomes
// ---------------------------------------------------------------------

std::optional<db::model::PaymentRecord> VerificationEngine::AwaitingPayment(UnitOfWork& uow, const db::model::RequestRecord& request) {
  const auto& correlation = std::get<model::VerificationCorrelation>(request.correlation);
  auto        payment     = uow.Repo().GetPayment(uow.Tx(), correlation.license_id, correlation.payment_index);
  if (!payment || payment->request_id != request.id) return std::nullopt;
  return payment;
}

std::optional<std::string> VerificationEngine::OnDecrypted(UnitOfWork& uow, const db::model::RequestRecord& request,
                                                           const std::vector<std::uint64_t>& words) {
  auto payment = AwaitingPayment(uow, request);
  if (!payment) return "no payment awaiting request " + std::to_string(request.id);
  if (words.size() != kVerificationWords) {
    return "expected 3 values (revenue, rate, paid), got " + std::to_string(words.size());
  }

  const auto revenue = words[0];
  const auto rate    = words[1];
  const auto paid    = words[2];
  if (rate > options_.rate_denominator) {
    return "royalty rate " + std::to_string(rate) + " exceeds denominator " + std::to_string(options_.rate_denominator);
  }

  const auto expected  = MulDivFloor(revenue, rate, options_.rate_denominator);
  const auto threshold = MulDivFloor(expected, options_.tolerance_numerator, options_.tolerance_denominator);

  payment->outcome         = paid >= threshold ? model::VerificationOutcome::kValid : model::VerificationOutcome::kInvalid;
  payment->expected_amount = expected;
  payment->request_id      = 0;
  Check(uow.Repo().UpdatePayment(uow.Tx(), *payment), "record verification");

  events_->Append(uow, model::EventKind::kVerificationOutcome,
                  {{"license_id", payment->license_id}, {"index", payment->index}, {"outcome", model::ToString(payment->outcome)}});
  return std::nullopt;
}

void VerificationEngine::OnUnresolved(UnitOfWork& uow, const db::model::RequestRecord& request, model::RefundReason reason) {
  auto payment = AwaitingPayment(uow, request);
  if (!payment) {
    SETTLEMENT_LOG_WARN("unresolved verification request has no awaiting payment",
                        {observability::IntField("request_id", static_cast<std::int64_t>(request.id))});
    return;
  }

  payment->outcome    = model::VerificationOutcome::kInvalid;
  payment->request_id = 0;
  Check(uow.Repo().UpdatePayment(uow.Tx(), *payment), "record verification failure");

  events_->Append(uow, model::EventKind::kVerificationOutcome,
                  {{"license_id", payment->license_id},
                   {"index", payment->index},
                   {"outcome", model::ToString(payment->outcome)},
                   {"reason", model::ToString(reason)}});
}

} // namespace settlement::core
