#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/core/correlation_handler.hpp"
#include "internal/core/request_coordinator.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/registry/agreement_registry.hpp"

namespace settlement::core {

struct VerificationOptions {
  std::uint64_t rate_denominator      = 10000; // basis points
  std::uint64_t tolerance_numerator   = 95;
  std::uint64_t tolerance_denominator = 100;
};

// floor(value * numerator / denominator) without a wide intermediate.
// Requires numerator <= denominator <= 2^32.
std::uint64_t MulDivFloor(std::uint64_t value, std::uint64_t numerator, std::uint64_t denominator);

/*
  Royalty payments and their confidential verification.

  A payment is checked once: the oracle reveals (revenue, rate, paid) and
  the payment is valid when paid reaches the tolerance share of
  revenue * rate. A failed or timed out verification marks the payment
  invalid. Funds never move during verification.
*/
class VerificationEngine final : public CorrelationHandler {
 public:
  VerificationEngine(std::shared_ptr<RequestCoordinator> coordinator, std::shared_ptr<registry::AgreementRegistry> registry,
                     std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<cipher::ValueSealer> sealer,
                     std::shared_ptr<events::EventLog> events, std::shared_ptr<util::TimeSource> clock, VerificationOptions options = {});

  // Returns the payment index.
  std::uint64_t SubmitPayment(UnitOfWork& uow, const model::Account& caller, model::LicenseId license,
                              const model::CiphertextHandle& revenue_handle, model::Amount amount, std::uint64_t reporting_period);

  model::RequestId RequestVerification(UnitOfWork& uow, const model::Account& caller, model::LicenseId license, std::uint64_t index);

  db::model::PaymentRecord              GetPayment(UnitOfWork& uow, model::LicenseId license, std::uint64_t index);
  std::vector<db::model::PaymentRecord> ListPayments(UnitOfWork& uow, model::LicenseId license);

  std::optional<std::string> OnDecrypted(UnitOfWork& uow, const db::model::RequestRecord& request,
                                         const std::vector<std::uint64_t>& words) override;
  void OnUnresolved(UnitOfWork& uow, const db::model::RequestRecord& request, model::RefundReason reason) override;

 private:
  registry::AgreementView LoadAgreement(UnitOfWork& uow, model::LicenseId license);
  std::optional<db::model::PaymentRecord> AwaitingPayment(UnitOfWork& uow, const db::model::RequestRecord& request);

  std::shared_ptr<RequestCoordinator>           coordinator_;
  std::shared_ptr<registry::AgreementRegistry> registry_;
  std::shared_ptr<ledger::Ledger>               ledger_;
  std::shared_ptr<cipher::ValueSealer>          sealer_;
  std::shared_ptr<events::EventLog>             events_;
  std::shared_ptr<util::TimeSource>             clock_;
  VerificationOptions                           options_;
};

} // namespace settlement::core
