#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/correlation_handler.hpp"
#include "internal/core/sequence_generator.hpp"
#include "internal/events/event_log.hpp"
#include "internal/oracle/oracle.hpp"
#include "internal/util/time.hpp"

namespace settlement::core {

inline constexpr std::chrono::seconds kDefaultRequestTimeout{7 * 24 * 60 * 60};

struct CoordinatorOptions {
  util::Duration request_timeout = kDefaultRequestTimeout;
};

struct CompletionResult {
  model::RequestStatus status = model::RequestStatus::kPending;
  std::string          failure_reason;
  // set when the proof did not verify; the request is Failed and committed
  bool attestation_rejected = false;
};

/*
  Lifecycle of decryption requests: issue, complete (oracle callback) and
  timeout. Each request leaves Pending exactly once.

  The coordinator knows nothing about bids or royalties. It resolves the
  request and hands the outcome to the handler picked by the request's
  correlation tag.
*/
class RequestCoordinator {
 public:
  RequestCoordinator(std::shared_ptr<SequenceGenerator> sequences, std::shared_ptr<oracle::OracleClient> oracle,
                     std::shared_ptr<oracle::AttestationVerifier> verifier, std::shared_ptr<events::EventLog> events,
                     std::shared_ptr<util::TimeSource> clock, CoordinatorOptions options = {});

  // Non-owning. Both must outlive the coordinator.
  void BindHandlers(CorrelationHandler* bidding, CorrelationHandler* verification);

  model::RequestId Issue(UnitOfWork& uow, const model::Account& issuer, const model::CorrelationTag& correlation,
                         const std::vector<model::CiphertextHandle>& handles, model::CallbackSelector selector);

  CompletionResult Complete(UnitOfWork& uow, model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
                            const std::string& proof);

  db::model::RequestRecord ClaimTimeout(UnitOfWork& uow, model::RequestId id);

  db::model::RequestRecord              GetRequest(UnitOfWork& uow, model::RequestId id);
  std::vector<db::model::RequestRecord> ListRequests(UnitOfWork& uow, std::optional<model::RequestStatus> status);

  util::Duration Timeout() const {
    return options_.request_timeout;
  }

 private:
  db::model::RequestRecord LoadPending(UnitOfWork& uow, model::RequestId id);
  void Transition(UnitOfWork& uow, db::model::RequestRecord& request, model::RequestStatus status, const std::string& reason);
  void Announce(UnitOfWork& uow, const db::model::RequestRecord& request);
  void Resolve(UnitOfWork& uow, db::model::RequestRecord& request, model::RequestStatus status, const std::string& reason);
  void Fail(UnitOfWork& uow, db::model::RequestRecord& request, const std::string& reason, model::RefundReason refund_reason,
            model::RequestStatus status = model::RequestStatus::kFailed);
  CorrelationHandler& HandlerFor(const model::CorrelationTag& correlation) const;

  std::shared_ptr<SequenceGenerator>           sequences_;
  std::shared_ptr<oracle::OracleClient>        oracle_;
  std::shared_ptr<oracle::AttestationVerifier> verifier_;
  std::shared_ptr<events::EventLog>            events_;
  std::shared_ptr<util::TimeSource>            clock_;
  CoordinatorOptions                           options_;

  CorrelationHandler* bidding_      = nullptr;
  CorrelationHandler* verification_ = nullptr;
};

} // namespace settlement::core
