#include "internal/core/request_coordinator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/oracle/cleartext_codec.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

namespace {

model::EventKind EventFor(model::RequestStatus status) {
  switch (status) {
    case model::RequestStatus::kCompleted:
      return model::EventKind::kRequestCompleted;
    case model::RequestStatus::kTimedOut:
      return model::EventKind::kRequestTimedOut;
    case model::RequestStatus::kFailed:
    case model::RequestStatus::kPending:
      break;
  }
  return model::EventKind::kRequestFailed;
}

std::string RequestName(model::RequestId id) {
  return "request " + std::to_string(id);
}

} // namespace

RequestCoordinator::RequestCoordinator(std::shared_ptr<SequenceGenerator> sequences, std::shared_ptr<oracle::OracleClient> oracle,
                                       std::shared_ptr<oracle::AttestationVerifier> verifier, std::shared_ptr<events::EventLog> events,
                                       std::shared_ptr<util::TimeSource> clock, CoordinatorOptions options)
    : sequences_(std::move(sequences)),
      oracle_(std::move(oracle)),
      verifier_(std::move(verifier)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.request_timeout <= util::Duration::zero()) {
    throw util::InvalidInput("request timeout must be positive");
  }
}

void RequestCoordinator::BindHandlers(CorrelationHandler* bidding, CorrelationHandler* verification) {
  bidding_      = bidding;
  verification_ = verification;
}

CorrelationHandler& RequestCoordinator::HandlerFor(const model::CorrelationTag& correlation) const {
  auto* handler = std::visit(model::Overloaded{[this](const model::BiddingCorrelation&) { return bidding_; },
                                               [this](const model::VerificationCorrelation&) { return verification_; }},
                             correlation);
  if (!handler) {
    throw std::logic_error("no handler bound for " + model::Describe(correlation));
  }
  return *handler;
}

// ---------------------------------------------------------------------
// Issue
// ---------------------------------------------------------------------

model::RequestId RequestCoordinator::Issue(UnitOfWork& uow, const model::Account& issuer, const model::CorrelationTag& correlation,
                                           const std::vector<model::CiphertextHandle>& handles, model::CallbackSelector selector) {
  if (handles.empty()) throw util::InvalidInput("decryption request needs at least one handle");
  for (const auto& handle : handles) {
    if (handle.empty()) throw util::InvalidInput("empty ciphertext handle");
  }
  if (selector != model::SelectorFor(correlation)) {
    throw util::InvalidInput(std::string("selector ") + std::string(model::ToString(selector)) + " does not answer " +
                             model::Describe(correlation));
  }

  db::model::RequestRecord request;
  request.id            = sequences_->Next(uow, kRequestSequence);
  request.issuer        = issuer;
  request.created_at_ms = util::ToUnixMillis(clock_->Now());
  request.status        = model::RequestStatus::kPending;
  request.correlation   = correlation;
  request.selector      = selector;
  request.handles       = handles;

  Check(uow.Repo().InsertRequest(uow.Tx(), request), "insert request");

  events_->Append(uow, model::EventKind::kRequestIssued,
                  {{"request_id", request.id},
                   {"issuer", issuer},
                   {"created_at_ms", request.created_at_ms},
                   {"correlation", model::Describe(correlation)}});

  // the oracle must never see an id whose transaction rolled back
  uow.AfterCommit([oracle = oracle_, id = request.id, handles, selector] { oracle->RequestDecryption(id, handles, selector); });
  return request.id;
}

// ---------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------

db::model::RequestRecord RequestCoordinator::LoadPending(UnitOfWork& uow, model::RequestId id) {
  auto request = uow.Repo().GetRequest(uow.Tx(), id);
  if (!request) throw util::InvalidRequest("unknown " + RequestName(id));
  if (model::IsTerminal(request->status)) {
    throw util::AlreadyResolved(RequestName(id) + " already " + std::string(model::ToString(request->status)));
  }
  return *request;
}

void RequestCoordinator::Transition(UnitOfWork& uow, db::model::RequestRecord& request, model::RequestStatus status,
                                    const std::string& reason) {
  request.status         = status;
  request.resolved_at_ms = util::ToUnixMillis(clock_->Now());
  request.failure_reason = reason;
  Check(uow.Repo().UpdateRequest(uow.Tx(), request), "resolve request");
}

void RequestCoordinator::Announce(UnitOfWork& uow, const db::model::RequestRecord& request) {
  if (request.failure_reason.empty()) {
    events_->Append(uow, EventFor(request.status), {{"request_id", request.id}, {"correlation", model::Describe(request.correlation)}});
  } else {
    events_->Append(uow, EventFor(request.status),
                    {{"request_id", request.id},
                     {"correlation", model::Describe(request.correlation)},
                     {"reason", request.failure_reason}});
  }

  uow.AfterCommit([status = request.status] {
    observability::Metrics::Instance().RecordRequestResolution(model::ToString(status));
  });
}

void RequestCoordinator::Resolve(UnitOfWork& uow, db::model::RequestRecord& request, model::RequestStatus status,
                                 const std::string& reason) {
  if (!model::CanTransition(request.status, status)) {
    throw std::logic_error(RequestName(request.id) + " cannot move to " + std::string(model::ToString(status)));
  }
  Transition(uow, request, status, reason);
  Announce(uow, request);
}

void RequestCoordinator::Fail(UnitOfWork& uow, db::model::RequestRecord& request, const std::string& reason,
                              model::RefundReason refund_reason, model::RequestStatus status) {
  Resolve(uow, request, status, reason);
  HandlerFor(request.correlation).OnUnresolved(uow, request, refund_reason);
}

CompletionResult RequestCoordinator::Complete(UnitOfWork& uow, model::CallbackSelector selector, model::RequestId id,
                                              const std::string& cleartexts, const std::string& proof) {
  auto request = LoadPending(uow, id);
  if (selector != request.selector) {
    throw util::InvalidRequest(RequestName(id) + " must be answered by " + std::string(model::ToString(request.selector)));
  }

  CompletionResult result;

  if (!verifier_->Verify(id, cleartexts, proof)) {
    SETTLEMENT_LOG_WARN("attestation rejected", {observability::IntField("request_id", static_cast<std::int64_t>(id))});
    Fail(uow, request, "attestation invalid", model::RefundReason::kOracleFailure);
    result.status               = request.status;
    result.failure_reason       = request.failure_reason;
    result.attestation_rejected = true;
    return result;
  }

  std::vector<std::uint64_t> words;
  try {
    words = oracle::DecodeWords(cleartexts);
  } catch (const util::MalformedPayload& e) {
    Fail(uow, request, e.what(), model::RefundReason::kOracleFailure);
    result.status         = request.status;
    result.failure_reason = request.failure_reason;
    return result;
  }

  // status first, then the domain effect, in the same transaction
  Transition(uow, request, model::RequestStatus::kCompleted, "");

  auto& handler = HandlerFor(request.correlation);
  if (auto failure = handler.OnDecrypted(uow, request, words)) {
    SETTLEMENT_LOG_WARN("decrypted result rejected", {observability::IntField("request_id", static_cast<std::int64_t>(id)),
                                                      observability::StringField("reason", *failure)});
    Transition(uow, request, model::RequestStatus::kFailed, *failure);
    Announce(uow, request);
    handler.OnUnresolved(uow, request, model::RefundReason::kOracleFailure);
  } else {
    Announce(uow, request);
  }

  result.status         = request.status;
  result.failure_reason = request.failure_reason;
  return result;
}

db::model::RequestRecord RequestCoordinator::ClaimTimeout(UnitOfWork& uow, model::RequestId id) {
  auto request = LoadPending(uow, id);

  const auto elapsed = clock_->Now() - util::FromUnixMillis(request.created_at_ms);
  if (elapsed < options_.request_timeout) {
    throw util::NotExpired(RequestName(id) + " has not timed out yet");
  }

  Fail(uow, request, "timeout", model::RefundReason::kTimeout, model::RequestStatus::kTimedOut);
  return request;
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

db::model::RequestRecord RequestCoordinator::GetRequest(UnitOfWork& uow, model::RequestId id) {
  auto request = uow.Repo().GetRequest(uow.Tx(), id);
  if (!request) throw util::NotFound("unknown " + RequestName(id));
  return *request;
}

std::vector<db::model::RequestRecord> RequestCoordinator::ListRequests(UnitOfWork& uow, std::optional<model::RequestStatus> status) {
  return uow.Repo().ListRequests(uow.Tx(), status);
}

} // namespace settlement::core
