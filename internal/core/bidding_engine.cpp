#include "internal/core/bidding_engine.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

BiddingEngine::BiddingEngine(std::shared_ptr<RequestCoordinator> coordinator, std::shared_ptr<registry::AgreementRegistry> registry,
                             std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<RefundLedger> refunds,
                             std::shared_ptr<events::EventLog> events, std::shared_ptr<util::TimeSource> clock, BiddingOptions options)
    : coordinator_(std::move(coordinator)),
      registry_(std::move(registry)),
      ledger_(std::move(ledger)),
      refunds_(std::move(refunds)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.min_hours == 0 || options_.min_hours > options_.max_hours) {
    throw util::InvalidInput("bidding hours range is empty");
  }
}

registry::AssetView BiddingEngine::LoadAsset(UnitOfWork& uow, model::AssetId asset) {
  auto view = registry_->FindAsset(uow, asset);
  if (!view) throw util::NotFound("invalid patent id " + std::to_string(asset));
  return *view;
}

// ---------------------------------------------------------------------
// Session lifecycle
// ---------------------------------------------------------------------

db::model::SessionRecord BiddingEngine::Start(UnitOfWork& uow, const model::Account& caller, model::AssetId asset, std::uint32_t hours) {
  auto view = LoadAsset(uow, asset);
  if (caller != view.controller) throw util::Authorization("not patent owner");
  if (view.status != model::PatentStatus::kActive) throw util::InvalidState("patent not active");
  if (hours < options_.min_hours || hours > options_.max_hours) {
    throw util::InvalidInput("invalid duration: bidding hours must be in [" + std::to_string(options_.min_hours) + ", " +
                             std::to_string(options_.max_hours) + "]");
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  if (auto existing = uow.Repo().GetSession(uow.Tx(), asset)) {
    // an Open window that ended without bids holds no funds and is replaced
    const bool abandoned = existing->phase == model::SessionPhase::kOpen && existing->bids.empty() && now_ms >= existing->end_time_ms;
    if (model::HoldsEscrow(existing->phase) && !abandoned) {
      throw util::InvalidState("bidding already in progress for patent " + std::to_string(asset));
    }
  }

  db::model::SessionRecord session;
  session.asset_id      = asset;
  session.controller    = caller;
  session.phase         = model::SessionPhase::kOpen;
  session.started_at_ms = now_ms;
  session.end_time_ms   = now_ms + static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                                   std::chrono::hours(hours))
                                                                   .count());
  Check(uow.Repo().UpsertSession(uow.Tx(), session), "start session");

  events_->Append(uow, model::EventKind::kBiddingStarted,
                  {{"patent_id", asset}, {"controller", caller}, {"end_time_ms", session.end_time_ms}});
  return session;
}

std::size_t BiddingEngine::SubmitBid(UnitOfWork& uow, const model::Account& caller, model::AssetId asset,
                                     const model::CiphertextHandle& handle, model::Amount escrow) {
  auto session = uow.Repo().GetSession(uow.Tx(), asset);
  if (!session || session->phase != model::SessionPhase::kOpen) throw util::NotOpen("bidding not open");
  if (util::ToUnixMillis(clock_->Now()) >= session->end_time_ms) throw util::Ended("bidding ended");
  if (caller.empty()) throw util::InvalidInput("caller required");
  if (handle.empty()) throw util::InvalidInput("encrypted bid required");
  if (escrow == 0) throw util::InvalidInput("escrow must be positive");

  const auto floor = std::max(LoadAsset(uow, asset).min_escrow, options_.min_escrow);
  if (escrow < floor) {
    throw util::InvalidInput("escrow " + std::to_string(escrow) + " below minimum " + std::to_string(floor));
  }

  ledger_->Escrow(uow, caller, escrow);

  auto& bids     = session->bids;
  auto  previous = std::find_if(bids.begin(), bids.end(), [&](const db::model::BidRecord& bid) { return bid.bidder == caller; });
  if (previous != bids.end()) {
    refunds_->Credit(uow, caller, previous->escrow, model::RefundReason::kSupersededBid);
    bids.erase(previous);
  }

  db::model::BidRecord bid;
  bid.bidder          = caller;
  bid.escrow          = escrow;
  bid.handle          = handle;
  bid.submitted_at_ms = util::ToUnixMillis(clock_->Now());
  bids.push_back(std::move(bid));

  Check(uow.Repo().UpsertSession(uow.Tx(), *session), "record bid");

  const std::size_t index = bids.size() - 1;
  events_->Append(uow, model::EventKind::kBidSubmitted,
                  {{"patent_id", asset}, {"bidder", caller}, {"escrow", escrow}, {"index", static_cast<std::uint64_t>(index)}});
  return index;
}

model::RequestId BiddingEngine::Finalize(UnitOfWork& uow, const model::Account& caller, model::AssetId asset) {
  auto view = LoadAsset(uow, asset);
  if (caller != view.controller) throw util::Authorization("not patent owner");

  auto session = uow.Repo().GetSession(uow.Tx(), asset);
  if (!session || session->phase != model::SessionPhase::kOpen) throw util::NotOpen("bidding not open");
  if (util::ToUnixMillis(clock_->Now()) < session->end_time_ms) throw util::InvalidState("bidding still open");
  if (session->bids.empty()) throw util::InvalidState("no bids to finalize");

  std::vector<model::CiphertextHandle> handles;
  handles.reserve(session->bids.size());
  for (const auto& bid : session->bids) {
    handles.push_back(bid.handle);
  }

  auto id = coordinator_->Issue(uow, caller, model::BiddingCorrelation{asset}, handles, model::CallbackSelector::kCompleteBidding);

  session->phase      = model::SessionPhase::kAwaitingResult;
  session->request_id = id;
  Check(uow.Repo().UpsertSession(uow.Tx(), *session), "finalize session");

  events_->Append(uow, model::EventKind::kBiddingFinalized,
                  {{"patent_id", asset}, {"request_id", id}, {"bids", static_cast<std::uint64_t>(handles.size())}});
  return id;
}

// ---------------------------------------------------------------------
// Oracle outcomes
// ---------------------------------------------------------------------

std::optional<db::model::SessionRecord> BiddingEngine::AwaitingSession(UnitOfWork& uow, const db::model::RequestRecord& request) {
  const auto& correlation = std::get<model::BiddingCorrelation>(request.correlation);
  auto        session     = uow.Repo().GetSession(uow.Tx(), correlation.asset_id);
  if (!session || session->phase != model::SessionPhase::kAwaitingResult || session->request_id != request.id) {
    return std::nullopt;
  }
  return session;
}

std::optional<std::string> BiddingEngine::OnDecrypted(UnitOfWork& uow, const db::model::RequestRecord& request,
                                                      const std::vector<std::uint64_t>& words) {
  auto session = AwaitingSession(uow, request);
  if (!session) return "no session awaiting request " + std::to_string(request.id);

  auto& bids = session->bids;
  if (words.size() != bids.size()) {
    return "expected " + std::to_string(bids.size()) + " bid values, got " + std::to_string(words.size());
  }

  auto view = registry_->FindAsset(uow, session->asset_id);
  if (!view) return "patent " + std::to_string(session->asset_id) + " no longer registered";

  // max_element keeps the first of equal maxima
  const auto  winner_index = static_cast<std::size_t>(std::max_element(words.begin(), words.end()) - words.begin());
  const auto& winner       = bids[winner_index];

  if (!ledger_->Payout(uow, view->controller, winner.escrow)) {
    throw util::TransferFailure("winning escrow payout to " + view->controller + " rejected");
  }
  for (std::size_t i = 0; i < bids.size(); ++i) {
    if (i != winner_index) refunds_->Credit(uow, bids[i].bidder, bids[i].escrow, model::RefundReason::kLostBid);
  }

  registry_->AwardExclusive(uow, session->asset_id, winner.bidder);

  session->phase  = model::SessionPhase::kResolved;
  session->winner = winner.bidder;
  Check(uow.Repo().UpsertSession(uow.Tx(), *session), "resolve session");

  events_->Append(uow, model::EventKind::kWinnerAwarded,
                  {{"patent_id", session->asset_id},
                   {"winner", winner.bidder},
                   {"index", static_cast<std::uint64_t>(winner_index)},
                   {"escrow", winner.escrow}});
  return std::nullopt;
}

void BiddingEngine::OnUnresolved(UnitOfWork& uow, const db::model::RequestRecord& request, model::RefundReason reason) {
  auto session = AwaitingSession(uow, request);
  if (!session) {
    SETTLEMENT_LOG_WARN("unresolved bidding request has no awaiting session",
                        {observability::IntField("request_id", static_cast<std::int64_t>(request.id))});
    return;
  }

  for (const auto& bid : session->bids) {
    refunds_->Credit(uow, bid.bidder, bid.escrow, reason);
  }

  session->phase = model::SessionPhase::kUnresolved;
  Check(uow.Repo().UpsertSession(uow.Tx(), *session), "close session");

  events_->Append(uow, model::EventKind::kBiddingUnresolved,
                  {{"patent_id", session->asset_id}, {"request_id", request.id}, {"reason", model::ToString(reason)}});
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

db::model::SessionRecord BiddingEngine::GetSession(UnitOfWork& uow, model::AssetId asset) {
  auto session = uow.Repo().GetSession(uow.Tx(), asset);
  if (!session) throw util::NotFound("no bidding session for patent " + std::to_string(asset));
  return *session;
}

std::vector<db::model::SessionRecord> BiddingEngine::ListSessions(UnitOfWork& uow) {
  return uow.Repo().ListSessions(uow.Tx());
}

model::Amount BiddingEngine::ActiveEscrow(UnitOfWork& uow) {
  model::Amount total = 0;
  for (const auto& session : uow.Repo().ListSessions(uow.Tx())) {
    if (!model::HoldsEscrow(session.phase)) continue;
    for (const auto& bid : session.bids) {
      total += bid.escrow;
    }
  }
  return total;
}

} // namespace settlement::core
