#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/core/correlation_handler.hpp"
#include "internal/core/refund_ledger.hpp"
#include "internal/core/request_coordinator.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/registry/agreement_registry.hpp"

namespace settlement::core {

struct BiddingOptions {
  std::uint32_t min_hours = 1;
  std::uint32_t max_hours = 168;
  // floor applied on top of the asset's own minimum fee
  model::Amount min_escrow = 0;
};

/*
  Sealed-bid sessions, one per asset.

  Bid values stay encrypted until the session is finalized; the only
  public number per bid is its escrow. The winning escrow goes to the
  asset controller, every other escrow becomes a refund credit.

  A bidder that bids again replaces its previous bid: the old escrow is
  credited back and the new bid takes the last position in bid order.
*/
class BiddingEngine final : public CorrelationHandler {
 public:
  BiddingEngine(std::shared_ptr<RequestCoordinator> coordinator, std::shared_ptr<registry::AgreementRegistry> registry,
                std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<RefundLedger> refunds, std::shared_ptr<events::EventLog> events,
                std::shared_ptr<util::TimeSource> clock, BiddingOptions options = {});

  db::model::SessionRecord Start(UnitOfWork& uow, const model::Account& caller, model::AssetId asset, std::uint32_t hours);

  // Returns the bid's position in bid order.
  std::size_t SubmitBid(UnitOfWork& uow, const model::Account& caller, model::AssetId asset, const model::CiphertextHandle& handle,
                        model::Amount escrow);

  model::RequestId Finalize(UnitOfWork& uow, const model::Account& caller, model::AssetId asset);

  db::model::SessionRecord              GetSession(UnitOfWork& uow, model::AssetId asset);
  std::vector<db::model::SessionRecord> ListSessions(UnitOfWork& uow);

  // Sum of escrows still held for sessions that have not closed.
  model::Amount ActiveEscrow(UnitOfWork& uow);

  std::optional<std::string> OnDecrypted(UnitOfWork& uow, const db::model::RequestRecord& request,
                                         const std::vector<std::uint64_t>& words) override;
  void OnUnresolved(UnitOfWork& uow, const db::model::RequestRecord& request, model::RefundReason reason) override;

 private:
  registry::AssetView LoadAsset(UnitOfWork& uow, model::AssetId asset);
  std::optional<db::model::SessionRecord> AwaitingSession(UnitOfWork& uow, const db::model::RequestRecord& request);

  std::shared_ptr<RequestCoordinator>           coordinator_;
  std::shared_ptr<registry::AgreementRegistry> registry_;
  std::shared_ptr<ledger::Ledger>               ledger_;
  std::shared_ptr<RefundLedger>                 refunds_;
  std::shared_ptr<events::EventLog>             events_;
  std::shared_ptr<util::TimeSource>             clock_;
  BiddingOptions                                options_;
};

} // namespace settlement::core
