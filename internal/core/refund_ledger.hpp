#pragma once

#include <memory>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/events/event_log.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/model/refund_reason.hpp"

namespace settlement::core {

/*
  Pull-payment ledger of reclaimable funds.

  Credits never move money: the funds are already in custody. Withdraw is
  the only place they leave, and the balance is zeroed before the payout.
*/
class RefundLedger {
 public:
  RefundLedger(std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<events::EventLog> events);

  // Zero amounts are ignored.
  void Credit(UnitOfWork& uow, const model::Account& account, model::Amount amount, model::RefundReason reason);

  model::Amount Withdraw(UnitOfWork& uow, const model::Account& caller);

  model::Amount                         BalanceOf(UnitOfWork& uow, const model::Account& account);
  std::vector<db::model::RefundRecord> ListBalances(UnitOfWork& uow);
  model::Amount                         Total(UnitOfWork& uow);

 private:
  std::shared_ptr<ledger::Ledger>   ledger_;
  std::shared_ptr<events::EventLog> events_;
};

} // namespace settlement::core
