#include "internal/core/refund_ledger.hpp"

#include <limits>
#include <stdexcept>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace settlement::core {

RefundLedger::RefundLedger(std::shared_ptr<ledger::Ledger> ledger, std::shared_ptr<events::EventLog> events)
    : ledger_(std::move(ledger)), events_(std::move(events)) {
}

void RefundLedger::Credit(UnitOfWork& uow, const model::Account& account, model::Amount amount, model::RefundReason reason) {
  if (amount == 0) return;
  if (account.empty()) throw std::logic_error("refund credit without an account");

  auto balance = uow.Repo().GetRefundBalance(uow.Tx(), account);
  if (balance > std::numeric_limits<model::Amount>::max() - amount) {
    throw std::overflow_error("refund balance overflow for " + account);
  }
  Check(uow.Repo().SetRefundBalance(uow.Tx(), account, balance + amount), "credit refund");

  events_->Append(uow, model::EventKind::kRefundCredited,
                  {{"account", account}, {"amount", amount}, {"reason", model::ToString(reason)}});
  uow.AfterCommit([reason, amount] { observability::Metrics::Instance().RecordRefundCredit(model::ToString(reason), amount); });
}

model::Amount RefundLedger::Withdraw(UnitOfWork& uow, const model::Account& caller) {
  if (caller.empty()) throw util::InvalidInput("caller required");

  auto balance = uow.Repo().GetRefundBalance(uow.Tx(), caller);
  if (balance == 0) throw util::NothingToWithdraw("nothing to withdraw for " + caller);

  Check(uow.Repo().SetRefundBalance(uow.Tx(), caller, 0), "clear refund");
  if (!ledger_->Payout(uow, caller, balance)) {
    throw util::TransferFailure("refund payout to " + caller + " rejected");
  }

  events_->Append(uow, model::EventKind::kRefundWithdrawn, {{"account", caller}, {"amount", balance}});
  return balance;
}

model::Amount RefundLedger::BalanceOf(UnitOfWork& uow, const model::Account& account) {
  return uow.Repo().GetRefundBalance(uow.Tx(), account);
}

std::vector<db::model::RefundRecord> RefundLedger::ListBalances(UnitOfWork& uow) {
  return uow.Repo().ListRefundBalances(uow.Tx());
}

model::Amount RefundLedger::Total(UnitOfWork& uow) {
  model::Amount total = 0;
  for (const auto& entry : uow.Repo().ListRefundBalances(uow.Tx())) {
    total += entry.balance;
  }
  return total;
}

} // namespace settlement::core
