#pragma once

#include <cstdint>
#include <functional>

#include "internal/core/unit_of_work.hpp"
#include "internal/model/types.hpp"

namespace settlement::ledger {

/*
  Hosting ledger: native funds moving between accounts and system custody.

  Every movement happens inside the caller's UnitOfWork, so a failed
  operation never leaves a half-applied transfer.
*/
class Ledger {
 public:
  virtual ~Ledger() = default;

  // account -> custody. InvalidInput when the account balance is short.
  virtual void Escrow(core::UnitOfWork& uow, const model::Account& from, model::Amount amount) = 0;

  // custody -> account. Returns false, leaving both balances untouched,
  // when the recipient rejects the transfer.
  virtual bool Payout(core::UnitOfWork& uow, const model::Account& to, model::Amount amount) = 0;

  virtual model::Amount Custody(core::UnitOfWork& uow) = 0;
};

// Runs after each successful payout, still inside the paying operation.
using PayoutObserver = std::function<void(const model::Account& to, model::Amount amount)>;

class AccountLedger final : public Ledger {
 public:
  void Escrow(core::UnitOfWork& uow, const model::Account& from, model::Amount amount) override;
  bool Payout(core::UnitOfWork& uow, const model::Account& to, model::Amount amount) override;
  model::Amount Custody(core::UnitOfWork& uow) override;

  // Operator faucet. Returns the new balance.
  model::Amount Deposit(core::UnitOfWork& uow, const model::Account& account, model::Amount amount);

  model::Amount BalanceOf(core::UnitOfWork& uow, const model::Account& account);
  bool          AcceptsPayouts(core::UnitOfWork& uow, const model::Account& account);

  void SetAcceptsPayouts(core::UnitOfWork& uow, const model::Account& account, bool accepts);

  void SetPayoutObserver(PayoutObserver observer);

 private:
  db::model::AccountRecord Load(core::UnitOfWork& uow, const model::Account& account);

  PayoutObserver observer_;
};

} // namespace settlement::ledger
