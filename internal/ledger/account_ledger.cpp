#include <limits>
#include <stdexcept>
#include <string>

#include "internal/ledger/ledger.hpp"
#include "internal/util/errors.hpp"

namespace settlement::ledger {

namespace {

model::Amount CheckedAdd(model::Amount a, model::Amount b, const char* what) {
  if (a > std::numeric_limits<model::Amount>::max() - b) {
    throw util::InvalidInput(std::string(what) + " overflow");
  }
  return a + b;
}

} // namespace

db::model::AccountRecord AccountLedger::Load(core::UnitOfWork& uow, const model::Account& account) {
  if (auto record = uow.Repo().GetAccount(uow.Tx(), account)) {
    return *record;
  }
  db::model::AccountRecord fresh;
  fresh.account = account;
  return fresh;
}

void AccountLedger::Escrow(core::UnitOfWork& uow, const model::Account& from, model::Amount amount) {
  if (from.empty()) throw util::InvalidInput("account required");

  auto record = Load(uow, from);
  if (record.balance < amount) {
    throw util::InvalidInput("insufficient balance: " + from + " holds " + std::to_string(record.balance) + ", needs " +
                             std::to_string(amount));
  }

  auto custody = CheckedAdd(uow.Repo().GetCustody(uow.Tx()), amount, "custody");
  record.balance -= amount;
  core::Check(uow.Repo().UpsertAccount(uow.Tx(), record), "escrow debit");
  core::Check(uow.Repo().SetCustody(uow.Tx(), custody), "escrow custody");
}

bool AccountLedger::Payout(core::UnitOfWork& uow, const model::Account& to, model::Amount amount) {
  auto record = Load(uow, to);
  if (!record.accepts_payouts) {
    return false;
  }

  auto custody = uow.Repo().GetCustody(uow.Tx());
  if (custody < amount) {
    // every payout is backed by an escrow or a refund balance
    throw std::logic_error("custody underflow paying " + std::to_string(amount) + " to " + to);
  }

  record.balance = CheckedAdd(record.balance, amount, "balance");
  core::Check(uow.Repo().UpsertAccount(uow.Tx(), record), "payout credit");
  core::Check(uow.Repo().SetCustody(uow.Tx(), custody - amount), "payout custody");

  if (observer_) observer_(to, amount);
  return true;
}

model::Amount AccountLedger::Custody(core::UnitOfWork& uow) {
  return uow.Repo().GetCustody(uow.Tx());
}

model::Amount AccountLedger::Deposit(core::UnitOfWork& uow, const model::Account& account, model::Amount amount) {
  if (account.empty()) throw util::InvalidInput("account required");
  if (amount == 0) throw util::InvalidInput("deposit amount must be positive");

  auto record    = Load(uow, account);
  record.balance = CheckedAdd(record.balance, amount, "balance");
  core::Check(uow.Repo().UpsertAccount(uow.Tx(), record), "deposit");
  return record.balance;
}

model::Amount AccountLedger::BalanceOf(core::UnitOfWork& uow, const model::Account& account) {
  return Load(uow, account).balance;
}

bool AccountLedger::AcceptsPayouts(core::UnitOfWork& uow, const model::Account& account) {
  return Load(uow, account).accepts_payouts;
}

void AccountLedger::SetAcceptsPayouts(core::UnitOfWork& uow, const model::Account& account, bool accepts) {
  auto record            = Load(uow, account);
  record.accepts_payouts = accepts;
  core::Check(uow.Repo().UpsertAccount(uow.Tx(), record), "set accepts payouts");
}

void AccountLedger::SetPayoutObserver(PayoutObserver observer) {
  observer_ = std::move(observer);
}

} // namespace settlement::ledger
