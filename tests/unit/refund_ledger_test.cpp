#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/refund_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::EngineFixture;
using settlement::testing::ExpectThrows;

struct LedgerHarness {
  db::memory::MemoryRepository           repository;
  std::shared_ptr<util::ManualTimeSource> clock    = std::make_shared<util::ManualTimeSource>();
  std::shared_ptr<events::EventLog>       events   = std::make_shared<events::EventLog>(clock);
  std::shared_ptr<ledger::AccountLedger>  accounts = std::make_shared<ledger::AccountLedger>();
  core::RefundLedger                      refunds{accounts, events};

  // Moves `amount` of `account` into custody and credits it back as a refund.
  void Hold(const model::Account& account, model::Amount amount, model::RefundReason reason) {
    core::UnitOfWork uow(repository);
    accounts->Deposit(uow, account, amount);
    accounts->Escrow(uow, account, amount);
    refunds.Credit(uow, account, amount, reason);
    uow.Commit();
  }

  model::Amount Balance(const model::Account& account) {
    core::UnitOfWork uow(repository);
    return refunds.BalanceOf(uow, account);
  }

  std::size_t EventCount() {
    core::UnitOfWork uow(repository);
    return events->List(uow, 0, 1000).size();
  }
};

void TestCreditsAccumulateAndZeroIsIgnored() {
  LedgerHarness h;
  h.Hold("alice", 30, model::RefundReason::kLostBid);
  h.Hold("alice", 20, model::RefundReason::kTimeout);
  h.Hold("bob", 5, model::RefundReason::kOracleFailure);
  {
    core::UnitOfWork uow(h.repository);
    h.refunds.Credit(uow, "carol", 0, model::RefundReason::kLostBid);
    uow.Commit();
  }

  assert(h.Balance("alice") == 50);
  assert(h.Balance("bob") == 5);
  assert(h.Balance("carol") == 0);
  assert(h.EventCount() == 3);

  core::UnitOfWork uow(h.repository);
  assert(h.refunds.Total(uow) == 55);
  assert(h.refunds.ListBalances(uow).size() == 2);
  assert(h.accounts->Custody(uow) == 55);
}

void TestCreditOverflowIsRejected() {
  LedgerHarness h;
  h.Hold("alice", 1, model::RefundReason::kLostBid);

  core::UnitOfWork uow(h.repository);
  ExpectThrows<std::overflow_error>(
      [&] { h.refunds.Credit(uow, "alice", std::numeric_limits<model::Amount>::max(), model::RefundReason::kLostBid); }, "overflow");
}

void TestWithdrawPaysOnceAndZeroes() {
  LedgerHarness h;
  h.Hold("alice", 40, model::RefundReason::kLostBid);
  {
    core::UnitOfWork uow(h.repository);
    assert(h.refunds.Withdraw(uow, "alice") == 40);
    uow.Commit();
  }

  assert(h.Balance("alice") == 0);
  core::UnitOfWork uow(h.repository);
  assert(h.accounts->BalanceOf(uow, "alice") == 40);
  assert(h.accounts->Custody(uow) == 0);
  ExpectThrows<util::NothingToWithdraw>([&] { h.refunds.Withdraw(uow, "alice"); }, "second withdraw");
  ExpectThrows<util::InvalidInput>([&] { h.refunds.Withdraw(uow, ""); }, "empty caller");
}

void TestRejectedPayoutKeepsBalance() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 10);
  f.engine->StartBidding("owner", patent, 1);
  f.Bid("alice", patent, 1, 10);
  f.EndWindow();
  const auto id = f.engine->FinalizeBidding("owner", patent);
  f.clock->Advance(f.engine->RequestTimeout());

  f.engine->SetAcceptsPayouts("alice", false);
  const auto claim = f.engine->Claim("alice", id);
  assert(claim.request.status == model::RequestStatus::kTimedOut);
  assert(claim.withdrawn == 0);
  assert(!claim.withdraw_error.empty());
  assert(f.engine->RefundBalanceOf("alice") == 10);

  ExpectThrows<util::TransferFailure>([&] { f.engine->Withdraw("alice"); }, "recipient rejects");
  assert(f.engine->RefundBalanceOf("alice") == 10);
  f.ExpectBalanced();

  f.engine->SetAcceptsPayouts("alice", true);
  assert(f.engine->Withdraw("alice") == 10);
  assert(f.engine->GetAccount("alice").balance == 10);
  f.ExpectBalanced();
}

void TestClaimWithNothingOwedStillTimesOut() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 10);
  f.engine->StartBidding("owner", patent, 1);
  f.Bid("alice", patent, 1, 10);
  f.EndWindow();
  const auto id = f.engine->FinalizeBidding("owner", patent);
  f.clock->Advance(f.engine->RequestTimeout());

  // anyone may trigger the timeout; the refund goes to the bidder
  const auto claim = f.engine->Claim("bystander", id);
  assert(claim.withdrawn == 0);
  assert(!claim.withdraw_error.empty());
  assert(f.engine->GetRequest(id).status == model::RequestStatus::kTimedOut);
  assert(f.engine->RefundBalanceOf("alice") == 10);

  ExpectThrows<util::AlreadyResolved>([&] { f.engine->Claim("alice", id); }, "request already timed out");
  assert(f.engine->Withdraw("alice") == 10);
}

void TestReentrantWithdrawIsRejected() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 10);
  f.engine->StartBidding("owner", patent, 1);
  f.Bid("alice", patent, 1, 10);
  f.EndWindow();
  const auto id = f.engine->FinalizeBidding("owner", patent);
  f.clock->Advance(f.engine->RequestTimeout());
  f.engine->ClaimTimeout(id);

  int  reentries = 0;
  bool rejected  = false;
  f.engine->SetPayoutObserver([&](const model::Account& to, model::Amount) {
    if (to != "alice") return;
    ++reentries;
    try {
      f.engine->Withdraw("alice");
    } catch (const util::InvalidState&) {
      rejected = true;
    }
  });

  assert(f.engine->Withdraw("alice") == 10);
  assert(reentries == 1);
  assert(rejected);
  assert(f.engine->GetAccount("alice").balance == 10);
  assert(f.engine->RefundBalanceOf("alice") == 0);

  f.engine->SetPayoutObserver(nullptr);
  ExpectThrows<util::NothingToWithdraw>([&] { f.engine->Withdraw("alice"); }, "paid exactly once");
  f.ExpectBalanced();
}

void TestReentrantBidDuringPayoutIsRejected() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  const auto    other  = f.RegisterPatent("owner");
  f.Fund("alice", 20);
  f.Fund("bob", 20);
  f.engine->StartBidding("owner", patent, 1);
  f.engine->StartBidding("owner", other, 2);
  f.Bid("alice", patent, 3, 10);
  f.Bid("bob", patent, 1, 10);
  f.EndWindow();

  bool rejected = false;
  f.engine->SetPayoutObserver([&](const model::Account&, model::Amount) {
    try {
      f.Bid("bob", other, 1, 5);
    } catch (const util::InvalidState&) {
      rejected = true;
    }
  });

  f.Deliver(f.engine->FinalizeBidding("owner", patent));
  assert(rejected);
  assert(f.engine->GetSession(patent).winner == "alice");
  assert(f.engine->GetSession(other).bids.empty());
  f.ExpectBalanced();
}

} // namespace

int main() {
  TestCreditsAccumulateAndZeroIsIgnored();
  TestCreditOverflowIsRejected();
  TestWithdrawPaysOnceAndZeroes();
  TestRejectedPayoutKeepsBalance();
  TestClaimWithNothingOwedStillTimesOut();
  TestReentrantWithdrawIsRejected();
  TestReentrantBidDuringPayoutIsRejected();

  std::cout << "settlement_unit_refund_ledger: pass\n";
  return 0;
}
