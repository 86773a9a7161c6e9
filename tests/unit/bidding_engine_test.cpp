#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::EngineFixture;
using settlement::testing::ExpectThrows;

struct Auction {
  EngineFixture  f;
  model::AssetId patent = 0;

  Auction() {
    patent = f.RegisterPatent("owner");
    for (const char* bidder : {"alice", "bob", "carol"}) {
      f.Fund(bidder, 100);
    }
    f.engine->StartBidding("owner", patent, 1);
  }
};

void TestHighestBidWinsAndFirstTieWins() {
  Auction a;
  assert(a.f.Bid("alice", a.patent, 5, 10) == 0);
  assert(a.f.Bid("bob", a.patent, 5, 20) == 1);
  assert(a.f.Bid("carol", a.patent, 3, 30) == 2);
  a.f.ExpectBalanced();
  assert(a.f.engine->Stats().active_escrow == 60);

  a.f.EndWindow();
  const auto id = a.f.engine->FinalizeBidding("owner", a.patent);
  assert(a.f.engine->GetSession(a.patent).phase == model::SessionPhase::kAwaitingResult);
  assert(a.f.Deliver(id) == 1);

  const auto session = a.f.engine->GetSession(a.patent);
  assert(session.phase == model::SessionPhase::kResolved);
  assert(session.winner == "alice");
  assert(a.f.engine->GetRequest(id).status == model::RequestStatus::kCompleted);

  assert(a.f.engine->GetAccount("owner").balance == 10);
  assert(a.f.engine->GetAccount("alice").balance == 90);
  assert(a.f.engine->RefundBalanceOf("alice") == 0);
  assert(a.f.engine->RefundBalanceOf("bob") == 20);
  assert(a.f.engine->RefundBalanceOf("carol") == 30);

  const auto patent = a.f.engine->GetPatent(a.patent);
  assert(patent.status == model::PatentStatus::kExclusivelyLicensed);
  assert(patent.exclusive_licensee == "alice");

  assert(a.f.engine->Withdraw("bob") == 20);
  assert(a.f.engine->GetAccount("bob").balance == 100);
  a.f.ExpectBalanced();
  assert(a.f.engine->Stats().custody == 30);
}

void TestRepeatBidReplacesEarlierBid() {
  Auction a;
  a.f.Bid("alice", a.patent, 7, 10);
  a.f.Bid("bob", a.patent, 8, 10);
  assert(a.f.Bid("alice", a.patent, 9, 15) == 1);

  const auto session = a.f.engine->GetSession(a.patent);
  assert(session.bids.size() == 2);
  assert(session.bids[0].bidder == "bob");
  assert(session.bids[1].bidder == "alice");
  assert(session.bids[1].escrow == 15);

  // the superseded escrow is refundable at once
  assert(a.f.engine->RefundBalanceOf("alice") == 10);
  assert(a.f.engine->GetAccount("alice").balance == 75);
  a.f.ExpectBalanced();

  a.f.EndWindow();
  a.f.Deliver(a.f.engine->FinalizeBidding("owner", a.patent));
  assert(a.f.engine->GetSession(a.patent).winner == "alice");
  assert(a.f.engine->GetAccount("owner").balance == 15);
  assert(a.f.engine->RefundBalanceOf("bob") == 10);
  a.f.ExpectBalanced();
}

void TestStartValidation() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");

  ExpectThrows<util::NotFound>([&] { f.engine->StartBidding("owner", 999, 1); }, "unknown patent");
  ExpectThrows<util::Authorization>([&] { f.engine->StartBidding("mallory", patent, 1); }, "only the owner starts bidding");
  ExpectThrows<util::InvalidInput>([&] { f.engine->StartBidding("owner", patent, 0); }, "zero hours");
  ExpectThrows<util::InvalidInput>([&] { f.engine->StartBidding("owner", patent, 169); }, "more than a week");

  f.engine->UpdatePatentStatus("owner", patent, model::PatentStatus::kSuspended);
  ExpectThrows<util::InvalidState>([&] { f.engine->StartBidding("owner", patent, 1); }, "suspended patent");
  f.engine->UpdatePatentStatus("owner", patent, model::PatentStatus::kActive);

  const auto session = f.engine->StartBidding("owner", patent, 168);
  assert(session.end_time_ms - session.started_at_ms == 168ull * 3600 * 1000);
  ExpectThrows<util::InvalidState>([&] { f.engine->StartBidding("owner", patent, 1); }, "window still running");
}

void TestExpiredEmptySessionIsReplaced() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner");
  f.Fund("alice", 50);

  const auto first = f.engine->StartBidding("owner", patent, 1);
  f.EndWindow();
  const auto second = f.engine->StartBidding("owner", patent, 2);
  assert(second.end_time_ms > first.end_time_ms);
  assert(second.phase == model::SessionPhase::kOpen);

  f.Bid("alice", patent, 1, 5);
  f.EndWindow(2);
  // a window that holds escrow is never replaced
  ExpectThrows<util::InvalidState>([&] { f.engine->StartBidding("owner", patent, 1); }, "session holds escrow");
  f.ExpectBalanced();
}

void TestBidValidationLeavesStateUntouched() {
  EngineFixture f;
  const auto    patent = f.RegisterPatent("owner", 25);
  f.Fund("alice", 40);

  ExpectThrows<util::NotOpen>([&] { f.Bid("alice", patent, 1, 30); }, "no session yet");

  f.engine->StartBidding("owner", patent, 1);
  ExpectThrows<util::InvalidInput>([&] { f.Bid("alice", patent, 1, 0); }, "zero escrow");
  ExpectThrows<util::InvalidInput>([&] { f.Bid("alice", patent, 1, 20); }, "below the patent's minimum fee");
  ExpectThrows<util::InvalidInput>([&] { f.Bid("alice", patent, 1, 41); }, "more than the bidder holds");
  ExpectThrows<util::InvalidInput>([&] { f.engine->SubmitBid("alice", patent, "", 30); }, "missing ciphertext");

  assert(f.engine->GetAccount("alice").balance == 40);
  assert(f.engine->GetSession(patent).bids.empty());

  f.EndWindow();
  ExpectThrows<util::Ended>([&] { f.Bid("alice", patent, 1, 30); }, "window over");
  f.ExpectBalanced();
}

void TestFinalizeValidation() {
  Auction a;
  ExpectThrows<util::InvalidState>([&] { a.f.engine->FinalizeBidding("owner", a.patent); }, "window still open");

  a.f.EndWindow();
  ExpectThrows<util::InvalidState>([&] { a.f.engine->FinalizeBidding("owner", a.patent); }, "no bids");
  assert(a.f.local_oracle->PendingCount() == 0);
  assert(a.f.engine->ListRequests(std::nullopt).empty());

  a.f.engine->StartBidding("owner", a.patent, 1);
  a.f.Bid("alice", a.patent, 4, 10);
  a.f.EndWindow();
  ExpectThrows<util::Authorization>([&] { a.f.engine->FinalizeBidding("alice", a.patent); }, "only the owner finalizes");

  a.f.engine->FinalizeBidding("owner", a.patent);
  assert(a.f.local_oracle->PendingCount() == 1);
  ExpectThrows<util::NotOpen>([&] { a.f.engine->FinalizeBidding("owner", a.patent); }, "finalized twice");
  ExpectThrows<util::NotOpen>([&] { a.f.Bid("bob", a.patent, 9, 10); }, "bid after finalize");
}

void TestOracleFailureRefundsEveryBidder() {
  Auction a;
  a.f.Bid("alice", a.patent, 5, 10);
  a.f.Bid("bob", a.patent, 6, 20);
  a.f.EndWindow();
  const auto id = a.f.engine->FinalizeBidding("owner", a.patent);

  // three words for two bids
  const auto signed_words = a.f.Sign(id, {1, 2, 3});
  const auto result       = a.f.engine->CompleteBidding(id, signed_words.cleartexts, signed_words.proof);
  assert(result.status == model::RequestStatus::kFailed);

  assert(a.f.engine->GetSession(a.patent).phase == model::SessionPhase::kUnresolved);
  assert(a.f.engine->RefundBalanceOf("alice") == 10);
  assert(a.f.engine->RefundBalanceOf("bob") == 20);
  assert(a.f.engine->GetAccount("owner").balance == 0);
  assert(a.f.engine->GetPatent(a.patent).status == model::PatentStatus::kActive);
  a.f.ExpectBalanced();
}

void TestTimeoutRefundsEveryBidderAndLateAnswerIsIgnored() {
  Auction a;
  a.f.Bid("alice", a.patent, 5, 10);
  a.f.Bid("bob", a.patent, 6, 20);
  a.f.EndWindow();
  const auto id = a.f.engine->FinalizeBidding("owner", a.patent);

  a.f.clock->Advance(a.f.engine->RequestTimeout());
  const auto claim = a.f.engine->Claim("bob", id);
  assert(claim.request.status == model::RequestStatus::kTimedOut);
  assert(claim.withdrawn == 20);
  assert(claim.withdraw_error.empty());
  assert(a.f.engine->RefundBalanceOf("alice") == 10);
  assert(a.f.engine->GetSession(a.patent).phase == model::SessionPhase::kUnresolved);

  assert(a.f.Deliver(id) == 0);
  assert(a.f.engine->GetSession(a.patent).winner.empty());
  a.f.ExpectBalanced();
}

void TestRejectedWinnerPayoutRollsBackCallback() {
  Auction a;
  a.f.Bid("alice", a.patent, 5, 10);
  a.f.Bid("bob", a.patent, 2, 20);
  a.f.EndWindow();
  const auto id = a.f.engine->FinalizeBidding("owner", a.patent);

  a.f.engine->SetAcceptsPayouts("owner", false);
  const auto signed_words = a.f.Sign(id, {5, 2});
  ExpectThrows<util::TransferFailure>([&] { a.f.engine->CompleteBidding(id, signed_words.cleartexts, signed_words.proof); },
                                      "controller rejects the winning escrow");

  assert(a.f.engine->GetRequest(id).status == model::RequestStatus::kPending);
  assert(a.f.engine->GetSession(a.patent).phase == model::SessionPhase::kAwaitingResult);
  assert(a.f.engine->RefundBalanceOf("bob") == 0);

  a.f.clock->Advance(a.f.engine->RequestTimeout());
  a.f.engine->ClaimTimeout(id);
  assert(a.f.engine->RefundBalanceOf("alice") == 10);
  assert(a.f.engine->RefundBalanceOf("bob") == 20);
  a.f.ExpectBalanced();
}

} // namespace

int main() {
  TestHighestBidWinsAndFirstTieWins();
  TestRepeatBidReplacesEarlierBid();
  TestStartValidation();
  TestExpiredEmptySessionIsReplaced();
  TestBidValidationLeavesStateUntouched();
  TestFinalizeValidation();
  TestOracleFailureRefundsEveryBidder();
  TestTimeoutRefundsEveryBidderAndLateAnswerIsIgnored();
  TestRejectedWinnerPayoutRollsBackCallback();

  std::cout << "settlement_unit_bidding_engine: pass\n";
  return 0;
}
