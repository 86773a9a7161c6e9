#include <cassert>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::EngineFixture;

const std::vector<std::string> kBidders = {"alice", "bob", "carol", "dave"};
const std::vector<std::string> kOwners  = {"owner-a", "owner-b"};

model::Amount TotalHeld(EngineFixture& f) {
  model::Amount total = f.engine->Stats().custody;
  for (const auto& account : kBidders) total += f.engine->GetAccount(account).balance;
  for (const auto& account : kOwners) total += f.engine->GetAccount(account).balance;
  return total;
}

/*
  Random walk over bids, finalizations, deliveries, oracle failures,
  timeouts and withdrawals. After every step custody must equal live
  escrow plus refundable balances, and no unit may appear or vanish.
*/
void RunScenario(unsigned seed) {
  EngineFixture f;
  std::mt19937  rng(seed);

  std::vector<model::AssetId> patents;
  for (const auto& owner : kOwners) {
    patents.push_back(f.RegisterPatent(owner));
    patents.push_back(f.RegisterPatent(owner));
  }

  model::Amount deposited = 0;
  for (const auto& bidder : kBidders) {
    f.Fund(bidder, 1000);
    deposited += 1000;
  }

  std::vector<model::RequestId> issued;
  int                           applied  = 0;
  int                           rejected = 0;

  for (int step = 0; step < 400; ++step) {
    const auto  pick   = rng() % 8;
    const auto  patent = patents[rng() % patents.size()];
    const auto  owner  = f.engine->GetPatent(patent).owner;
    const auto& bidder = kBidders[rng() % kBidders.size()];

    try {
      switch (pick) {
        case 0:
          f.engine->StartBidding(owner, patent, 1 + rng() % 3);
          break;
        case 1:
        case 2:
          f.Bid(bidder, patent, rng() % 50, 1 + rng() % 40);
          break;
        case 3:
          issued.push_back(f.engine->FinalizeBidding(owner, patent));
          break;
        case 4:
          f.Deliver();
          break;
        case 5:
          if (!issued.empty()) {
            const auto id           = issued[rng() % issued.size()];
            const auto signed_words = f.Sign(id, {1, 2, 3, 4, 5, 6, 7, 8, 9});
            f.engine->CompleteBidding(id, signed_words.cleartexts, signed_words.proof);
          }
          break;
        case 6:
          if (!issued.empty()) f.engine->ClaimTimeout(issued[rng() % issued.size()]);
          break;
        case 7:
          f.engine->Withdraw(bidder);
          break;
      }
      ++applied;
    } catch (const util::InvalidState&) {
      ++rejected;
    } catch (const util::InvalidInput&) {
      ++rejected;
    } catch (const util::Authorization&) {
      ++rejected;
    }

    f.clock->Advance(std::chrono::minutes(rng() % 240));
    f.ExpectBalanced();
    assert(TotalHeld(f) == deposited);
  }

  // drain: every pending request times out and every refund is withdrawn
  f.clock->Advance(f.engine->RequestTimeout());
  for (const auto& request : f.engine->ListRequests(model::RequestStatus::kPending)) {
    f.engine->ClaimTimeout(request.id);
  }
  for (const auto& bidder : kBidders) {
    if (f.engine->RefundBalanceOf(bidder) > 0) f.engine->Withdraw(bidder);
  }

  assert(applied > 0 && rejected > 0);

  const auto stats = f.engine->Stats();
  assert(stats.refundable == 0);
  assert(stats.requests_pending == 0);
  assert(stats.custody == stats.active_escrow);
  assert(TotalHeld(f) == deposited);
}

} // namespace

int main() {
  for (unsigned seed = 1; seed <= 5; ++seed) {
    RunScenario(seed);
  }

  std::cout << "settlement_unit_conservation: pass\n";
  return 0;
}
