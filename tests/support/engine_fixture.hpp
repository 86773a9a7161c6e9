#pragma once

#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/oracle/attestation.hpp"
#include "internal/oracle/cleartext_codec.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/util/time.hpp"

namespace settlement::testing {

inline const std::string kOracleSeed(oracle::kEd25519KeyBytes, '\x2a');
inline const std::string kOperator = "operator";

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn, const char* what) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw && what);
}

struct Signed {
  std::string cleartexts;
  std::string proof;
};

/*
  Engine wired to an in-memory repository, a manual clock and a local
  oracle that only delivers when told to (Deliver()).
*/
struct EngineFixture {
  std::shared_ptr<util::ManualTimeSource>  clock = std::make_shared<util::ManualTimeSource>();
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<cipher::CiphertextVault> vault  = std::make_shared<cipher::CiphertextVault>();
  std::shared_ptr<oracle::Ed25519Signer>   signer = std::make_shared<oracle::Ed25519Signer>(kOracleSeed);
  std::shared_ptr<oracle::LocalOracle>     local_oracle;
  std::shared_ptr<core::SettlementEngine>  engine;

  explicit EngineFixture(core::EngineOptions options = DefaultOptions(), std::shared_ptr<db::Repository> repo = nullptr)
      : repository(repo ? std::move(repo) : std::make_shared<db::memory::MemoryRepository>()) {
    oracle::LocalOracleOptions oracle_options;
    oracle_options.auto_deliver = false;
    local_oracle = std::make_shared<oracle::LocalOracle>(vault, signer, clock, oracle_options);

    auto verifier = std::make_shared<oracle::Ed25519Verifier>(signer->PublicKey());
    engine        = std::make_shared<core::SettlementEngine>(repository, local_oracle, verifier, vault, clock, options);
    local_oracle->SetSink(std::make_shared<core::EngineCallbackSink>(engine));
  }

  static core::EngineOptions DefaultOptions() {
    core::EngineOptions options;
    options.registry.operator_account = kOperator;
    return options;
  }

  model::AssetId RegisterPatent(const model::Account& owner, model::Amount min_fee = 0) {
    registry::PatentTerms terms;
    terms.royalty_rate    = 500;
    terms.min_license_fee = min_fee;
    terms.validity_years  = 10;
    terms.patent_hash     = "sha256:" + owner;
    return engine->RegisterPatent(owner, terms);
  }

  // Active license on `patent` for `licensee` at `rate` basis points.
  model::LicenseId ActiveLicense(model::AssetId patent, const model::Account& licensee, std::uint32_t rate) {
    registry::LicenseTerms terms;
    terms.patent_id     = patent;
    terms.proposed_rate = rate;
    terms.duration_days = 365;
    auto id             = engine->RequestLicense(licensee, terms);
    engine->ApproveLicense(engine->GetPatent(patent).owner, id, 365);
    return id;
  }

  void Fund(const model::Account& account, model::Amount amount) {
    engine->Deposit(account, amount);
  }

  std::size_t Bid(const model::Account& bidder, model::AssetId asset, std::uint64_t value, model::Amount escrow) {
    return engine->SubmitBid(bidder, asset, vault->Seal(value), escrow);
  }

  void EndWindow(std::uint32_t hours = 1) {
    clock->Advance(std::chrono::hours(hours));
  }

  std::size_t Deliver(model::RequestId id = 0) {
    return local_oracle->DeliverPending(id);
  }

  Signed Sign(model::RequestId id, const std::vector<std::uint64_t>& words) const {
    Signed out;
    out.cleartexts = oracle::EncodeWords(words);
    out.proof      = signer->Sign(id, out.cleartexts);
    return out;
  }

  void ExpectBalanced() {
    auto stats = engine->Stats();
    assert(stats.balanced);
    assert(stats.custody == stats.active_escrow + stats.refundable);
  }
};

} // namespace settlement::testing
