#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/oracle/attestation.hpp"
#include "internal/oracle/cleartext_codec.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/util/time.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;

struct Delivery {
  model::CallbackSelector selector;
  model::RequestId        id;
  std::string             cleartexts;
  std::string             proof;
};

class RecordingSink final : public oracle::CallbackSink {
 public:
  void Deliver(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
               const std::string& proof) override {
    if (fail) throw std::runtime_error("sink refused");
    std::lock_guard<std::mutex> lock(mutex_);
    deliveries_.push_back({selector, id, cleartexts, proof});
    cv_.notify_all();
  }

  bool WaitFor(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return deliveries_.size() >= count; });
  }

  std::vector<Delivery> Deliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
  }

  bool fail = false;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::vector<Delivery>   deliveries_;
};

struct Harness {
  std::shared_ptr<cipher::CiphertextVault> vault  = std::make_shared<cipher::CiphertextVault>();
  std::shared_ptr<oracle::Ed25519Signer>   signer = std::make_shared<oracle::Ed25519Signer>(settlement::testing::kOracleSeed);
  std::shared_ptr<RecordingSink>           sink   = std::make_shared<RecordingSink>();
  std::shared_ptr<oracle::LocalOracle>     local;

  explicit Harness(oracle::LocalOracleOptions options, std::shared_ptr<util::TimeSource> clock = std::make_shared<util::SystemTimeSource>()) {
    local = std::make_shared<oracle::LocalOracle>(vault, signer, std::move(clock), options);
    local->SetSink(sink);
  }
};

void TestManualDeliveryIsSignedAndOrdered() {
  oracle::LocalOracleOptions options;
  options.auto_deliver = false;
  Harness h(options);

  const auto a = h.vault->Seal(3);
  const auto b = h.vault->Seal(9);
  h.local->RequestDecryption(4, {a, b}, model::CallbackSelector::kCompleteVerification);
  h.local->Start();
  assert(h.local->PendingCount() == 1);
  assert(h.sink->Deliveries().empty());

  assert(h.local->DeliverPending() == 1);
  assert(h.local->PendingCount() == 0);

  const auto deliveries = h.sink->Deliveries();
  assert(deliveries.size() == 1);
  assert(deliveries[0].id == 4);
  assert(deliveries[0].selector == model::CallbackSelector::kCompleteVerification);
  assert((oracle::DecodeWords(deliveries[0].cleartexts) == std::vector<std::uint64_t>{3, 9}));

  oracle::Ed25519Verifier verifier(h.signer->PublicKey());
  assert(verifier.Verify(4, deliveries[0].cleartexts, deliveries[0].proof));
}

void TestDeliverOneRequestById() {
  oracle::LocalOracleOptions options;
  options.auto_deliver = false;
  Harness h(options);

  h.local->RequestDecryption(1, {h.vault->Seal(1)}, model::CallbackSelector::kCompleteBidding);
  h.local->RequestDecryption(2, {h.vault->Seal(2)}, model::CallbackSelector::kCompleteBidding);

  assert(h.local->DeliverPending(2) == 1);
  assert(h.local->DeliverPending(7) == 0);
  assert(h.local->PendingCount() == 1);
  assert(h.sink->Deliveries().at(0).id == 2);
}

void TestUnknownHandleIsDropped() {
  oracle::LocalOracleOptions options;
  options.auto_deliver = false;
  Harness h(options);

  h.local->RequestDecryption(1, {h.vault->Seal(5), std::string(64, '0')}, model::CallbackSelector::kCompleteBidding);
  assert(h.local->DeliverPending() == 0);
  assert(h.local->PendingCount() == 0);
  assert(h.sink->Deliveries().empty());
}

void TestRejectedCallbackIsNotCounted() {
  oracle::LocalOracleOptions options;
  options.auto_deliver = false;
  Harness h(options);

  h.sink->fail = true;
  h.local->RequestDecryption(1, {h.vault->Seal(5)}, model::CallbackSelector::kCompleteBidding);
  assert(h.local->DeliverPending() == 0);
}

void TestWorkerDeliversAfterDelay() {
  oracle::LocalOracleOptions options;
  options.auto_deliver   = true;
  options.delivery_delay = std::chrono::milliseconds(20);
  Harness h(options);
  h.local->Start();

  const auto started = util::Now();
  h.local->RequestDecryption(11, {h.vault->Seal(77)}, model::CallbackSelector::kCompleteBidding);
  h.local->RequestDecryption(12, {h.vault->Seal(78)}, model::CallbackSelector::kCompleteBidding);

  assert(h.sink->WaitFor(2, std::chrono::seconds(5)));
  assert(util::Now() - started >= std::chrono::milliseconds(20));

  const auto deliveries = h.sink->Deliveries();
  assert(deliveries[0].id == 11);
  assert(deliveries[1].id == 12);
  assert(oracle::DecodeWords(deliveries[1].cleartexts).at(0) == 78);

  h.local->Stop();
  h.local->Stop();
}

} // namespace

int main() {
  TestManualDeliveryIsSignedAndOrdered();
  TestDeliverOneRequestById();
  TestUnknownHandleIsDropped();
  TestRejectedCallbackIsNotCounted();
  TestWorkerDeliversAfterDelay();

  std::cout << "settlement_unit_local_oracle: pass\n";
  return 0;
}
