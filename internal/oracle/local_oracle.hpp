#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/oracle/attestation.hpp"
#include "internal/oracle/decryption_queue.hpp"
#include "internal/oracle/oracle.hpp"

namespace settlement::oracle {

// Inbound half: where the oracle delivers its signed results.
class CallbackSink {
 public:
  virtual ~CallbackSink() = default;

  virtual void Deliver(model::CallbackSelector selector, model::RequestId id, const std::string& cleartexts,
                       const std::string& proof) = 0;
};

struct LocalOracleOptions {
  bool                      auto_deliver = true;
  std::chrono::milliseconds delivery_delay{0};
};

/*
  In-process oracle for development and tests.

  Reveals handles from the shared vault, encodes the words, signs them and
  calls the sink. A job naming a handle the vault does not know is dropped
  without delivery; the request then only resolves through the timeout.

  auto_deliver runs a worker thread that delivers every job once its
  delay has passed. Otherwise jobs wait for DeliverPending().
*/
class LocalOracle final : public OracleClient {
 public:
  LocalOracle(std::shared_ptr<cipher::CiphertextVault> vault, std::shared_ptr<Ed25519Signer> signer,
              std::shared_ptr<util::TimeSource> clock, LocalOracleOptions options);
  ~LocalOracle();

  void SetSink(std::shared_ptr<CallbackSink> sink);

  void RequestDecryption(model::RequestId id, const std::vector<model::CiphertextHandle>& handles,
                         model::CallbackSelector selector) override;

  // Delivers queued jobs synchronously: the one for `id`, or all when id
  // is 0. Returns the number of callbacks made.
  std::size_t DeliverPending(model::RequestId id = 0);

  std::size_t PendingCount() const;

  void Start();
  void Stop();

 private:
  void Run();
  bool Deliver(const DecryptionJob& job);

  std::shared_ptr<cipher::CiphertextVault> vault_;
  std::shared_ptr<Ed25519Signer>           signer_;
  std::shared_ptr<util::TimeSource>        clock_;
  LocalOracleOptions                       options_;
  std::shared_ptr<CallbackSink>            sink_;

  DecryptionQueue   queue_;
  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace settlement::oracle
