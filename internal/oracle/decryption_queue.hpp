#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/model/correlation.hpp"
#include "internal/model/types.hpp"
#include "internal/util/time.hpp"

namespace settlement::oracle {

/*
  A decryption the oracle owes the coordinator.
*/
struct DecryptionJob {
  model::RequestId                     request_id = 0;
  std::vector<model::CiphertextHandle> handles;
  model::CallbackSelector              selector = model::CallbackSelector::kCompleteBidding;

  // earliest delivery time
  util::TimePoint ready_at{};
};

/*
  Thread-safe blocking queue for the delivery worker.
*/
class DecryptionQueue {
 public:
  void Enqueue(DecryptionJob job);

  // blocking wait; nullopt once shut down and drained
  std::optional<DecryptionJob> Dequeue();

  // non-blocking removal of one job by request id
  std::optional<DecryptionJob> Take(model::RequestId id);

  // non-blocking removal of every queued job
  std::vector<DecryptionJob> TakeAll();

  std::size_t Size() const;

  void Shutdown();

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::deque<DecryptionJob> queue_;
  bool                      shutdown_ = false;
};

} // namespace settlement::oracle
