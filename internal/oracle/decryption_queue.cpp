#include "internal/oracle/decryption_queue.hpp"

#include <algorithm>

namespace settlement::oracle {

void DecryptionQueue::Enqueue(DecryptionJob job) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
}

std::optional<DecryptionJob> DecryptionQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  DecryptionJob job = std::move(queue_.front());
  queue_.pop_front();
  return job;
}

std::optional<DecryptionJob> DecryptionQueue::Take(model::RequestId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(), [id](const DecryptionJob& job) { return job.request_id == id; });
  if (it == queue_.end()) return std::nullopt;

  DecryptionJob job = std::move(*it);
  queue_.erase(it);
  return job;
}

std::vector<DecryptionJob> DecryptionQueue::TakeAll() {
  std::lock_guard            lock(mutex_);
  std::vector<DecryptionJob> jobs(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return jobs;
}

std::size_t DecryptionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void DecryptionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace settlement::oracle
