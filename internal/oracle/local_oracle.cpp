#include "internal/oracle/local_oracle.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/oracle/cleartext_codec.hpp"

namespace settlement::oracle {

LocalOracle::LocalOracle(std::shared_ptr<cipher::CiphertextVault> vault, std::shared_ptr<Ed25519Signer> signer,
                         std::shared_ptr<util::TimeSource> clock, LocalOracleOptions options)
    : vault_(std::move(vault)), signer_(std::move(signer)), clock_(std::move(clock)), options_(options) {
}

LocalOracle::~LocalOracle() {
  Stop();
}

void LocalOracle::SetSink(std::shared_ptr<CallbackSink> sink) {
  sink_ = std::move(sink);
}

void LocalOracle::RequestDecryption(model::RequestId id, const std::vector<model::CiphertextHandle>& handles,
                                    model::CallbackSelector selector) {
  DecryptionJob job;
  job.request_id = id;
  job.handles    = handles;
  job.selector   = selector;
  job.ready_at   = clock_->Now() + options_.delivery_delay;
  queue_.Enqueue(std::move(job));
}

std::size_t LocalOracle::DeliverPending(model::RequestId id) {
  std::vector<DecryptionJob> jobs;
  if (id == 0) {
    jobs = queue_.TakeAll();
  } else if (auto job = queue_.Take(id)) {
    jobs.push_back(std::move(*job));
  }

  std::size_t delivered = 0;
  for (const auto& job : jobs) {
    if (Deliver(job)) ++delivered;
  }
  return delivered;
}

std::size_t LocalOracle::PendingCount() const {
  return queue_.Size();
}

void LocalOracle::Start() {
  if (!options_.auto_deliver || running_) return;
  running_ = true;
  thread_  = std::thread(&LocalOracle::Run, this);
}

void LocalOracle::Stop() {
  queue_.Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void LocalOracle::Run() {
  while (running_) {
    auto job = queue_.Dequeue();
    if (!job) break;

    // the delay is measured on the wall clock the worker sleeps on
    auto wait = job->ready_at - clock_->Now();
    if (wait > util::Duration::zero()) {
      std::this_thread::sleep_for(wait);
    }
    Deliver(*job);
  }
}

bool LocalOracle::Deliver(const DecryptionJob& job) {
  std::vector<std::uint64_t> words;
  words.reserve(job.handles.size());
  for (const auto& handle : job.handles) {
    auto value = vault_->Reveal(handle);
    if (!value) {
      SETTLEMENT_LOG_WARN("local oracle cannot reveal handle, request left to time out",
                          {observability::IntField("request_id", static_cast<std::int64_t>(job.request_id)),
                           observability::StringField("handle", handle)});
      return false;
    }
    words.push_back(*value);
  }

  if (!sink_) {
    SETTLEMENT_LOG_ERROR("local oracle has no callback sink", {observability::IntField("request_id", static_cast<std::int64_t>(job.request_id))});
    return false;
  }

  auto cleartexts = EncodeWords(words);
  auto proof      = signer_->Sign(job.request_id, cleartexts);

  try {
    sink_->Deliver(job.selector, job.request_id, cleartexts, proof);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_WARN("oracle callback rejected", {observability::IntField("request_id", static_cast<std::int64_t>(job.request_id)),
                                                     observability::StringField("error", e.what())});
    return false;
  }
  return true;
}

} // namespace settlement::oracle
