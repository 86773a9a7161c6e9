#include "internal/core/unit_of_work.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace settlement::core {

UnitOfWork::UnitOfWork(db::Repository& repository) : repository_(repository), tx_(repository.Begin()) {
}

void UnitOfWork::AfterCommit(std::function<void()> hook) {
  after_commit_.push_back(std::move(hook));
}

void UnitOfWork::Commit() {
  tx_->Commit();

  auto hooks = std::move(after_commit_);
  after_commit_.clear();
  for (auto& hook : hooks) {
    // already committed: hook failures are logged, not reported
    try {
      hook();
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR("post-commit hook failed", {observability::StringField("error", e.what())});
    }
  }
}

void Check(const db::Result& result, const char* what) {
  if (!result) {
    std::string message = std::string(what) + ": " + db::ToString(result.code);
    if (!result.message.empty()) message += " (" + result.message + ")";
    throw std::runtime_error(message);
  }
}

} // namespace settlement::core
