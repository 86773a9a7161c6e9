#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace settlement::core {

/*
  One public operation = one UnitOfWork = one repository transaction.

  Side effects that must not happen unless the transaction commits
  (oracle dispatch, event logging, metrics) are registered with
  AfterCommit() and run in registration order once Commit() succeeds.
  Destroying an uncommitted UnitOfWork rolls everything back and drops
  the hooks.
*/
class UnitOfWork {
 public:
  explicit UnitOfWork(db::Repository& repository);

  UnitOfWork(const UnitOfWork&)            = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  db::Repository& Repo() {
    return repository_;
  }
  db::Transaction& Tx() {
    return *tx_;
  }

  void AfterCommit(std::function<void()> hook);

  void Commit();

 private:
  db::Repository&                    repository_;
  std::unique_ptr<db::Transaction>   tx_;
  std::vector<std::function<void()>> after_commit_;
};

// Converts a repository Result into an exception at the engine boundary.
void Check(const db::Result& result, const char* what);

} // namespace settlement::core
