#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/model/refund_reason.hpp"

namespace settlement::core {

/*
  Business side of a decryption request.

  OnDecrypted returns nullopt on success, or the reason the decrypted words
  cannot be applied. A handler that reports a failure must not have written
  anything. Exceptions (TransferFailure, repository errors) abort the whole
  callback.

  OnUnresolved runs when the request failed or timed out and releases
  whatever the correlated business object was holding.
*/
class CorrelationHandler {
 public:
  virtual ~CorrelationHandler() = default;

  virtual std::optional<std::string> OnDecrypted(UnitOfWork& uow, const db::model::RequestRecord& request,
                                                 const std::vector<std::uint64_t>& words) = 0;

  virtual void OnUnresolved(UnitOfWork& uow, const db::model::RequestRecord& request, model::RefundReason reason) = 0;
};

} // namespace settlement::core
