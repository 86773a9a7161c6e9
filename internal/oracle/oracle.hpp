#pragma once

#include <string_view>
#include <vector>

#include "internal/model/correlation.hpp"
#include "internal/model/types.hpp"

namespace settlement::oracle {

/*
  Outbound half of the confidential-compute oracle.

  RequestDecryption only queues work: the oracle answers later, on its
  own schedule, through the callback entry point named by the selector.
  Called after the issuing transaction has committed.
*/
class OracleClient {
 public:
  virtual ~OracleClient() = default;

  virtual void RequestDecryption(model::RequestId id, const std::vector<model::CiphertextHandle>& handles,
                                 model::CallbackSelector selector) = 0;
};

// Checks that cleartexts were produced by the oracle for this request id.
class AttestationVerifier {
 public:
  virtual ~AttestationVerifier() = default;

  virtual bool Verify(model::RequestId id, std::string_view cleartexts, std::string_view proof) const = 0;
};

} // namespace settlement::oracle
