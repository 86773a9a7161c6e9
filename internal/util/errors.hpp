#pragma once

#include <stdexcept>
#include <string>

namespace settlement::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Subclasses name the
  precise precondition that failed; callers may catch either level.
*/

class Authorization : public std::runtime_error {
 public:
  explicit Authorization(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotPending : public InvalidState {
 public:
  explicit NotPending(const std::string& msg) : InvalidState(msg) {
  }
};

class AlreadyResolved : public NotPending {
 public:
  explicit AlreadyResolved(const std::string& msg) : NotPending(msg) {
  }
};

class NotExpired : public InvalidState {
 public:
  explicit NotExpired(const std::string& msg) : InvalidState(msg) {
  }
};

class NotOpen : public InvalidState {
 public:
  explicit NotOpen(const std::string& msg) : InvalidState(msg) {
  }
};

class Ended : public InvalidState {
 public:
  explicit Ended(const std::string& msg) : InvalidState(msg) {
  }
};

class NothingToWithdraw : public InvalidState {
 public:
  explicit NothingToWithdraw(const std::string& msg) : InvalidState(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRequest : public InvalidInput {
 public:
  explicit InvalidRequest(const std::string& msg) : InvalidInput(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AttestationInvalid : public std::runtime_error {
 public:
  explicit AttestationInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransferFailure : public std::runtime_error {
 public:
  explicit TransferFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Oracle output that cannot be decoded into the shape a handler expects.
class MalformedPayload : public std::runtime_error {
 public:
  explicit MalformedPayload(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace settlement::util
