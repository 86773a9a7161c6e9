#pragma once

#include <cstdint>
#include <string>

#include "internal/core/unit_of_work.hpp"

namespace settlement::core {

// Persisted id sequences. Ids allocated in a transaction that rolls back
// are handed out again.
class SequenceGenerator {
 public:
  virtual ~SequenceGenerator() = default;

  virtual std::uint64_t Next(UnitOfWork& uow, const std::string& name) = 0;
};

class RepositorySequenceGenerator final : public SequenceGenerator {
 public:
  std::uint64_t Next(UnitOfWork& uow, const std::string& name) override {
    std::uint64_t value = 0;
    Check(uow.Repo().NextSequence(uow.Tx(), name, value), "next sequence");
    return value;
  }
};

inline constexpr const char* kRequestSequence = "decryption_requests";
inline constexpr const char* kPatentSequence  = "patents";
inline constexpr const char* kLicenseSequence = "licenses";

} // namespace settlement::core
