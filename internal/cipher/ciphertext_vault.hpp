#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/model/types.hpp"

namespace settlement::cipher {

// Turns a public value into an opaque ciphertext handle.
class ValueSealer {
 public:
  virtual ~ValueSealer() = default;

  virtual model::CiphertextHandle Seal(std::uint64_t value) = 0;
};

/*
  Local stand-in for the confidential-compute network's encryption.

  Handles are 32 random bytes (hex) and carry no information about the
  value. Only the holder of the vault, the local oracle, can Reveal them.
  The vault is process memory: handles do not survive a restart.
*/
class CiphertextVault final : public ValueSealer {
 public:
  model::CiphertextHandle Seal(std::uint64_t value) override;

  std::optional<std::uint64_t> Reveal(const model::CiphertextHandle& handle) const;

  std::size_t Size() const;

 private:
  mutable std::mutex                                        mutex_;
  std::unordered_map<model::CiphertextHandle, std::uint64_t> values_;
};

} // namespace settlement::cipher
