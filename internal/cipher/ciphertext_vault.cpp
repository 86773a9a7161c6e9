#include "internal/cipher/ciphertext_vault.hpp"

#include <openssl/rand.h>

#include <array>
#include <stdexcept>
#include <string>

#include "internal/util/hex.hpp"

namespace settlement::cipher {

namespace {

constexpr std::size_t kHandleBytes = 32;

std::string RandomHandle() {
  std::array<unsigned char, kHandleBytes> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return util::ToHex(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

} // namespace

model::CiphertextHandle CiphertextVault::Seal(std::uint64_t value) {
  auto             handle = RandomHandle();
  std::scoped_lock lock(mutex_);
  values_.emplace(handle, value);
  return handle;
}

std::optional<std::uint64_t> CiphertextVault::Reveal(const model::CiphertextHandle& handle) const {
  std::scoped_lock lock(mutex_);
  auto             it = values_.find(handle);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

std::size_t CiphertextVault::Size() const {
  std::scoped_lock lock(mutex_);
  return values_.size();
}

} // namespace settlement::cipher
