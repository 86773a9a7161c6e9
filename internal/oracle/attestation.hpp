#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/oracle/oracle.hpp"

namespace settlement::oracle {

inline constexpr std::string_view kAttestationDomain = "settlement.attestation.v1";
inline constexpr std::size_t      kEd25519KeyBytes   = 32;
inline constexpr std::size_t      kEd25519SigBytes   = 64;

// domain || be64(id) || cleartexts
std::string AttestationMessage(model::RequestId id, std::string_view cleartexts);

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const;
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

class Ed25519Signer {
 public:
  // seed: 32 raw bytes
  explicit Ed25519Signer(std::string_view seed);

  std::string Sign(model::RequestId id, std::string_view cleartexts) const;

  // 32 raw bytes
  std::string PublicKey() const;

 private:
  PkeyPtr key_;
};

class Ed25519Verifier final : public AttestationVerifier {
 public:
  // public_key: 32 raw bytes. InvalidInput on a malformed key.
  explicit Ed25519Verifier(std::string_view public_key);

  bool Verify(model::RequestId id, std::string_view cleartexts, std::string_view proof) const override;

 private:
  PkeyPtr key_;
};

} // namespace settlement::oracle
