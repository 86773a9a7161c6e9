#include "internal/oracle/attestation.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace settlement::oracle {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string OpenSslError(const char* what) {
  char buffer[256] = {};
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return std::string(what) + ": " + buffer;
}

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

void PkeyDeleter::operator()(EVP_PKEY* key) const {
  EVP_PKEY_free(key);
}

std::string AttestationMessage(model::RequestId id, std::string_view cleartexts) {
  std::string message;
  message.reserve(kAttestationDomain.size() + 8 + cleartexts.size());
  message.append(kAttestationDomain);
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<char>((id >> shift) & 0xff));
  }
  message.append(cleartexts);
  return message;
}

Ed25519Signer::Ed25519Signer(std::string_view seed) {
  if (seed.size() != kEd25519KeyBytes) {
    throw util::InvalidInput("ed25519 seed must be 32 bytes");
  }
  key_.reset(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, Bytes(seed), seed.size()));
  if (!key_) throw std::runtime_error(OpenSslError("ed25519 private key"));
}

std::string Ed25519Signer::Sign(model::RequestId id, std::string_view cleartexts) const {
  auto     message = AttestationMessage(id, cleartexts);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    throw std::runtime_error(OpenSslError("ed25519 sign init"));
  }

  std::string signature(kEd25519SigBytes, '\0');
  std::size_t length = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &length, Bytes(message), message.size()) != 1) {
    throw std::runtime_error(OpenSslError("ed25519 sign"));
  }
  signature.resize(length);
  return signature;
}

std::string Ed25519Signer::PublicKey() const {
  std::string key(kEd25519KeyBytes, '\0');
  std::size_t length = key.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), reinterpret_cast<unsigned char*>(key.data()), &length) != 1) {
    throw std::runtime_error(OpenSslError("ed25519 public key"));
  }
  key.resize(length);
  return key;
}

Ed25519Verifier::Ed25519Verifier(std::string_view public_key) {
  if (public_key.size() != kEd25519KeyBytes) {
    throw util::InvalidInput("ed25519 public key must be 32 bytes");
  }
  key_.reset(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, Bytes(public_key), public_key.size()));
  if (!key_) throw util::InvalidInput(OpenSslError("ed25519 public key"));
}

bool Ed25519Verifier::Verify(model::RequestId id, std::string_view cleartexts, std::string_view proof) const {
  if (proof.size() != kEd25519SigBytes) return false;

  auto     message = AttestationMessage(id, cleartexts);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    throw std::runtime_error(OpenSslError("ed25519 verify init"));
  }
  return EVP_DigestVerify(ctx.get(), Bytes(proof), proof.size(), Bytes(message), message.size()) == 1;
}

} // namespace settlement::oracle
