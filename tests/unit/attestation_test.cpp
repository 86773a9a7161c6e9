#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "internal/cipher/ciphertext_vault.hpp"
#include "internal/oracle/attestation.hpp"
#include "internal/oracle/cleartext_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::ExpectThrows;

// RFC 8032, section 7.1, test 1
constexpr const char* kRfcSecret = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr const char* kRfcPublic = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

void TestPublicKeyDerivation() {
  oracle::Ed25519Signer signer(util::FromHex(kRfcSecret));
  assert(util::ToHex(signer.PublicKey()) == kRfcPublic);
}

void TestSignatureBindsRequestAndCleartexts() {
  oracle::Ed25519Signer   signer(settlement::testing::kOracleSeed);
  oracle::Ed25519Verifier verifier(signer.PublicKey());

  const auto cleartexts = oracle::EncodeWords({42, 7});
  const auto proof      = signer.Sign(5, cleartexts);
  assert(proof.size() == oracle::kEd25519SigBytes);
  assert(verifier.Verify(5, cleartexts, proof));

  assert(!verifier.Verify(6, cleartexts, proof));
  assert(!verifier.Verify(5, oracle::EncodeWords({42, 8}), proof));
  assert(!verifier.Verify(5, cleartexts, proof.substr(1)));
  assert(!verifier.Verify(5, cleartexts, ""));

  auto tampered = proof;
  tampered[10] ^= 0x40;
  assert(!verifier.Verify(5, cleartexts, tampered));

  oracle::Ed25519Signer   stranger(std::string(oracle::kEd25519KeyBytes, '\x11'));
  oracle::Ed25519Verifier stranger_verifier(stranger.PublicKey());
  assert(!stranger_verifier.Verify(5, cleartexts, proof));
  assert(!verifier.Verify(5, cleartexts, stranger.Sign(5, cleartexts)));
}

void TestAttestationMessageLayout() {
  const auto message = oracle::AttestationMessage(0x0102030405060708ull, "xy");
  assert(message.size() == oracle::kAttestationDomain.size() + 8 + 2);
  assert(message.compare(0, oracle::kAttestationDomain.size(), oracle::kAttestationDomain) == 0);
  assert(util::ToHex(message.substr(oracle::kAttestationDomain.size(), 8)) == "0102030405060708");
  assert(message.substr(message.size() - 2) == "xy");
}

void TestMalformedKeysAreRejected() {
  ExpectThrows<util::InvalidInput>([] { oracle::Ed25519Signer signer(std::string(31, 'a')); }, "short seed");
  ExpectThrows<util::InvalidInput>([] { oracle::Ed25519Verifier verifier(std::string(33, 'a')); }, "long key");
}

void TestWordCodec() {
  constexpr auto kMax    = std::numeric_limits<std::uint64_t>::max();
  const auto     encoded = oracle::EncodeWords({1, kMax, 0x0a0b});
  assert(encoded.size() == 3 * oracle::kWordBytes);
  assert(util::ToHex(encoded) == "0000000000000001ffffffffffffffff0000000000000a0b");
  assert((oracle::DecodeWords(encoded) == std::vector<std::uint64_t>{1, kMax, 0x0a0b}));

  assert(oracle::DecodeWords("").empty());
  ExpectThrows<util::MalformedPayload>([] { oracle::DecodeWords(std::string(9, '\0')); }, "nine bytes");
  ExpectThrows<util::MalformedPayload>([] { oracle::DecodeWords("abc"); }, "three bytes");
}

void TestHex() {
  assert(util::ToHex(std::string("\x00\xff\x10", 3)) == "00ff10");
  assert(util::FromHex("00FF10") == std::string("\x00\xff\x10", 3));
  ExpectThrows<util::InvalidInput>([] { util::FromHex("abc"); }, "odd length");
  ExpectThrows<util::InvalidInput>([] { util::FromHex("zz"); }, "not hex");
}

void TestVaultHandlesAreOpaque() {
  cipher::CiphertextVault vault;
  const auto              a = vault.Seal(100);
  const auto              b = vault.Seal(100);

  assert(a != b);
  assert(a.size() == 64);
  assert(vault.Reveal(a).value() == 100);
  assert(vault.Reveal(b).value() == 100);
  assert(!vault.Reveal("00").has_value());
  assert(vault.Size() == 2);
}

} // namespace

int main() {
  TestPublicKeyDerivation();
  TestSignatureBindsRequestAndCleartexts();
  TestAttestationMessageLayout();
  TestMalformedKeysAreRejected();
  TestWordCodec();
  TestHex();
  TestVaultHandlesAreOpaque();

  std::cout << "settlement_unit_attestation: pass\n";
  return 0;
}
