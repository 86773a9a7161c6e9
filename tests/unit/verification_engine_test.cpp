#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/core/verification_engine.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace settlement;
using settlement::testing::EngineFixture;
using settlement::testing::ExpectThrows;

constexpr std::uint32_t kRate = 500; // 5%

struct Royalties {
  EngineFixture    f;
  model::AssetId   patent  = 0;
  model::LicenseId license = 0;

  Royalties() {
    patent  = f.RegisterPatent("licensor");
    license = f.ActiveLicense(patent, "licensee", kRate);
    f.Fund("licensee", 5000);
  }

  std::uint64_t Pay(std::uint64_t revenue, model::Amount amount, std::uint64_t period = 1) {
    return f.engine->SubmitRoyaltyPayment("licensee", license, f.vault->Seal(revenue), amount, period);
  }

  model::VerificationOutcome Verify(std::uint64_t index) {
    const auto id = f.engine->RequestVerification("licensor", license, index);
    assert(f.Deliver(id) == 1);
    return f.engine->GetPayment(license, index).outcome;
  }
};

void TestMulDivFloorDoesNotOverflow() {
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  assert(core::MulDivFloor(kMax, 10000, 10000) == kMax);
  assert(core::MulDivFloor(kMax, 9999, 10000) == 18444899399302180659ull);
  assert(core::MulDivFloor(kMax, 95, 100) == 17524406870024074034ull);
  assert(core::MulDivFloor(10'000'000'000'000'000'000ull, 500, 10000) == 500'000'000'000'000'000ull);
  assert(core::MulDivFloor(199, 1, 100) == 1);
  assert(core::MulDivFloor(0, 5, 7) == 0);
}

void TestPaymentMovesFundsToLicensor() {
  Royalties r;
  assert(r.Pay(10000, 475, 3) == 0);
  assert(r.Pay(20000, 950, 4) == 1);

  assert(r.f.engine->GetAccount("licensor").balance == 1425);
  assert(r.f.engine->GetAccount("licensee").balance == 5000 - 1425);
  assert(r.f.engine->RoyaltyPaymentCount(r.license) == 2);

  const auto payment = r.f.engine->GetPayment(r.license, 0);
  assert(payment.payer == "licensee");
  assert(payment.paid_amount == 475);
  assert(payment.reporting_period == 3);
  assert(payment.outcome == model::VerificationOutcome::kUnverified);
  assert(!payment.paid_handle.empty());
  assert(!payment.expected_amount.has_value());
  assert(r.f.engine->ListPayments(r.license).size() == 2);
  r.f.ExpectBalanced();
}

void TestToleranceBoundary() {
  Royalties r;
  // expected 500, threshold 475
  r.Pay(10000, 475);
  r.Pay(10000, 474);
  r.Pay(10000, 900);

  assert(r.Verify(0) == model::VerificationOutcome::kValid);
  assert(r.Verify(1) == model::VerificationOutcome::kInvalid);
  assert(r.Verify(2) == model::VerificationOutcome::kValid);
  assert(r.f.engine->GetPayment(r.license, 1).expected_amount.value() == 500);
  assert(r.f.engine->GetPayment(r.license, 1).request_id == 0);
}

void TestZeroRevenueIsAlwaysValid() {
  Royalties r;
  r.Pay(0, 1);
  assert(r.Verify(0) == model::VerificationOutcome::kValid);
  assert(r.f.engine->GetPayment(r.license, 0).expected_amount.value() == 0);
}

void TestSubmitValidation() {
  Royalties r;
  ExpectThrows<util::NotFound>([&] { r.f.engine->SubmitRoyaltyPayment("licensee", 42, "h", 1, 1); }, "unknown license");
  ExpectThrows<util::Authorization>([&] { r.f.engine->SubmitRoyaltyPayment("mallory", r.license, "h", 1, 1); }, "not the licensee");
  ExpectThrows<util::InvalidInput>([&] { r.Pay(100, 0); }, "zero amount");
  ExpectThrows<util::InvalidInput>([&] { r.f.engine->SubmitRoyaltyPayment("licensee", r.license, "", 5, 1); }, "missing revenue");
  ExpectThrows<util::InvalidInput>([&] { r.Pay(100, 6000); }, "more than the licensee holds");

  registry::LicenseTerms terms;
  terms.patent_id     = r.patent;
  terms.proposed_rate = kRate;
  terms.duration_days = 30;
  const auto pending  = r.f.engine->RequestLicense("licensee", terms);
  ExpectThrows<util::InvalidState>([&] { r.f.engine->SubmitRoyaltyPayment("licensee", pending, "h", 1, 1); }, "license not active");

  r.f.engine->SetAcceptsPayouts("licensor", false);
  ExpectThrows<util::TransferFailure>([&] { r.Pay(100, 5); }, "licensor rejects the royalty");

  assert(r.f.engine->GetAccount("licensee").balance == 5000);
  assert(r.f.engine->RoyaltyPaymentCount(r.license) == 0);
  r.f.ExpectBalanced();
}

void TestRequestVerificationValidation() {
  Royalties r;
  r.Pay(10000, 500);

  ExpectThrows<util::Authorization>([&] { r.f.engine->RequestVerification("licensee", r.license, 0); }, "only the licensor");
  ExpectThrows<util::InvalidInput>([&] { r.f.engine->RequestVerification("licensor", r.license, 1); }, "no such payment");

  const auto id = r.f.engine->RequestVerification("licensor", r.license, 0);
  assert(r.f.engine->GetPayment(r.license, 0).request_id == id);
  ExpectThrows<util::InvalidState>([&] { r.f.engine->RequestVerification("licensor", r.license, 0); }, "already in progress");

  r.f.Deliver(id);
  ExpectThrows<util::InvalidState>([&] { r.f.engine->RequestVerification("licensor", r.license, 0); }, "already verified");
}

void TestRateAboveDenominatorFailsRequest() {
  Royalties r;
  r.Pay(10000, 500);
  const auto id = r.f.engine->RequestVerification("licensor", r.license, 0);

  const auto signed_words = r.f.Sign(id, {10000, 10001, 500});
  const auto result       = r.f.engine->CompleteVerification(id, signed_words.cleartexts, signed_words.proof);
  assert(result.status == model::RequestStatus::kFailed);
  assert(r.f.engine->GetPayment(r.license, 0).outcome == model::VerificationOutcome::kInvalid);
}

void TestVerificationTimeoutMarksPaymentInvalid() {
  Royalties r;
  r.Pay(10000, 500);
  const auto id = r.f.engine->RequestVerification("licensor", r.license, 0);

  r.f.clock->Advance(r.f.engine->RequestTimeout());
  const auto request = r.f.engine->ClaimTimeout(id);
  assert(request.status == model::RequestStatus::kTimedOut);

  const auto payment = r.f.engine->GetPayment(r.license, 0);
  assert(payment.outcome == model::VerificationOutcome::kInvalid);
  assert(payment.request_id == 0);
  // nothing was escrowed for verification, so nothing is refunded
  assert(r.f.engine->Stats().refundable == 0);
  r.f.ExpectBalanced();
}

void TestInvalidOptionsAreRejected() {
  core::EngineOptions options = EngineFixture::DefaultOptions();
  options.verification.tolerance_numerator   = 101;
  options.verification.tolerance_denominator = 100;
  ExpectThrows<util::InvalidInput>([&] { EngineFixture f(options); }, "tolerance above one");

  options                                = EngineFixture::DefaultOptions();
  options.verification.rate_denominator = 0;
  ExpectThrows<util::InvalidInput>([&] { EngineFixture f(options); }, "zero denominator");
}

} // namespace

int main() {
  TestMulDivFloorDoesNotOverflow();
  TestPaymentMovesFundsToLicensor();
  TestToleranceBoundary();
  TestZeroRevenueIsAlwaysValid();
  TestSubmitValidation();
  TestRequestVerificationValidation();
  TestRateAboveDenominatorFailsRequest();
  TestVerificationTimeoutMarksPaymentInvalid();
  TestInvalidOptionsAreRejected();

  std::cout << "settlement_unit_verification_engine: pass\n";
  return 0;
}
