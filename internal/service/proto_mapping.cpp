#include "internal/service/proto_mapping.hpp"

#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace settlement::service {

namespace {

void SetTime(std::uint64_t ms, google::protobuf::Timestamp* out) {
  if (ms == 0) return;
  *out = util::ToProto(util::FromUnixMillis(ms));
}

v1::SessionPhase ToProto(model::SessionPhase phase) {
  return static_cast<v1::SessionPhase>(static_cast<int>(phase));
}

v1::CallbackSelector ToProto(model::CallbackSelector selector) {
  return static_cast<v1::CallbackSelector>(static_cast<int>(selector));
}

} // namespace

v1::RequestStatus ToProto(model::RequestStatus status) {
  return static_cast<v1::RequestStatus>(static_cast<int>(status));
}

v1::PatentStatus ToProto(model::PatentStatus status) {
  return static_cast<v1::PatentStatus>(static_cast<int>(status));
}

std::optional<model::RequestStatus> FromProto(v1::RequestStatus status) {
  switch (status) {
    case v1::REQUEST_STATUS_PENDING:
      return model::RequestStatus::kPending;
    case v1::REQUEST_STATUS_COMPLETED:
      return model::RequestStatus::kCompleted;
    case v1::REQUEST_STATUS_FAILED:
      return model::RequestStatus::kFailed;
    case v1::REQUEST_STATUS_TIMED_OUT:
      return model::RequestStatus::kTimedOut;
    default:
      return std::nullopt;
  }
}

model::PatentStatus PatentStatusFromProto(int status) {
  if (!v1::PatentStatus_IsValid(status)) throw util::InvalidInput("invalid patent status " + std::to_string(status));
  return static_cast<model::PatentStatus>(status);
}

model::LicenseStatus LicenseStatusFromProto(int status) {
  if (!v1::LicenseStatus_IsValid(status)) throw util::InvalidInput("invalid license status " + std::to_string(status));
  return static_cast<model::LicenseStatus>(status);
}

v1::DecryptionRequest ToProto(const db::model::RequestRecord& record) {
  v1::DecryptionRequest out;
  out.set_id(record.id);
  out.set_issuer(record.issuer);
  SetTime(record.created_at_ms, out.mutable_created_at());
  SetTime(record.resolved_at_ms, out.mutable_resolved_at());
  out.set_status(ToProto(record.status));
  std::visit(model::Overloaded{[&](const model::BiddingCorrelation& b) { out.mutable_bidding()->set_asset_id(b.asset_id); },
                               [&](const model::VerificationCorrelation& v) {
                                 out.mutable_verification()->set_license_id(v.license_id);
                                 out.mutable_verification()->set_payment_index(v.payment_index);
                               }},
             record.correlation);
  out.set_selector(ToProto(record.selector));
  for (const auto& handle : record.handles) {
    out.add_handles(handle);
  }
  out.set_failure_reason(record.failure_reason);
  return out;
}

v1::BiddingSession ToProto(const db::model::SessionRecord& record) {
  v1::BiddingSession out;
  out.set_asset_id(record.asset_id);
  out.set_controller(record.controller);
  out.set_phase(ToProto(record.phase));
  SetTime(record.started_at_ms, out.mutable_started_at());
  SetTime(record.end_time_ms, out.mutable_end_time());
  for (const auto& bid : record.bids) {
    auto* b = out.add_bids();
    b->set_bidder(bid.bidder);
    b->set_escrow(bid.escrow);
    b->set_handle(bid.handle);
    SetTime(bid.submitted_at_ms, b->mutable_submitted_at());
  }
  out.set_request_id(record.request_id);
  out.set_winner(record.winner);
  return out;
}

v1::RoyaltyPayment ToProto(const db::model::PaymentRecord& record) {
  v1::RoyaltyPayment out;
  out.set_license_id(record.license_id);
  out.set_index(record.index);
  out.set_payer(record.payer);
  out.set_revenue_handle(record.revenue_handle);
  out.set_paid_amount(record.paid_amount);
  out.set_paid_handle(record.paid_handle);
  out.set_reporting_period(static_cast<std::uint32_t>(record.reporting_period));
  SetTime(record.paid_at_ms, out.mutable_paid_at());
  out.set_outcome(static_cast<v1::VerificationOutcome>(static_cast<int>(record.outcome)));
  out.set_request_id(record.request_id);
  if (record.expected_amount) out.set_expected_amount(*record.expected_amount);
  return out;
}

v1::Patent ToProto(const db::model::PatentRecord& record) {
  v1::Patent out;
  out.set_id(record.id);
  out.set_owner(record.owner);
  out.set_royalty_rate_handle(record.royalty_rate_handle);
  out.set_min_license_fee(record.min_license_fee);
  out.set_exclusivity_days(record.exclusivity_days);
  out.set_validity_years(record.validity_years);
  out.set_patent_hash(record.patent_hash);
  out.set_territory_code(record.territory_code);
  out.set_confidential(record.confidential);
  out.set_status(ToProto(record.status));
  SetTime(record.registered_at_ms, out.mutable_registered_at());
  SetTime(record.expires_at_ms, out.mutable_expires_at());
  out.set_exclusive_licensee(record.exclusive_licensee);
  return out;
}

v1::License ToProto(const db::model::LicenseRecord& record) {
  v1::License out;
  out.set_id(record.id);
  out.set_patent_id(record.patent_id);
  out.set_licensee(record.licensee);
  out.set_licensor(record.licensor);
  out.set_proposed_fee(record.proposed_fee);
  out.set_royalty_rate_handle(record.royalty_rate_handle);
  out.set_revenue_cap(record.revenue_cap);
  out.set_duration_days(record.duration_days);
  out.set_exclusive(record.exclusive);
  out.set_auto_renewal(record.auto_renewal);
  out.set_territory_mask(record.territory_mask);
  out.set_status(static_cast<v1::LicenseStatus>(static_cast<int>(record.status)));
  SetTime(record.requested_at_ms, out.mutable_requested_at());
  SetTime(record.starts_at_ms, out.mutable_starts_at());
  SetTime(record.ends_at_ms, out.mutable_ends_at());
  return out;
}

v1::Event ToProto(const db::model::EventRecord& record) {
  v1::Event out;
  out.set_sequence(record.sequence);
  out.set_kind(std::string(model::ToString(record.kind)));
  SetTime(record.occurred_at_ms, out.mutable_occurred_at());
  for (const auto& attr : record.attributes) {
    auto* a = out.add_attributes();
    a->set_key(attr.key);
    a->set_value(attr.value);
  }
  return out;
}

} // namespace settlement::service
