#pragma once

#include <optional>

#include "internal/db/model/agreement_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "settlement/v1/types.pb.h"

namespace settlement::service {

/*
  Record <-> wire conversion. Timestamps stored as 0 (unset) are left
  unset on the wire.
*/

v1::DecryptionRequest ToProto(const db::model::RequestRecord& record);
v1::BiddingSession    ToProto(const db::model::SessionRecord& record);
v1::RoyaltyPayment    ToProto(const db::model::PaymentRecord& record);
v1::Patent            ToProto(const db::model::PatentRecord& record);
v1::License           ToProto(const db::model::LicenseRecord& record);
v1::Event             ToProto(const db::model::EventRecord& record);

v1::RequestStatus ToProto(model::RequestStatus status);
v1::PatentStatus  ToProto(model::PatentStatus status);

// UNSPECIFIED means "no filter".
std::optional<model::RequestStatus> FromProto(v1::RequestStatus status);

// InvalidInput on values outside the enum.
model::PatentStatus  PatentStatusFromProto(int status);
model::LicenseStatus LicenseStatusFromProto(int status);

} // namespace settlement::service
