#pragma once

#include "service_context.hpp"
#include "settlement/v1/royalty_service.pb.h"

namespace settlement::service {

class RoyaltyService {
 public:
  explicit RoyaltyService(ServiceContext ctx);

  v1::SubmitRoyaltyPaymentResponse SubmitRoyaltyPayment(const v1::SubmitRoyaltyPaymentRequest& req);
  v1::RequestVerificationResponse  RequestVerification(const v1::RequestVerificationRequest& req);
  v1::GetPaymentResponse           GetPayment(const v1::GetPaymentRequest& req);
  v1::ListPaymentsResponse         ListPayments(const v1::ListPaymentsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
