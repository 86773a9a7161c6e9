#pragma once

#include "service_context.hpp"
#include "settlement/v1/oracle_callback_service.pb.h"

namespace settlement::service {

class OracleCallbackService {
 public:
  explicit OracleCallbackService(ServiceContext ctx);

  v1::CompleteResponse CompleteBidding(const v1::CompleteRequest& req);
  v1::CompleteResponse CompleteVerification(const v1::CompleteRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace settlement::service
