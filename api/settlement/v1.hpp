#pragma once

#include "settlement/v1/types.pb.h"

#include "settlement/v1/admin_service.pb.h"
#include "settlement/v1/auction_service.pb.h"
#include "settlement/v1/oracle_callback_service.pb.h"
#include "settlement/v1/refund_service.pb.h"
#include "settlement/v1/registry_service.pb.h"
#include "settlement/v1/royalty_service.pb.h"

#include "settlement/v1/admin_service.grpc.pb.h"
#include "settlement/v1/auction_service.grpc.pb.h"
#include "settlement/v1/oracle_callback_service.grpc.pb.h"
#include "settlement/v1/refund_service.grpc.pb.h"
#include "settlement/v1/registry_service.grpc.pb.h"
#include "settlement/v1/royalty_service.grpc.pb.h"
