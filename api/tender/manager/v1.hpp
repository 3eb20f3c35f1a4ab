#pragma once

#include "tender/manager/core/v1/types.pb.h"

#include "tender/manager/services/v1/access_control_service.pb.h"
#include "tender/manager/services/v1/admin_service.pb.h"
#include "tender/manager/services/v1/tender_service.pb.h"

#include "tender/manager/services/v1/access_control_service.grpc.pb.h"
#include "tender/manager/services/v1/admin_service.grpc.pb.h"
#include "tender/manager/services/v1/tender_service.grpc.pb.h"

namespace tender::manager::v1 {
using namespace ::tender::manager::core::v1;
using namespace ::tender::manager::services::v1;
}
