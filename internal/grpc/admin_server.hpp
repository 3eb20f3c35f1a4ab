#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tender/manager/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace tender::grpc {

class AdminServer final : public tender::manager::services::v1::TenderAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<tender::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const tender::manager::v1::StatsRequest*,
                     tender::manager::v1::StatsResponse*) override;

private:
  std::shared_ptr<tender::service::AdminService> service_;
};

}
