#pragma once

#include "service_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  tender::manager::v1::StatsResponse
  Stats(const tender::manager::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

}
