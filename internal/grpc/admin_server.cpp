#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace tender::grpc {

AdminServer::AdminServer(std::shared_ptr<tender::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const tender::manager::v1::StatsRequest* req, tender::manager::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tender::grpc
