#include "access_control_server.hpp"

#include "caller.hpp"
#include "grpc_error.hpp"

namespace tender::grpc {

using namespace tender::manager::v1;

AccessControlServer::AccessControlServer(std::shared_ptr<tender::service::AccessControlService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AccessControlServer::AddEvaluator(::grpc::ServerContext* context,
                                        const AddEvaluatorRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->AddEvaluator(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::RemoveEvaluator(::grpc::ServerContext* context,
                                        const RemoveEvaluatorRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->RemoveEvaluator(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::IsEvaluator(::grpc::ServerContext* context,
                                        const IsEvaluatorRequest* req,
                                        IsEvaluatorResponse* resp) {
  try {
    *resp = service_->IsEvaluator(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::ListEvaluators(::grpc::ServerContext* context,
                                        const ListEvaluatorsRequest* req,
                                        ListEvaluatorsResponse* resp) {
  try {
    *resp = service_->ListEvaluators(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::GetAuthority(::grpc::ServerContext* context,
                                        const GetAuthorityRequest* req,
                                        GetAuthorityResponse* resp) {
  try {
    *resp = service_->GetAuthority(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::TransferAuthority(::grpc::ServerContext* context,
                                        const TransferAuthorityRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->TransferAuthority(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AccessControlServer::RenounceAuthority(::grpc::ServerContext* context,
                                        const RenounceAuthorityRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->RenounceAuthority(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tender::grpc
