#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tender/manager/services/v1/access_control_service.grpc.pb.h"
#include "internal/service/access_control_service.hpp"

namespace tender::grpc {

class AccessControlServer final : public tender::manager::services::v1::AccessControlService::Service {
public:
  explicit AccessControlServer(std::shared_ptr<tender::service::AccessControlService> svc);

  ::grpc::Status AddEvaluator(::grpc::ServerContext*,
                   const tender::manager::v1::AddEvaluatorRequest*,
                   google::protobuf::Empty*) override;
  ::grpc::Status RemoveEvaluator(::grpc::ServerContext*,
                   const tender::manager::v1::RemoveEvaluatorRequest*,
                   google::protobuf::Empty*) override;
  ::grpc::Status IsEvaluator(::grpc::ServerContext*,
                   const tender::manager::v1::IsEvaluatorRequest*,
                   tender::manager::v1::IsEvaluatorResponse*) override;
  ::grpc::Status ListEvaluators(::grpc::ServerContext*,
                   const tender::manager::v1::ListEvaluatorsRequest*,
                   tender::manager::v1::ListEvaluatorsResponse*) override;
  ::grpc::Status GetAuthority(::grpc::ServerContext*,
                   const tender::manager::v1::GetAuthorityRequest*,
                   tender::manager::v1::GetAuthorityResponse*) override;
  ::grpc::Status TransferAuthority(::grpc::ServerContext*,
                   const tender::manager::v1::TransferAuthorityRequest*,
                   google::protobuf::Empty*) override;
  ::grpc::Status RenounceAuthority(::grpc::ServerContext*,
                   const tender::manager::v1::RenounceAuthorityRequest*,
                   google::protobuf::Empty*) override;

private:
  std::shared_ptr<tender::service::AccessControlService> service_;
};

}
