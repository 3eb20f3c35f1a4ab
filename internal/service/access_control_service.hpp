#pragma once

#include <string>

#include <google/protobuf/empty.pb.h>

#include "service_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::service {

class AccessControlService {
public:
  explicit AccessControlService(ServiceContext ctx);

  void AddEvaluator(const std::string& caller, const tender::manager::v1::AddEvaluatorRequest& req);
  void RemoveEvaluator(const std::string& caller, const tender::manager::v1::RemoveEvaluatorRequest& req);
  tender::manager::v1::IsEvaluatorResponse IsEvaluator(const std::string& caller, const tender::manager::v1::IsEvaluatorRequest& req);
  tender::manager::v1::ListEvaluatorsResponse ListEvaluators(const std::string& caller, const tender::manager::v1::ListEvaluatorsRequest& req);

  tender::manager::v1::GetAuthorityResponse GetAuthority(const std::string& caller, const tender::manager::v1::GetAuthorityRequest& req);
  void TransferAuthority(const std::string& caller, const tender::manager::v1::TransferAuthorityRequest& req);
  void RenounceAuthority(const std::string& caller, const tender::manager::v1::RenounceAuthorityRequest& req);

private:
  ServiceContext ctx_;
};

}
