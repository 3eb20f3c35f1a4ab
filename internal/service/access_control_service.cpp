#include "access_control_service.hpp"

#include "internal/access/access_control.hpp"
#include "observe_rpc.hpp"

namespace tender::service {

using namespace tender::manager::v1;

AccessControlService::AccessControlService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void AccessControlService::AddEvaluator(const std::string& caller, const AddEvaluatorRequest& req) {
  ObserveRpc("AccessControlService.AddEvaluator", caller, 0, [&] { ctx_.access->AddEvaluator(caller, req.identity()); });
}

void AccessControlService::RemoveEvaluator(const std::string& caller, const RemoveEvaluatorRequest& req) {
  ObserveRpc("AccessControlService.RemoveEvaluator", caller, 0, [&] { ctx_.access->RemoveEvaluator(caller, req.identity()); });
}

IsEvaluatorResponse AccessControlService::IsEvaluator(const std::string& caller, const IsEvaluatorRequest& req) {
  return ObserveRpc("AccessControlService.IsEvaluator", caller, 0, [&] {
    IsEvaluatorResponse resp;
    resp.set_is_evaluator(ctx_.access->IsEvaluator(req.identity()));
    return resp;
  });
}

ListEvaluatorsResponse AccessControlService::ListEvaluators(const std::string& caller, const ListEvaluatorsRequest&) {
  return ObserveRpc("AccessControlService.ListEvaluators", caller, 0, [&] {
    ListEvaluatorsResponse resp;
    for (const auto& identity : ctx_.access->ListEvaluators()) {
      resp.add_identities(identity);
    }
    return resp;
  });
}

GetAuthorityResponse AccessControlService::GetAuthority(const std::string& caller, const GetAuthorityRequest&) {
  return ObserveRpc("AccessControlService.GetAuthority", caller, 0, [&] {
    GetAuthorityResponse resp;
    resp.set_authority(ctx_.access->Authority());
    return resp;
  });
}

void AccessControlService::TransferAuthority(const std::string& caller, const TransferAuthorityRequest& req) {
  ObserveRpc("AccessControlService.TransferAuthority", caller, 0, [&] { ctx_.access->TransferAuthority(caller, req.new_authority()); });
}

void AccessControlService::RenounceAuthority(const std::string& caller, const RenounceAuthorityRequest&) {
  ObserveRpc("AccessControlService.RenounceAuthority", caller, 0, [&] { ctx_.access->RenounceAuthority(caller); });
}

} // namespace tender::service
