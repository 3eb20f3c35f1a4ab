#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/access/access_control.hpp"
#include "internal/core/core_context.hpp"
#include "internal/core/evaluation_engine.hpp"
#include "internal/core/offer_registry.hpp"
#include "internal/core/tender_locks.hpp"
#include "internal/core/tender_registry.hpp"
#include "internal/core/winner_selector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/access_control_server.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/tender_server.hpp"
#include "internal/service/access_control_service.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tender_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tender/manager/v1.hpp"

namespace {

tender::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<tender::db::memory::MemoryRepository>();
  auto clock      = std::make_shared<tender::util::SystemTimeSource>();
  auto access     = std::make_shared<tender::access::AccessControl>(repository, clock);
  const bool bootstrapped = access->Bootstrap("authority", {"evaluator"});
  assert(bootstrapped);
  (void)bootstrapped;

  tender::core::CoreContext core_ctx{repository, access, std::make_shared<tender::core::TenderLocks>(), clock};

  tender::service::ServiceContext ctx;
  ctx.tenders     = std::make_shared<tender::core::TenderRegistry>(core_ctx);
  ctx.offers      = std::make_shared<tender::core::OfferRegistry>(core_ctx);
  ctx.evaluations = std::make_shared<tender::core::EvaluationEngine>(core_ctx);
  ctx.winners     = std::make_shared<tender::core::WinnerSelector>(core_ctx);
  ctx.access      = access;
  ctx.repository  = repository;
  return ctx;
}

void TestExceptionMapping() {
  using tender::grpc::ToStatus;

  assert(ToStatus(tender::util::Unauthorized("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(tender::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(tender::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(tender::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(tender::util::InvalidInput("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(tender::util::DeadlineViolation("x")).error_code() == ::grpc::StatusCode::OUT_OF_RANGE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(tender::util::NotFound("tender 7 not found"));
  assert(status.error_message() == "tender 7 not found");

  assert(std::string(tender::util::ErrorKind(tender::util::DeadlineViolation("x"))) == "deadline_violation");
  assert(std::string(tender::util::ErrorKind(tender::util::AlreadyExists("x"))) == "already_exists");
  assert(std::string(tender::util::ErrorKind(std::runtime_error("x"))) == "internal");
}

void TestMissingCallerIsPermissionDenied() {
  auto ctx = BuildServiceContext();
  tender::grpc::TenderServer server(std::make_shared<tender::service::TenderService>(ctx));

  tender::manager::v1::AddTenderRequest req;
  req.set_description("road works");
  req.set_max_price(1000);
  req.set_deadline_days(1);
  req.set_weight_price(50);
  req.set_weight_quality(50);

  tender::manager::v1::AddTenderResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.AddTender(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestUnknownTenderIsNotFound() {
  auto ctx = BuildServiceContext();
  tender::grpc::TenderServer server(std::make_shared<tender::service::TenderService>(ctx));

  tender::manager::v1::GetTenderRequest req;
  req.set_tender_id(99);
  tender::manager::v1::GetTenderResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.GetTender(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestReadsNeedNoCaller() {
  auto ctx = BuildServiceContext();
  ctx.tenders->CreateTender("authority", "street lights", 500, 3, 70, 30);

  tender::grpc::TenderServer server(std::make_shared<tender::service::TenderService>(ctx));

  {
    tender::manager::v1::GetOffersRequest req;
    req.set_tender_id(1);
    tender::manager::v1::GetOffersResponse resp;
    ::grpc::ServerContext                  grpc_ctx;

    const auto status = server.GetOffers(&grpc_ctx, &req, &resp);
    assert(status.ok());
    assert(resp.providers_size() == 0);
  }

  {
    tender::manager::v1::ListTendersRequest req;
    tender::manager::v1::ListTendersResponse resp;
    ::grpc::ServerContext                    grpc_ctx;

    const auto status = server.ListTenders(&grpc_ctx, &req, &resp);
    assert(status.ok());
    assert(resp.total() == 1);
    assert(resp.tenders_size() == 1);
    assert(resp.tenders(0).description() == "street lights");
  }
}

void TestAccessControlServer() {
  auto ctx = BuildServiceContext();
  tender::grpc::AccessControlServer server(std::make_shared<tender::service::AccessControlService>(ctx));

  {
    tender::manager::v1::AddEvaluatorRequest req;
    req.set_identity("evaluator-2");
    google::protobuf::Empty resp;
    ::grpc::ServerContext   grpc_ctx;

    const auto status = server.AddEvaluator(&grpc_ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }

  {
    tender::manager::v1::IsEvaluatorRequest req;
    req.set_identity("evaluator");
    tender::manager::v1::IsEvaluatorResponse resp;
    ::grpc::ServerContext                    grpc_ctx;

    const auto status = server.IsEvaluator(&grpc_ctx, &req, &resp);
    assert(status.ok());
    assert(resp.is_evaluator());
  }

  {
    tender::manager::v1::GetAuthorityRequest  req;
    tender::manager::v1::GetAuthorityResponse resp;
    ::grpc::ServerContext                     grpc_ctx;

    const auto status = server.GetAuthority(&grpc_ctx, &req, &resp);
    assert(status.ok());
    assert(resp.authority() == "authority");
  }
}

void TestAdminStats() {
  auto ctx = BuildServiceContext();
  ctx.tenders->CreateTender("authority", "a", 500, 3, 70, 30);
  ctx.tenders->CreateTender("authority", "b", 500, 3, 70, 30);
  ctx.offers->SubmitOffer("provider", 2, 400, "doc");

  tender::grpc::AdminServer server(std::make_shared<tender::service::AdminService>(ctx));

  tender::manager::v1::StatsRequest  req;
  tender::manager::v1::StatsResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.Stats(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.tenders_total() == 2);
  assert(resp.tenders_open() == 2);
  assert(resp.tenders_finalized() == 0);
  assert(resp.offers_total() == 1);
  assert(resp.evaluators() == 1);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingCallerIsPermissionDenied();
  TestUnknownTenderIsNotFound();
  TestReadsNeedNoCaller();
  TestAccessControlServer();
  TestAdminStats();

  std::cout << "tender_manager_unit_grpc_status: pass\n";
  return 0;
}
