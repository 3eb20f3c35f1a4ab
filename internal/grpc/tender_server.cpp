#include "tender_server.hpp"

#include "caller.hpp"
#include "grpc_error.hpp"

namespace tender::grpc {

using namespace tender::manager::v1;

TenderServer::TenderServer(std::shared_ptr<tender::service::TenderService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TenderServer::AddTender(::grpc::ServerContext* context,
                                 const AddTenderRequest* req,
                                 AddTenderResponse* resp) {
  try {
    *resp = service_->AddTender(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::SubmitOffer(::grpc::ServerContext* context,
                                 const SubmitOfferRequest* req,
                                 SubmitOfferResponse* resp) {
  try {
    *resp = service_->SubmitOffer(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::CloseOfferPeriod(::grpc::ServerContext* context,
                                 const CloseOfferPeriodRequest* req,
                                 CloseOfferPeriodResponse* resp) {
  try {
    *resp = service_->CloseOfferPeriod(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::EvaluateOffer(::grpc::ServerContext* context,
                                 const EvaluateOfferRequest* req,
                                 EvaluateOfferResponse* resp) {
  try {
    *resp = service_->EvaluateOffer(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::MarkAsEvaluated(::grpc::ServerContext* context,
                                 const MarkAsEvaluatedRequest* req,
                                 MarkAsEvaluatedResponse* resp) {
  try {
    *resp = service_->MarkAsEvaluated(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::CalculateWinner(::grpc::ServerContext* context,
                                 const CalculateWinnerRequest* req,
                                 CalculateWinnerResponse* resp) {
  try {
    *resp = service_->CalculateWinner(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::GetTender(::grpc::ServerContext* context,
                                 const GetTenderRequest* req,
                                 GetTenderResponse* resp) {
  try {
    *resp = service_->GetTender(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::GetTenderCount(::grpc::ServerContext* context,
                                 const GetTenderCountRequest* req,
                                 GetTenderCountResponse* resp) {
  try {
    *resp = service_->GetTenderCount(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::ListTenders(::grpc::ServerContext* context,
                                 const ListTendersRequest* req,
                                 ListTendersResponse* resp) {
  try {
    *resp = service_->ListTenders(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::GetOffer(::grpc::ServerContext* context,
                                 const GetOfferRequest* req,
                                 GetOfferResponse* resp) {
  try {
    *resp = service_->GetOffer(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::GetOffers(::grpc::ServerContext* context,
                                 const GetOffersRequest* req,
                                 GetOffersResponse* resp) {
  try {
    *resp = service_->GetOffers(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TenderServer::GetParticipants(::grpc::ServerContext* context,
                                 const GetParticipantsRequest* req,
                                 GetParticipantsResponse* resp) {
  try {
    *resp = service_->GetParticipants(CallerFromContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tender::grpc
