#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tender/manager/services/v1/tender_service.grpc.pb.h"
#include "internal/service/tender_service.hpp"

namespace tender::grpc {

class TenderServer final : public tender::manager::services::v1::TenderService::Service {
public:
  explicit TenderServer(std::shared_ptr<tender::service::TenderService> svc);

  ::grpc::Status AddTender(::grpc::ServerContext*,
                   const tender::manager::v1::AddTenderRequest*,
                   tender::manager::v1::AddTenderResponse*) override;
  ::grpc::Status SubmitOffer(::grpc::ServerContext*,
                   const tender::manager::v1::SubmitOfferRequest*,
                   tender::manager::v1::SubmitOfferResponse*) override;
  ::grpc::Status CloseOfferPeriod(::grpc::ServerContext*,
                   const tender::manager::v1::CloseOfferPeriodRequest*,
                   tender::manager::v1::CloseOfferPeriodResponse*) override;
  ::grpc::Status EvaluateOffer(::grpc::ServerContext*,
                   const tender::manager::v1::EvaluateOfferRequest*,
                   tender::manager::v1::EvaluateOfferResponse*) override;
  ::grpc::Status MarkAsEvaluated(::grpc::ServerContext*,
                   const tender::manager::v1::MarkAsEvaluatedRequest*,
                   tender::manager::v1::MarkAsEvaluatedResponse*) override;
  ::grpc::Status CalculateWinner(::grpc::ServerContext*,
                   const tender::manager::v1::CalculateWinnerRequest*,
                   tender::manager::v1::CalculateWinnerResponse*) override;
  ::grpc::Status GetTender(::grpc::ServerContext*,
                   const tender::manager::v1::GetTenderRequest*,
                   tender::manager::v1::GetTenderResponse*) override;
  ::grpc::Status GetTenderCount(::grpc::ServerContext*,
                   const tender::manager::v1::GetTenderCountRequest*,
                   tender::manager::v1::GetTenderCountResponse*) override;
  ::grpc::Status ListTenders(::grpc::ServerContext*,
                   const tender::manager::v1::ListTendersRequest*,
                   tender::manager::v1::ListTendersResponse*) override;
  ::grpc::Status GetOffer(::grpc::ServerContext*,
                   const tender::manager::v1::GetOfferRequest*,
                   tender::manager::v1::GetOfferResponse*) override;
  ::grpc::Status GetOffers(::grpc::ServerContext*,
                   const tender::manager::v1::GetOffersRequest*,
                   tender::manager::v1::GetOffersResponse*) override;
  ::grpc::Status GetParticipants(::grpc::ServerContext*,
                   const tender::manager::v1::GetParticipantsRequest*,
                   tender::manager::v1::GetParticipantsResponse*) override;

private:
  std::shared_ptr<tender::service::TenderService> service_;
};

}
