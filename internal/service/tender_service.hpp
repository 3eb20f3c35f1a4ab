#pragma once

#include <string>

#include "service_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::service {

class TenderService {
public:
  explicit TenderService(ServiceContext ctx);

  tender::manager::v1::AddTenderResponse AddTender(const std::string& caller, const tender::manager::v1::AddTenderRequest& req);
  tender::manager::v1::SubmitOfferResponse SubmitOffer(const std::string& caller, const tender::manager::v1::SubmitOfferRequest& req);
  tender::manager::v1::CloseOfferPeriodResponse CloseOfferPeriod(const std::string& caller,
                                                                 const tender::manager::v1::CloseOfferPeriodRequest& req);
  tender::manager::v1::EvaluateOfferResponse EvaluateOffer(const std::string& caller, const tender::manager::v1::EvaluateOfferRequest& req);
  tender::manager::v1::MarkAsEvaluatedResponse MarkAsEvaluated(const std::string& caller,
                                                               const tender::manager::v1::MarkAsEvaluatedRequest& req);
  tender::manager::v1::CalculateWinnerResponse CalculateWinner(const std::string& caller,
                                                               const tender::manager::v1::CalculateWinnerRequest& req);

  tender::manager::v1::GetTenderResponse GetTender(const std::string& caller, const tender::manager::v1::GetTenderRequest& req);
  tender::manager::v1::GetTenderCountResponse GetTenderCount(const std::string& caller, const tender::manager::v1::GetTenderCountRequest& req);
  tender::manager::v1::ListTendersResponse ListTenders(const std::string& caller, const tender::manager::v1::ListTendersRequest& req);
  tender::manager::v1::GetOfferResponse GetOffer(const std::string& caller, const tender::manager::v1::GetOfferRequest& req);
  tender::manager::v1::GetOffersResponse GetOffers(const std::string& caller, const tender::manager::v1::GetOffersRequest& req);
  tender::manager::v1::GetParticipantsResponse GetParticipants(const std::string& caller,
                                                               const tender::manager::v1::GetParticipantsRequest& req);

private:
  ServiceContext ctx_;
};

}
