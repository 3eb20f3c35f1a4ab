#include "tender_service.hpp"

#include "internal/core/evaluation_engine.hpp"
#include "internal/core/offer_registry.hpp"
#include "internal/core/tender_registry.hpp"
#include "internal/core/winner_selector.hpp"
#include "observe_rpc.hpp"

namespace tender::service {

using namespace tender::manager::v1;

namespace {

// Page size when ListTenders is called without a limit.
constexpr uint32_t kDefaultListLimit = 100;

} // namespace

TenderService::TenderService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AddTenderResponse TenderService::AddTender(const std::string& caller, const AddTenderRequest& req) {
  return ObserveRpc("TenderService.AddTender", caller, 0, [&] {
    AddTenderResponse resp;
    *resp.mutable_tender() =
        ctx_.tenders->CreateTender(caller, req.description(), req.max_price(), req.deadline_days(), req.weight_price(), req.weight_quality());
    return resp;
  });
}

SubmitOfferResponse TenderService::SubmitOffer(const std::string& caller, const SubmitOfferRequest& req) {
  return ObserveRpc("TenderService.SubmitOffer", caller, req.tender_id(), [&] {
    SubmitOfferResponse resp;
    *resp.mutable_offer() = ctx_.offers->SubmitOffer(caller, req.tender_id(), req.price(), req.documentation_reference());
    return resp;
  });
}

CloseOfferPeriodResponse TenderService::CloseOfferPeriod(const std::string& caller, const CloseOfferPeriodRequest& req) {
  return ObserveRpc("TenderService.CloseOfferPeriod", caller, req.tender_id(), [&] {
    CloseOfferPeriodResponse resp;
    *resp.mutable_tender() = ctx_.tenders->CloseOfferPeriod(caller, req.tender_id());
    return resp;
  });
}

EvaluateOfferResponse TenderService::EvaluateOffer(const std::string& caller, const EvaluateOfferRequest& req) {
  return ObserveRpc("TenderService.EvaluateOffer", caller, req.tender_id(), [&] {
    EvaluateOfferResponse resp;
    *resp.mutable_offer() = ctx_.evaluations->EvaluateOffer(caller, req.tender_id(), req.provider(), req.quality_score());
    return resp;
  });
}

MarkAsEvaluatedResponse TenderService::MarkAsEvaluated(const std::string& caller, const MarkAsEvaluatedRequest& req) {
  return ObserveRpc("TenderService.MarkAsEvaluated", caller, req.tender_id(), [&] {
    MarkAsEvaluatedResponse resp;
    *resp.mutable_tender() = ctx_.tenders->MarkAsEvaluated(caller, req.tender_id());
    return resp;
  });
}

CalculateWinnerResponse TenderService::CalculateWinner(const std::string& caller, const CalculateWinnerRequest& req) {
  return ObserveRpc("TenderService.CalculateWinner", caller, req.tender_id(), [&] { return ctx_.winners->CalculateWinner(caller, req.tender_id()); });
}

GetTenderResponse TenderService::GetTender(const std::string& caller, const GetTenderRequest& req) {
  return ObserveRpc("TenderService.GetTender", caller, req.tender_id(), [&] {
    GetTenderResponse resp;
    *resp.mutable_tender() = ctx_.tenders->GetTender(req.tender_id());
    return resp;
  });
}

GetTenderCountResponse TenderService::GetTenderCount(const std::string& caller, const GetTenderCountRequest&) {
  return ObserveRpc("TenderService.GetTenderCount", caller, 0, [&] {
    GetTenderCountResponse resp;
    resp.set_count(ctx_.tenders->TenderCount());
    return resp;
  });
}

ListTendersResponse TenderService::ListTenders(const std::string& caller, const ListTendersRequest& req) {
  return ObserveRpc("TenderService.ListTenders", caller, 0, [&] {
    const uint32_t limit = req.limit() == 0 ? kDefaultListLimit : req.limit();
    return ctx_.tenders->ListTenders(req.offset(), limit);
  });
}

GetOfferResponse TenderService::GetOffer(const std::string& caller, const GetOfferRequest& req) {
  return ObserveRpc("TenderService.GetOffer", caller, req.tender_id(), [&] {
    GetOfferResponse resp;
    *resp.mutable_offer() = ctx_.offers->GetOffer(req.tender_id(), req.provider());
    return resp;
  });
}

GetOffersResponse TenderService::GetOffers(const std::string& caller, const GetOffersRequest& req) {
  return ObserveRpc("TenderService.GetOffers", caller, req.tender_id(), [&] { return ctx_.offers->GetOffers(req.tender_id()); });
}

GetParticipantsResponse TenderService::GetParticipants(const std::string& caller, const GetParticipantsRequest& req) {
  return ObserveRpc("TenderService.GetParticipants", caller, req.tender_id(), [&] { return ctx_.offers->GetParticipants(req.tender_id()); });
}

} // namespace tender::service
