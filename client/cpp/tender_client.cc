#include "client/cpp/tender_client.h"

#include <google/protobuf/empty.pb.h>

namespace tender::manager::client {

using namespace tender::manager::v1;

namespace {

constexpr const char* kCallerMetadataKey = "x-tender-caller";

} // namespace

TenderClient::TenderClient(std::shared_ptr<grpc::Channel> channel, std::string caller)
    : caller_(std::move(caller)),
      tender_stub_(TenderService::NewStub(channel)),
      access_stub_(AccessControlService::NewStub(channel)),
      admin_stub_(TenderAdminService::NewStub(channel)) {
}

void TenderClient::Prepare(grpc::ClientContext* context) const {
  if (!caller_.empty()) {
    context->AddMetadata(kCallerMetadataKey, caller_);
  }
}

grpc::Status TenderClient::AddTender(const std::string& description, uint64_t max_price, uint64_t deadline_days, uint32_t weight_price,
                                     uint32_t weight_quality, Tender* tender) const {
  grpc::ClientContext context;
  Prepare(&context);

  AddTenderRequest req;
  req.set_description(description);
  req.set_max_price(max_price);
  req.set_deadline_days(deadline_days);
  req.set_weight_price(weight_price);
  req.set_weight_quality(weight_quality);

  AddTenderResponse resp;
  auto              status = tender_stub_->AddTender(&context, req, &resp);
  if (status.ok() && tender) {
    *tender = resp.tender();
  }
  return status;
}

grpc::Status TenderClient::SubmitOffer(uint64_t tender_id, uint64_t price, const std::string& documentation_reference, Offer* offer) const {
  grpc::ClientContext context;
  Prepare(&context);

  SubmitOfferRequest req;
  req.set_tender_id(tender_id);
  req.set_price(price);
  req.set_documentation_reference(documentation_reference);

  SubmitOfferResponse resp;
  auto                status = tender_stub_->SubmitOffer(&context, req, &resp);
  if (status.ok() && offer) {
    *offer = resp.offer();
  }
  return status;
}

grpc::Status TenderClient::CloseOfferPeriod(uint64_t tender_id, Tender* tender) const {
  grpc::ClientContext context;
  Prepare(&context);

  CloseOfferPeriodRequest req;
  req.set_tender_id(tender_id);

  CloseOfferPeriodResponse resp;
  auto                     status = tender_stub_->CloseOfferPeriod(&context, req, &resp);
  if (status.ok() && tender) {
    *tender = resp.tender();
  }
  return status;
}

grpc::Status TenderClient::EvaluateOffer(uint64_t tender_id, const std::string& provider, uint32_t quality_score, Offer* offer) const {
  grpc::ClientContext context;
  Prepare(&context);

  EvaluateOfferRequest req;
  req.set_tender_id(tender_id);
  req.set_provider(provider);
  req.set_quality_score(quality_score);

  EvaluateOfferResponse resp;
  auto                  status = tender_stub_->EvaluateOffer(&context, req, &resp);
  if (status.ok() && offer) {
    *offer = resp.offer();
  }
  return status;
}

grpc::Status TenderClient::MarkAsEvaluated(uint64_t tender_id, Tender* tender) const {
  grpc::ClientContext context;
  Prepare(&context);

  MarkAsEvaluatedRequest req;
  req.set_tender_id(tender_id);

  MarkAsEvaluatedResponse resp;
  auto                    status = tender_stub_->MarkAsEvaluated(&context, req, &resp);
  if (status.ok() && tender) {
    *tender = resp.tender();
  }
  return status;
}

grpc::Status TenderClient::CalculateWinner(uint64_t tender_id, CalculateWinnerResponse* resp) const {
  grpc::ClientContext context;
  Prepare(&context);

  CalculateWinnerRequest req;
  req.set_tender_id(tender_id);

  CalculateWinnerResponse out;
  auto                    status = tender_stub_->CalculateWinner(&context, req, &out);
  if (status.ok() && resp) {
    *resp = std::move(out);
  }
  return status;
}

grpc::Status TenderClient::GetTender(uint64_t tender_id, Tender* tender) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetTenderRequest req;
  req.set_tender_id(tender_id);

  GetTenderResponse resp;
  auto              status = tender_stub_->GetTender(&context, req, &resp);
  if (status.ok() && tender) {
    *tender = resp.tender();
  }
  return status;
}

grpc::Status TenderClient::GetTenderCount(uint64_t* count) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetTenderCountResponse resp;
  auto                   status = tender_stub_->GetTenderCount(&context, GetTenderCountRequest{}, &resp);
  if (status.ok() && count) {
    *count = resp.count();
  }
  return status;
}

grpc::Status TenderClient::ListTenders(uint64_t offset, uint32_t limit, ListTendersResponse* resp) const {
  grpc::ClientContext context;
  Prepare(&context);

  ListTendersRequest req;
  req.set_offset(offset);
  req.set_limit(limit);

  ListTendersResponse out;
  auto                status = tender_stub_->ListTenders(&context, req, &out);
  if (status.ok() && resp) {
    *resp = std::move(out);
  }
  return status;
}

grpc::Status TenderClient::GetOffer(uint64_t tender_id, const std::string& provider, Offer* offer) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetOfferRequest req;
  req.set_tender_id(tender_id);
  req.set_provider(provider);

  GetOfferResponse resp;
  auto             status = tender_stub_->GetOffer(&context, req, &resp);
  if (status.ok() && offer) {
    *offer = resp.offer();
  }
  return status;
}

grpc::Status TenderClient::GetOffers(uint64_t tender_id, GetOffersResponse* resp) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetOffersRequest req;
  req.set_tender_id(tender_id);

  GetOffersResponse out;
  auto              status = tender_stub_->GetOffers(&context, req, &out);
  if (status.ok() && resp) {
    *resp = std::move(out);
  }
  return status;
}

grpc::Status TenderClient::GetParticipants(uint64_t tender_id, std::vector<std::string>* providers) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetParticipantsRequest req;
  req.set_tender_id(tender_id);

  GetParticipantsResponse resp;
  auto                    status = tender_stub_->GetParticipants(&context, req, &resp);
  if (status.ok() && providers) {
    providers->assign(resp.providers().begin(), resp.providers().end());
  }
  return status;
}

grpc::Status TenderClient::AddEvaluator(const std::string& identity) const {
  grpc::ClientContext context;
  Prepare(&context);

  AddEvaluatorRequest req;
  req.set_identity(identity);

  google::protobuf::Empty resp;
  return access_stub_->AddEvaluator(&context, req, &resp);
}

grpc::Status TenderClient::RemoveEvaluator(const std::string& identity) const {
  grpc::ClientContext context;
  Prepare(&context);

  RemoveEvaluatorRequest req;
  req.set_identity(identity);

  google::protobuf::Empty resp;
  return access_stub_->RemoveEvaluator(&context, req, &resp);
}

grpc::Status TenderClient::IsEvaluator(const std::string& identity, bool* is_evaluator) const {
  grpc::ClientContext context;
  Prepare(&context);

  IsEvaluatorRequest req;
  req.set_identity(identity);

  IsEvaluatorResponse resp;
  auto                status = access_stub_->IsEvaluator(&context, req, &resp);
  if (status.ok() && is_evaluator) {
    *is_evaluator = resp.is_evaluator();
  }
  return status;
}

grpc::Status TenderClient::ListEvaluators(std::vector<std::string>* identities) const {
  grpc::ClientContext context;
  Prepare(&context);

  ListEvaluatorsResponse resp;
  auto                   status = access_stub_->ListEvaluators(&context, ListEvaluatorsRequest{}, &resp);
  if (status.ok() && identities) {
    identities->assign(resp.identities().begin(), resp.identities().end());
  }
  return status;
}

grpc::Status TenderClient::GetAuthority(std::string* authority) const {
  grpc::ClientContext context;
  Prepare(&context);

  GetAuthorityResponse resp;
  auto                 status = access_stub_->GetAuthority(&context, GetAuthorityRequest{}, &resp);
  if (status.ok() && authority) {
    *authority = resp.authority();
  }
  return status;
}

grpc::Status TenderClient::TransferAuthority(const std::string& new_authority) const {
  grpc::ClientContext context;
  Prepare(&context);

  TransferAuthorityRequest req;
  req.set_new_authority(new_authority);

  google::protobuf::Empty resp;
  return access_stub_->TransferAuthority(&context, req, &resp);
}

grpc::Status TenderClient::RenounceAuthority() const {
  grpc::ClientContext context;
  Prepare(&context);

  google::protobuf::Empty resp;
  return access_stub_->RenounceAuthority(&context, RenounceAuthorityRequest{}, &resp);
}

grpc::Status TenderClient::Stats(StatsResponse* resp) const {
  grpc::ClientContext context;
  Prepare(&context);

  StatsResponse out;
  auto          status = admin_stub_->Stats(&context, StatsRequest{}, &out);
  if (status.ok() && resp) {
    *resp = std::move(out);
  }
  return status;
}

} // namespace tender::manager::client
