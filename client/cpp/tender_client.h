#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "tender/manager/v1.hpp"

namespace tender::manager::client {

/*
  Typed wrapper over the tender-manager stubs.

  Every call carries the client's caller identity in the x-tender-caller
  metadata header. Calls return the gRPC status; results land in the out
  parameter only when the status is OK.
*/
class TenderClient {
 public:
  TenderClient(std::shared_ptr<grpc::Channel> channel, std::string caller);

  const std::string& Caller() const {
    return caller_;
  }

  grpc::Status AddTender(const std::string& description, uint64_t max_price, uint64_t deadline_days, uint32_t weight_price,
                         uint32_t weight_quality, tender::manager::v1::Tender* tender) const;

  grpc::Status SubmitOffer(uint64_t tender_id, uint64_t price, const std::string& documentation_reference,
                           tender::manager::v1::Offer* offer) const;

  grpc::Status CloseOfferPeriod(uint64_t tender_id, tender::manager::v1::Tender* tender) const;

  grpc::Status EvaluateOffer(uint64_t tender_id, const std::string& provider, uint32_t quality_score, tender::manager::v1::Offer* offer) const;

  grpc::Status MarkAsEvaluated(uint64_t tender_id, tender::manager::v1::Tender* tender) const;

  grpc::Status CalculateWinner(uint64_t tender_id, tender::manager::v1::CalculateWinnerResponse* resp) const;

  grpc::Status GetTender(uint64_t tender_id, tender::manager::v1::Tender* tender) const;

  grpc::Status GetTenderCount(uint64_t* count) const;

  grpc::Status ListTenders(uint64_t offset, uint32_t limit, tender::manager::v1::ListTendersResponse* resp) const;

  grpc::Status GetOffer(uint64_t tender_id, const std::string& provider, tender::manager::v1::Offer* offer) const;

  grpc::Status GetOffers(uint64_t tender_id, tender::manager::v1::GetOffersResponse* resp) const;

  grpc::Status GetParticipants(uint64_t tender_id, std::vector<std::string>* providers) const;

  grpc::Status AddEvaluator(const std::string& identity) const;

  grpc::Status RemoveEvaluator(const std::string& identity) const;

  grpc::Status IsEvaluator(const std::string& identity, bool* is_evaluator) const;

  grpc::Status ListEvaluators(std::vector<std::string>* identities) const;

  grpc::Status GetAuthority(std::string* authority) const;

  grpc::Status TransferAuthority(const std::string& new_authority) const;

  grpc::Status RenounceAuthority() const;

  grpc::Status Stats(tender::manager::v1::StatsResponse* resp) const;

 private:
  void Prepare(grpc::ClientContext* context) const;

  std::string caller_;

  std::unique_ptr<tender::manager::v1::TenderService::Stub>        tender_stub_;
  std::unique_ptr<tender::manager::v1::AccessControlService::Stub> access_stub_;
  std::unique_ptr<tender::manager::v1::TenderAdminService::Stub>   admin_stub_;
};

} // namespace tender::manager::client
