#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/tender_client.h"
#include "tender/manager/v1.hpp"

using tender::manager::client::TenderClient;

namespace {

bool Check(const grpc::Status& status, const char* what) {
  if (!status.ok()) {
    std::cerr << what << " failed: " << status.error_message() << '\n';
    return false;
  }
  return true;
}

} // namespace

/*
  Walks one tender through its full lifecycle.

  Expects a server started with config/tender-manager.yaml, whose access
  section names "authority" as the contracting authority and "evaluator-1"
  as an evaluator.

  The offer period is measured in days. With --wait the example polls
  CloseOfferPeriod until the deadline has passed; without it, it stops after
  submitting offers.
*/
int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";
  const bool        wait   = argc > 2 && std::string(argv[2]) == "--wait";

  auto channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());

  TenderClient authority(channel, "authority");
  TenderClient evaluator(channel, "evaluator-1");
  TenderClient provider_a(channel, "provider-a");
  TenderClient provider_b(channel, "provider-b");

  // 70% price, 30% quality, one day offer period.
  tender::manager::v1::Tender tender;
  if (!Check(authority.AddTender("Road maintenance 2026", 1000, 1, 70, 30, &tender), "AddTender")) return 1;
  std::cout << "created tender " << tender.id() << '\n';

  if (!Check(provider_a.SubmitOffer(tender.id(), 800, "ipfs://offer-a", nullptr), "SubmitOffer(a)")) return 1;
  if (!Check(provider_b.SubmitOffer(tender.id(), 600, "ipfs://offer-b", nullptr), "SubmitOffer(b)")) return 1;

  std::vector<std::string> participants;
  if (!Check(authority.GetParticipants(tender.id(), &participants), "GetParticipants")) return 1;
  std::cout << "participants:";
  for (const auto& p : participants) std::cout << ' ' << p;
  std::cout << '\n';

  if (!wait) {
    std::cout << "offers submitted; rerun with --wait to finish once the deadline passes" << '\n';
    return 0;
  }

  // Poll until the offer period is over.
  for (;;) {
    auto status = authority.CloseOfferPeriod(tender.id(), &tender);
    if (status.ok()) break;
    if (status.error_code() != grpc::StatusCode::OUT_OF_RANGE) {
      Check(status, "CloseOfferPeriod");
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::minutes(1));
  }
  std::cout << "offer period closed" << '\n';

  if (!Check(evaluator.EvaluateOffer(tender.id(), "provider-a", 80, nullptr), "EvaluateOffer(a)")) return 1;
  if (!Check(evaluator.EvaluateOffer(tender.id(), "provider-b", 60, nullptr), "EvaluateOffer(b)")) return 1;
  if (!Check(authority.MarkAsEvaluated(tender.id(), nullptr), "MarkAsEvaluated")) return 1;

  tender::manager::v1::GetOffersResponse offers;
  if (!Check(authority.GetOffers(tender.id(), &offers), "GetOffers")) return 1;
  for (int i = 0; i < offers.providers_size(); ++i) {
    std::cout << offers.providers(i) << ": price=" << offers.prices(i) << " quality=" << offers.quality_scores(i)
              << " combined=" << offers.combined_scores(i) << '\n';
  }

  tender::manager::v1::CalculateWinnerResponse winner;
  if (!Check(authority.CalculateWinner(tender.id(), &winner), "CalculateWinner")) return 1;
  std::cout << "winner=" << winner.winner() << " combined_score=" << winner.combined_score() << '\n';

  return 0;
}
