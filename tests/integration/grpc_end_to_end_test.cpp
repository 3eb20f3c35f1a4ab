#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "client/cpp/tender_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"
#include "tender/manager/v1.hpp"

namespace {

using namespace std::chrono_literals;

using tender::manager::client::TenderClient;

constexpr auto kOneDay = std::chrono::milliseconds(24ll * 60 * 60 * 1000);

void RunLifecycleOverGrpc() {
  auto config = tender::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "127.0.0.1:0"
database:
  memory: {}
access:
  authority: "authority"
  evaluators: ["evaluator"]
)");

  auto clock = std::make_shared<tender::util::ManualTimeSource>();
  auto app   = tender::factory::Build(config, clock);

  tender::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  assert(server.SelectedPort() > 0);

  const auto target  = "127.0.0.1:" + std::to_string(server.SelectedPort());
  auto       channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());

  TenderClient authority(channel, "authority");
  TenderClient evaluator(channel, "evaluator");
  TenderClient provider_a(channel, "provider-a");
  TenderClient provider_b(channel, "provider-b");
  TenderClient anonymous(channel, "");

  // Caller identity travels in metadata.
  tender::manager::v1::Tender info;
  assert(anonymous.AddTender("x", 1000, 1, 60, 40, &info).error_code() == grpc::StatusCode::PERMISSION_DENIED);
  assert(provider_a.AddTender("x", 1000, 1, 60, 40, &info).error_code() == grpc::StatusCode::PERMISSION_DENIED);
  assert(authority.AddTender("x", 1000, 1, 60, 30, &info).error_code() == grpc::StatusCode::INVALID_ARGUMENT);

  assert(authority.AddTender("school roof", 1000, 1, 60, 40, &info).ok());
  assert(info.id() == 1);
  assert(info.creator() == "authority");
  assert(info.status() == tender::manager::v1::TENDER_STATUS_OPEN);

  tender::manager::v1::Offer offer;
  assert(provider_a.SubmitOffer(info.id(), 500, "doc-a", &offer).ok());
  assert(offer.provider() == "provider-a");
  assert(provider_b.SubmitOffer(info.id(), 1000, "doc-b", &offer).ok());
  assert(provider_b.SubmitOffer(info.id(), 900, "doc-b2", &offer).error_code() == grpc::StatusCode::ALREADY_EXISTS);

  assert(authority.CloseOfferPeriod(info.id(), &info).error_code() == grpc::StatusCode::OUT_OF_RANGE);
  clock->Advance(kOneDay + 1ms);
  assert(authority.CloseOfferPeriod(info.id(), &info).ok());
  assert(info.status() == tender::manager::v1::TENDER_STATUS_CLOSED);

  assert(provider_a.EvaluateOffer(info.id(), "provider-a", 100, &offer).error_code() == grpc::StatusCode::PERMISSION_DENIED);
  assert(evaluator.EvaluateOffer(info.id(), "provider-a", 50, &offer).ok());
  assert(evaluator.EvaluateOffer(info.id(), "provider-b", 101, &offer).error_code() == grpc::StatusCode::INVALID_ARGUMENT);
  assert(authority.MarkAsEvaluated(info.id(), &info).error_code() == grpc::StatusCode::INVALID_ARGUMENT);
  assert(evaluator.EvaluateOffer(info.id(), "provider-b", 90, &offer).ok());
  assert(authority.MarkAsEvaluated(info.id(), &info).ok());

  tender::manager::v1::CalculateWinnerResponse winner;
  assert(authority.CalculateWinner(info.id(), &winner).ok());
  assert(winner.winner() == "provider-b");
  assert(winner.combined_score() == 96);
  assert(authority.CalculateWinner(info.id(), &winner).error_code() == grpc::StatusCode::ALREADY_EXISTS);

  assert(anonymous.GetTender(info.id(), &info).ok());
  assert(info.status() == tender::manager::v1::TENDER_STATUS_FINALIZED);
  assert(info.winner() == "provider-b");
  assert(info.participant_count() == 2);
  assert(anonymous.GetTender(7, &info).error_code() == grpc::StatusCode::NOT_FOUND);

  std::vector<std::string> participants;
  assert(anonymous.GetParticipants(1, &participants).ok());
  assert((participants == std::vector<std::string>{"provider-a", "provider-b"}));

  tender::manager::v1::GetOffersResponse offers;
  assert(anonymous.GetOffers(1, &offers).ok());
  assert(offers.combined_scores_size() == 2);
  assert(offers.combined_scores(0) == 80);

  uint64_t count = 0;
  assert(anonymous.GetTenderCount(&count).ok());
  assert(count == 1);

  // Role management.
  bool is_evaluator = false;
  assert(anonymous.IsEvaluator("evaluator", &is_evaluator).ok());
  assert(is_evaluator);
  assert(authority.AddEvaluator("evaluator").error_code() == grpc::StatusCode::ALREADY_EXISTS);
  assert(authority.AddEvaluator("auditor").ok());
  assert(authority.RemoveEvaluator("ghost").error_code() == grpc::StatusCode::NOT_FOUND);

  std::vector<std::string> evaluators;
  assert(anonymous.ListEvaluators(&evaluators).ok());
  assert((evaluators == std::vector<std::string>{"auditor", "evaluator"}));

  assert(authority.TransferAuthority("successor").ok());
  TenderClient successor(channel, "successor");
  std::string  current;
  assert(anonymous.GetAuthority(&current).ok());
  assert(current == "successor");
  assert(authority.AddTender("stale", 1000, 1, 50, 50, &info).error_code() == grpc::StatusCode::PERMISSION_DENIED);
  assert(successor.RenounceAuthority().ok());
  assert(successor.AddTender("gone", 1000, 1, 50, 50, &info).error_code() == grpc::StatusCode::PERMISSION_DENIED);

  tender::manager::v1::StatsResponse stats;
  assert(anonymous.Stats(&stats).ok());
  assert(stats.tenders_total() == 1);
  assert(stats.tenders_finalized() == 1);
  assert(stats.offers_total() == 2);
  assert(stats.evaluators() == 2);

  server.Stop();
}

} // namespace

int main() {
  RunLifecycleOverGrpc();

  std::cout << "tender_manager_integration_grpc_end_to_end: pass\n";
  return 0;
}
