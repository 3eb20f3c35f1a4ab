#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "tender/manager/v1.hpp"

using namespace tender::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tenderctl <addr> <caller> add-tender <description> <max_price> <deadline_days> <weight_price> <weight_quality>\n"
            << "  tenderctl <addr> <caller> submit <tender_id> <price> <documentation_reference>\n"
            << "  tenderctl <addr> <caller> close <tender_id>\n"
            << "  tenderctl <addr> <caller> evaluate <tender_id> <provider> <quality_score>\n"
            << "  tenderctl <addr> <caller> mark-evaluated <tender_id>\n"
            << "  tenderctl <addr> <caller> winner <tender_id>\n"
            << "  tenderctl <addr> <caller> get <tender_id>\n"
            << "  tenderctl <addr> <caller> count\n"
            << "  tenderctl <addr> <caller> list [offset] [limit]\n"
            << "  tenderctl <addr> <caller> offer <tender_id> <provider>\n"
            << "  tenderctl <addr> <caller> offers <tender_id>\n"
            << "  tenderctl <addr> <caller> participants <tender_id>\n"
            << "  tenderctl <addr> <caller> add-evaluator <identity>\n"
            << "  tenderctl <addr> <caller> remove-evaluator <identity>\n"
            << "  tenderctl <addr> <caller> is-evaluator <identity>\n"
            << "  tenderctl <addr> <caller> evaluators\n"
            << "  tenderctl <addr> <caller> authority\n"
            << "  tenderctl <addr> <caller> transfer <new_authority>\n"
            << "  tenderctl <addr> <caller> renounce\n"
            << "  tenderctl <addr> <caller> stats\n";
}

static std::optional<uint64_t> ParseUint(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

static uint64_t RequireUint(const char* arg) {
  auto parsed = ParseUint(arg);
  if (!parsed.has_value()) {
    std::cerr << "invalid number: '" << arg << "'\n";
    std::exit(1);
  }
  return parsed.value();
}

static const char* StatusName(TenderStatus status) {
  switch (status) {
    case TENDER_STATUS_OPEN:
      return "open";
    case TENDER_STATUS_CLOSED:
      return "closed";
    case TENDER_STATUS_EVALUATED:
      return "evaluated";
    case TENDER_STATUS_FINALIZED:
      return "finalized";
    default:
      return "unspecified";
  }
}

static void PrintTender(const Tender& tender) {
  std::cout << "id=" << tender.id() << "\n";
  std::cout << "creator=" << tender.creator() << "\n";
  std::cout << "description=" << tender.description() << "\n";
  std::cout << "max_price=" << tender.max_price() << "\n";
  std::cout << "deadline_s=" << tender.deadline().seconds() << "\n";
  std::cout << "weights=" << tender.weight_price() << "/" << tender.weight_quality() << "\n";
  std::cout << "status=" << StatusName(tender.status()) << "\n";
  std::cout << "participants=" << tender.participant_count() << "\n";
  if (tender.has_winner()) {
    std::cout << "winner=" << tender.winner() << "\n";
  }
}

static void PrintOffer(const Offer& offer) {
  std::cout << "provider=" << offer.provider() << "\n";
  std::cout << "price=" << offer.price() << "\n";
  std::cout << "documentation=" << offer.documentation_reference() << "\n";
  if (offer.evaluated()) {
    std::cout << "quality_score=" << offer.quality_score() << "\n";
    std::cout << "evaluated_by=" << offer.evaluated_by() << "\n";
  } else {
    std::cout << "quality_score=<pending>\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr   = argv[1];
  std::string caller = argv[2];
  std::string cmd    = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto tender_stub = TenderService::NewStub(channel);
  auto access_stub = AccessControlService::NewStub(channel);
  auto admin_stub  = TenderAdminService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.AddMetadata("x-tender-caller", caller);

  // ------------------------------------------------------------

  if (cmd == "add-tender") {
    if (argc < 9) return 1;

    AddTenderRequest req;
    req.set_description(argv[4]);
    req.set_max_price(RequireUint(argv[5]));
    req.set_deadline_days(RequireUint(argv[6]));
    req.set_weight_price(static_cast<uint32_t>(RequireUint(argv[7])));
    req.set_weight_quality(static_cast<uint32_t>(RequireUint(argv[8])));

    AddTenderResponse resp;

    auto status = tender_stub->AddTender(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "tender_id=" << resp.tender().id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 7) return 1;

    SubmitOfferRequest req;
    req.set_tender_id(RequireUint(argv[4]));
    req.set_price(RequireUint(argv[5]));
    req.set_documentation_reference(argv[6]);

    SubmitOfferResponse resp;

    auto status = tender_stub->SubmitOffer(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "submitted sequence=" << resp.offer().sequence() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close") {
    if (argc < 5) return 1;

    CloseOfferPeriodRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    CloseOfferPeriodResponse resp;

    auto status = tender_stub->CloseOfferPeriod(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << StatusName(resp.tender().status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "evaluate") {
    if (argc < 7) return 1;

    EvaluateOfferRequest req;
    req.set_tender_id(RequireUint(argv[4]));
    req.set_provider(argv[5]);
    req.set_quality_score(static_cast<uint32_t>(RequireUint(argv[6])));

    EvaluateOfferResponse resp;

    auto status = tender_stub->EvaluateOffer(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "evaluated quality_score=" << resp.offer().quality_score() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "mark-evaluated") {
    if (argc < 5) return 1;

    MarkAsEvaluatedRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    MarkAsEvaluatedResponse resp;

    auto status = tender_stub->MarkAsEvaluated(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << StatusName(resp.tender().status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "winner") {
    if (argc < 5) return 1;

    CalculateWinnerRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    CalculateWinnerResponse resp;

    auto status = tender_stub->CalculateWinner(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "winner=" << resp.winner() << "\n";
    std::cout << "combined_score=" << resp.combined_score() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 5) return 1;

    GetTenderRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    GetTenderResponse resp;

    auto status = tender_stub->GetTender(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintTender(resp.tender());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "count") {
    GetTenderCountRequest  req;
    GetTenderCountResponse resp;

    auto status = tender_stub->GetTenderCount(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "count=" << resp.count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListTendersRequest req;
    req.set_offset(argc >= 5 ? RequireUint(argv[4]) : 0);
    req.set_limit(argc >= 6 ? static_cast<uint32_t>(RequireUint(argv[5])) : 0);

    ListTendersResponse resp;

    auto status = tender_stub->ListTenders(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "total=" << resp.total() << "\n";
    for (const auto& tender : resp.tenders()) {
      std::cout << tender.id() << " " << StatusName(tender.status()) << " " << tender.description() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "offer") {
    if (argc < 6) return 1;

    GetOfferRequest req;
    req.set_tender_id(RequireUint(argv[4]));
    req.set_provider(argv[5]);

    GetOfferResponse resp;

    auto status = tender_stub->GetOffer(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintOffer(resp.offer());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "offers") {
    if (argc < 5) return 1;

    GetOffersRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    GetOffersResponse resp;

    auto status = tender_stub->GetOffers(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (int i = 0; i < resp.providers_size(); ++i) {
      std::cout << resp.providers(i) << " price=" << resp.prices(i) << " quality=" << resp.quality_scores(i)
                << " combined=" << resp.combined_scores(i) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "participants") {
    if (argc < 5) return 1;

    GetParticipantsRequest req;
    req.set_tender_id(RequireUint(argv[4]));

    GetParticipantsResponse resp;

    auto status = tender_stub->GetParticipants(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& provider : resp.providers()) std::cout << provider << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-evaluator") {
    if (argc < 5) return 1;

    AddEvaluatorRequest req;
    req.set_identity(argv[4]);

    google::protobuf::Empty resp;

    auto status = access_stub->AddEvaluator(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "added\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "remove-evaluator") {
    if (argc < 5) return 1;

    RemoveEvaluatorRequest req;
    req.set_identity(argv[4]);

    google::protobuf::Empty resp;

    auto status = access_stub->RemoveEvaluator(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "removed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "is-evaluator") {
    if (argc < 5) return 1;

    IsEvaluatorRequest req;
    req.set_identity(argv[4]);

    IsEvaluatorResponse resp;

    auto status = access_stub->IsEvaluator(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << (resp.is_evaluator() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "evaluators") {
    ListEvaluatorsRequest  req;
    ListEvaluatorsResponse resp;

    auto status = access_stub->ListEvaluators(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& identity : resp.identities()) std::cout << identity << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "authority") {
    GetAuthorityRequest  req;
    GetAuthorityResponse resp;

    auto status = access_stub->GetAuthority(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "authority=" << (resp.authority().empty() ? "<renounced>" : resp.authority()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transfer") {
    if (argc < 5) return 1;

    TransferAuthorityRequest req;
    req.set_new_authority(argv[4]);

    google::protobuf::Empty resp;

    auto status = access_stub->TransferAuthority(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "transferred\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "renounce") {
    RenounceAuthorityRequest req;
    google::protobuf::Empty  resp;

    auto status = access_stub->RenounceAuthority(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "renounced\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "tenders=" << resp.tenders_total() << "\n";
    std::cout << "open=" << resp.tenders_open() << "\n";
    std::cout << "closed=" << resp.tenders_closed() << "\n";
    std::cout << "evaluated=" << resp.tenders_evaluated() << "\n";
    std::cout << "finalized=" << resp.tenders_finalized() << "\n";
    std::cout << "offers=" << resp.offers_total() << "\n";
    std::cout << "evaluators=" << resp.evaluators() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
