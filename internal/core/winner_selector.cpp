#include "winner_selector.hpp"

#include <mutex>
#include <shared_mutex>
#include <vector>

#include "internal/core/lifecycle.hpp"
#include "internal/model/scoring.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace tender::core {

using namespace tender::manager::v1;

WinnerSelector::WinnerSelector(CoreContext ctx) : ctx_(std::move(ctx)) {
}

CalculateWinnerResponse WinnerSelector::CalculateWinner(const std::string& caller, uint64_t tender_id) {
  static const std::string kOperation = "calculate winner";

  std::shared_lock access_lock(ctx_.access->Mutex());
  auto tender_lock = LockTender<std::unique_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kCalculateWinner);

  auto record = ctx_.repository->GetTender(*tx, tender_id);
  if (!record) {
    throw util::NotFound(kOperation + ": tender " + std::to_string(tender_id) + " not found");
  }
  if (record->status == TENDER_STATUS_FINALIZED || record->winner) {
    throw util::AlreadyExists(kOperation + ": winner already calculated for tender " + std::to_string(tender_id));
  }
  RequireStatus(*record, TENDER_STATUS_EVALUATED, kOperation);

  const auto offers = ctx_.repository->ListOffers(*tx, tender_id);

  std::vector<model::Candidate> candidates;
  candidates.reserve(offers.size());
  for (const auto& offer : offers) {
    candidates.push_back({offer.provider, offer.price, offer.quality_score});
  }

  const auto leader = model::SelectLeader(record->max_price, {record->weight_price, record->weight_quality}, candidates);
  if (!leader) {
    throw util::InvalidState(kOperation + ": no valid winner for tender " + std::to_string(tender_id));
  }

  record->winner = leader->provider;
  Advance(*record, TENDER_STATUS_FINALIZED, kOperation);
  util::ThrowIfDbError(ctx_.repository->UpdateTender(*tx, *record), kOperation);
  tx->Commit();

  NoteTransition(*record, caller);
  TENDER_LOG_INFO("winner calculated", {observability::TenderField(tender_id),
                                        observability::StringField("winner", leader->provider),
                                        observability::IntField("combined_score", leader->combined_score)});

  CalculateWinnerResponse resp;
  *resp.mutable_tender() = ToTender(*record, offers.size());
  resp.set_winner(leader->provider);
  resp.set_combined_score(leader->combined_score);
  return resp;
}

} // namespace tender::core
