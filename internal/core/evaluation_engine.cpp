#include "evaluation_engine.hpp"

#include <mutex>
#include <shared_mutex>

#include "internal/core/lifecycle.hpp"
#include "internal/model/scoring.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace tender::core {

using namespace tender::manager::v1;

EvaluationEngine::EvaluationEngine(CoreContext ctx) : ctx_(std::move(ctx)) {
}

Offer EvaluationEngine::EvaluateOffer(const std::string& caller, uint64_t tender_id, const std::string& provider, uint32_t quality_score) {
  static const std::string kOperation = "evaluate offer";

  std::shared_lock access_lock(ctx_.access->Mutex());
  auto tender_lock = LockTender<std::unique_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kEvaluateOffer);

  auto tender = ctx_.repository->GetTender(*tx, tender_id);
  if (!tender) {
    throw util::NotFound(kOperation + ": tender " + std::to_string(tender_id) + " not found");
  }
  RequireStatus(*tender, TENDER_STATUS_CLOSED, kOperation);

  if (quality_score > model::kMaxScore) {
    throw util::InvalidInput(kOperation + ": quality score must be at most 100");
  }

  auto offer = ctx_.repository->GetOffer(*tx, tender_id, provider);
  if (!offer) {
    throw util::NotFound(kOperation + ": no offer from " + provider + " for tender " + std::to_string(tender_id));
  }
  if (offer->evaluated) {
    throw util::AlreadyExists(kOperation + ": offer from " + provider + " already evaluated");
  }

  offer->quality_score   = quality_score;
  offer->evaluated       = true;
  offer->evaluated_by    = caller;
  offer->evaluated_at_ms = ctx_.clock->NowMillis();
  util::ThrowIfDbError(ctx_.repository->UpdateOffer(*tx, *offer), kOperation);
  tx->Commit();

  TENDER_LOG_INFO("offer evaluated", {observability::TenderField(tender_id),
                                      observability::StringField("provider", provider), observability::IntField("quality_score", quality_score),
                                      observability::StringField("evaluator", caller)});
  return ToOffer(*offer);
}

} // namespace tender::core
