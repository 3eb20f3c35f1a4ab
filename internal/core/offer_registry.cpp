#include "offer_registry.hpp"

#include <mutex>
#include <shared_mutex>

#include "internal/core/lifecycle.hpp"
#include "internal/model/scoring.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace tender::core {

using namespace tender::manager::v1;

OfferRegistry::OfferRegistry(CoreContext ctx) : ctx_(std::move(ctx)) {
}

Offer OfferRegistry::SubmitOffer(const std::string& caller, uint64_t tender_id, uint64_t price, const std::string& documentation_reference) {
  static const std::string kOperation = "submit offer";

  std::shared_lock access_lock(ctx_.access->Mutex());
  auto tender_lock = LockTender<std::unique_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kSubmitOffer);

  auto tender = ctx_.repository->GetTender(*tx, tender_id);
  if (!tender) {
    throw util::NotFound(kOperation + ": tender " + std::to_string(tender_id) + " not found");
  }
  RequireStatus(*tender, TENDER_STATUS_OPEN, kOperation);

  const auto now_ms = ctx_.clock->NowMillis();
  if (now_ms > tender->deadline_ms) {
    throw util::DeadlineViolation(kOperation + ": offer period of tender " + std::to_string(tender_id) + " has ended");
  }
  if (price == 0 || price > tender->max_price) {
    throw util::InvalidInput(kOperation + ": price must be positive and at most " + std::to_string(tender->max_price));
  }
  if (documentation_reference.empty()) {
    throw util::InvalidInput(kOperation + ": documentation reference is required");
  }
  if (ctx_.repository->GetOffer(*tx, tender_id, caller)) {
    throw util::AlreadyExists(kOperation + ": " + caller + " already submitted an offer for tender " + std::to_string(tender_id));
  }

  db::model::OfferRecord record;
  record.tender_id               = tender_id;
  record.provider                = caller;
  record.price                   = price;
  record.documentation_reference = documentation_reference;
  record.submitted_at_ms         = now_ms;
  util::ThrowIfDbError(ctx_.repository->InsertOffer(*tx, record), kOperation);
  tx->Commit();

  TENDER_LOG_INFO("offer submitted", {observability::TenderField(tender_id),
                                      observability::StringField("provider", caller),
                                      observability::IntField("sequence", static_cast<std::int64_t>(record.sequence))});
  return ToOffer(record);
}

Offer OfferRegistry::GetOffer(uint64_t tender_id, const std::string& provider) {
  auto tender_lock = LockTender<std::shared_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  if (!ctx_.repository->GetTender(*tx, tender_id)) {
    throw util::NotFound("get offer: tender " + std::to_string(tender_id) + " not found");
  }
  auto record = ctx_.repository->GetOffer(*tx, tender_id, provider);
  if (!record) {
    throw util::NotFound("get offer: no offer from " + provider + " for tender " + std::to_string(tender_id));
  }
  return ToOffer(*record);
}

GetOffersResponse OfferRegistry::GetOffers(uint64_t tender_id) {
  auto tender_lock = LockTender<std::shared_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx     = ctx_.repository->Begin();
  auto tender = ctx_.repository->GetTender(*tx, tender_id);
  if (!tender) {
    throw util::NotFound("get offers: tender " + std::to_string(tender_id) + " not found");
  }

  GetOffersResponse resp;
  for (const auto& offer : ctx_.repository->ListOffers(*tx, tender_id)) {
    resp.add_providers(offer.provider);
    resp.add_prices(offer.price);
    resp.add_quality_scores(offer.quality_score);

    uint32_t combined = 0;
    if (offer.evaluated) {
      combined = model::CombinedScore(model::PriceScore(tender->max_price, offer.price), offer.quality_score, tender->weight_price,
                                      tender->weight_quality);
    }
    resp.add_combined_scores(combined);
  }
  return resp;
}

GetParticipantsResponse OfferRegistry::GetParticipants(uint64_t tender_id) {
  auto tender_lock = LockTender<std::shared_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  if (!ctx_.repository->GetTender(*tx, tender_id)) {
    throw util::NotFound("get participants: tender " + std::to_string(tender_id) + " not found");
  }

  GetParticipantsResponse resp;
  for (const auto& provider : ctx_.repository->ListParticipants(*tx, tender_id)) {
    resp.add_providers(provider);
  }
  return resp;
}

} // namespace tender::core
