#include "lifecycle.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tender::core {

using namespace tender::manager::v1;

Tender ToTender(const db::model::TenderRecord& record, uint64_t participant_count) {
  Tender tender;
  tender.set_id(record.id);
  tender.set_creator(record.creator);
  tender.set_description(record.description);
  tender.set_max_price(record.max_price);
  *tender.mutable_deadline()   = util::MillisToProto(record.deadline_ms);
  *tender.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  tender.set_weight_price(record.weight_price);
  tender.set_weight_quality(record.weight_quality);
  tender.set_status(record.status);
  if (record.winner) {
    tender.set_winner(*record.winner);
  }
  tender.set_participant_count(participant_count);
  return tender;
}

Offer ToOffer(const db::model::OfferRecord& record) {
  Offer offer;
  offer.set_tender_id(record.tender_id);
  offer.set_provider(record.provider);
  offer.set_price(record.price);
  offer.set_documentation_reference(record.documentation_reference);
  offer.set_quality_score(record.quality_score);
  offer.set_evaluated(record.evaluated);
  offer.set_sequence(record.sequence);
  *offer.mutable_submitted_at() = util::MillisToProto(record.submitted_at_ms);
  if (record.evaluated) {
    offer.set_evaluated_by(record.evaluated_by);
    *offer.mutable_evaluated_at() = util::MillisToProto(record.evaluated_at_ms);
  }
  return offer;
}

void RequireStatus(const db::model::TenderRecord& record, model::Status expected, const std::string& operation) {
  if (record.status != expected) {
    throw util::InvalidState(operation + ": tender " + std::to_string(record.id) + " is " + std::string(model::StatusName(record.status)) +
                             ", expected " + std::string(model::StatusName(expected)));
  }
}

void Advance(db::model::TenderRecord& record, model::Status target, const std::string& operation) {
  if (!model::CanTransition(record.status, target)) {
    throw util::InvalidState(operation + ": tender " + std::to_string(record.id) + " is " + std::string(model::StatusName(record.status)));
  }
  record.status = target;
  record.version++;
}

void NoteTransition(const db::model::TenderRecord& record, const std::string& caller) {
  const auto status = model::StatusName(record.status);
  observability::Metrics::Instance().RecordTransition(status);
  TENDER_LOG_INFO("tender status changed", {observability::TenderField(record.id),
                                            observability::StringField("status", status), observability::CallerField(caller)});
}

} // namespace tender::core
