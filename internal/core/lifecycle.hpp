#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/tender_record.hpp"
#include "internal/model/state_machine.hpp"
#include "tender/manager/v1.hpp"

namespace tender::core {

tender::manager::v1::Tender ToTender(const db::model::TenderRecord& record, uint64_t participant_count);
tender::manager::v1::Offer  ToOffer(const db::model::OfferRecord& record);

// Throws util::InvalidState unless record is in expected.
void RequireStatus(const db::model::TenderRecord& record, model::Status expected, const std::string& operation);

/*
  Moves record to target and bumps its version.
  Throws util::InvalidState naming the current status when the tender is
  not exactly one step behind target.
*/
void Advance(db::model::TenderRecord& record, model::Status target, const std::string& operation);

// Log line plus lifecycle metric, emitted after the transition committed.
void NoteTransition(const db::model::TenderRecord& record, const std::string& caller);

} // namespace tender::core
