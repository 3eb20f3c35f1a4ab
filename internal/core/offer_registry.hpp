#pragma once

#include <cstdint>
#include <string>

#include "internal/core/core_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::core {

/*
  OfferRegistry

  One offer per (tender, provider). Submitting an offer also appends the
  provider to the tender's participant list; both land in the same
  transaction.
*/
class OfferRegistry {
 public:
  explicit OfferRegistry(CoreContext ctx);

  tender::manager::v1::Offer SubmitOffer(const std::string& caller, uint64_t tender_id, uint64_t price, const std::string& documentation_reference);

  tender::manager::v1::Offer                   GetOffer(uint64_t tender_id, const std::string& provider);
  tender::manager::v1::GetOffersResponse       GetOffers(uint64_t tender_id);
  tender::manager::v1::GetParticipantsResponse GetParticipants(uint64_t tender_id);

 private:
  CoreContext ctx_;
};

} // namespace tender::core
