#pragma once

#include <cstdint>
#include <string>

#include "internal/core/core_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::core {

/*
  TenderRegistry

  Creates tenders and drives the authority-side transitions
  (Open -> Closed -> Evaluated). Also serves tender projections.
*/
class TenderRegistry {
 public:
  explicit TenderRegistry(CoreContext ctx);

  tender::manager::v1::Tender CreateTender(const std::string& caller, const std::string& description, uint64_t max_price, uint64_t deadline_days,
                                           uint32_t weight_price, uint32_t weight_quality);

  tender::manager::v1::Tender CloseOfferPeriod(const std::string& caller, uint64_t tender_id);
  tender::manager::v1::Tender MarkAsEvaluated(const std::string& caller, uint64_t tender_id);

  tender::manager::v1::Tender              GetTender(uint64_t tender_id);
  uint64_t                                 TenderCount();
  tender::manager::v1::ListTendersResponse ListTenders(uint64_t offset, uint64_t limit);

 private:
  CoreContext ctx_;
};

} // namespace tender::core
