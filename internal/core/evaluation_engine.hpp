#pragma once

#include <cstdint>
#include <string>

#include "internal/core/core_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::core {

// Records one quality score per offer while its tender is Closed.
class EvaluationEngine {
 public:
  explicit EvaluationEngine(CoreContext ctx);

  tender::manager::v1::Offer EvaluateOffer(const std::string& caller, uint64_t tender_id, const std::string& provider, uint32_t quality_score);

 private:
  CoreContext ctx_;
};

} // namespace tender::core
