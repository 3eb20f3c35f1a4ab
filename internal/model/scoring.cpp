#include "scoring.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace tender::model {

uint32_t PriceScore(uint64_t max_price, uint64_t price) {
  if (price == 0) {
    throw tender::util::InvalidInput("price score: price must be positive");
  }
  if (max_price > kMaxPrice) {
    throw tender::util::InvalidInput("price score: max price exceeds supported range");
  }

  const uint64_t raw = (max_price * kMaxScore) / price;
  return static_cast<uint32_t>(std::min<uint64_t>(raw, kMaxScore));
}

uint32_t CombinedScore(uint32_t price_score, uint32_t quality_score, uint32_t weight_price, uint32_t weight_quality) {
  const uint64_t weighted =
      static_cast<uint64_t>(price_score) * weight_price + static_cast<uint64_t>(quality_score) * weight_quality;
  return static_cast<uint32_t>(weighted / kWeightTotal);
}

std::optional<Leader> SelectLeader(uint64_t max_price, Weights weights, const std::vector<Candidate>& candidates_in_order) {
  std::optional<Leader> leader;

  for (std::size_t i = 0; i < candidates_in_order.size(); ++i) {
    const auto& candidate = candidates_in_order[i];
    const auto  combined  = CombinedScore(PriceScore(max_price, candidate.price), candidate.quality_score, weights.price, weights.quality);

    if (!leader.has_value() || combined > leader->combined_score) {
      leader = Leader{i, candidate.provider, combined};
    }
  }

  return leader;
}

} // namespace tender::model
