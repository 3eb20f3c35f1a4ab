#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace tender::model {

constexpr uint32_t kMaxScore    = 100;
constexpr uint32_t kWeightTotal = 100;

// Keeps max_price * 100 inside uint64_t.
constexpr uint64_t kMaxPrice = std::numeric_limits<uint64_t>::max() / 100;

/*
  price_score = min(100, floor(max_price * 100 / price))

  Throws util::InvalidInput when price is zero or max_price exceeds kMaxPrice.
*/
uint32_t PriceScore(uint64_t max_price, uint64_t price);

// floor((price_score * weight_price + quality_score * weight_quality) / 100)
uint32_t CombinedScore(uint32_t price_score, uint32_t quality_score, uint32_t weight_price, uint32_t weight_quality);

struct Weights {
  uint32_t price   = 0;
  uint32_t quality = 0;
};

struct Candidate {
  std::string provider;
  uint64_t    price         = 0;
  uint32_t    quality_score = 0;
};

struct Leader {
  std::size_t index = 0;
  std::string provider;
  uint32_t    combined_score = 0;
};

/*
  Single pass in submission order. A candidate takes the lead only with a
  strictly greater combined score, so ties go to the earliest submission.
  Returns nullopt when no candidate was ever considered.
*/
std::optional<Leader> SelectLeader(uint64_t max_price, Weights weights, const std::vector<Candidate>& candidates_in_order);

} // namespace tender::model
