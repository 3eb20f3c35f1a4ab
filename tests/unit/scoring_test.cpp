#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/model/scoring.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using tender::model::Candidate;
using tender::model::CombinedScore;
using tender::model::PriceScore;
using tender::model::SelectLeader;
using tender::model::Weights;

void TestPriceScoreIsCappedAtHundred() {
  assert(PriceScore(1000, 1000) == 100);
  assert(PriceScore(1000, 500) == 100);
  assert(PriceScore(1000, 1) == 100);
}

void TestPriceScoreRoundsDown() {
  // 1000 * 100 / 3000 = 33.33
  assert(PriceScore(1000, 3000) == 33);
  assert(PriceScore(7, 9) == 77);
}

void TestPriceScoreRejectsZeroPrice() {
  bool threw = false;
  try {
    (void)PriceScore(1000, 0);
  } catch (const tender::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

void TestPriceScoreAtUpperPriceBound() {
  assert(PriceScore(tender::model::kMaxPrice, tender::model::kMaxPrice) == 100);

  bool threw = false;
  try {
    (void)PriceScore(tender::model::kMaxPrice + 1, 1);
  } catch (const tender::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

void TestCombinedScoreWeighting() {
  assert(CombinedScore(100, 50, 60, 40) == 80);
  assert(CombinedScore(100, 90, 60, 40) == 96);
  assert(CombinedScore(33, 0, 100, 0) == 33);
  assert(CombinedScore(0, 77, 0, 100) == 77);
  // (55 * 33 + 44 * 67) / 100 = 47.63
  assert(CombinedScore(55, 44, 33, 67) == 47);
}

void TestHigherQualityWinsAtEqualPriceScore() {
  std::vector<Candidate> candidates = {
      {"A", 500, 50},
      {"B", 1000, 90},
  };

  auto leader = SelectLeader(1000, Weights{60, 40}, candidates);
  assert(leader.has_value());
  assert(leader->provider == "B");
  assert(leader->index == 1);
  assert(leader->combined_score == 96);
}

void TestTieGoesToEarliestSubmission() {
  std::vector<Candidate> candidates = {
      {"first", 800, 70},
      {"second", 800, 70},
      {"third", 800, 70},
  };

  auto leader = SelectLeader(1000, Weights{50, 50}, candidates);
  assert(leader.has_value());
  assert(leader->provider == "first");
  assert(leader->index == 0);
}

void TestZeroScoresStillProduceLeader() {
  // Price score floors to zero and quality is zero: the first offer leads.
  std::vector<Candidate> candidates = {
      {"A", 1000, 0},
      {"B", 1000, 0},
  };

  auto leader = SelectLeader(1, Weights{50, 50}, candidates);
  assert(leader.has_value());
  assert(leader->provider == "A");
  assert(leader->combined_score == 0);
}

void TestNoCandidatesNoLeader() {
  assert(!SelectLeader(1000, Weights{50, 50}, {}).has_value());
}

void TestStateMachineMovesOneStepForward() {
  using namespace tender::manager::core::v1;
  using tender::model::CanTransition;

  assert(CanTransition(TENDER_STATUS_OPEN, TENDER_STATUS_CLOSED));
  assert(CanTransition(TENDER_STATUS_CLOSED, TENDER_STATUS_EVALUATED));
  assert(CanTransition(TENDER_STATUS_EVALUATED, TENDER_STATUS_FINALIZED));

  assert(!CanTransition(TENDER_STATUS_OPEN, TENDER_STATUS_EVALUATED));
  assert(!CanTransition(TENDER_STATUS_CLOSED, TENDER_STATUS_OPEN));
  assert(!CanTransition(TENDER_STATUS_FINALIZED, TENDER_STATUS_OPEN));
  assert(!CanTransition(TENDER_STATUS_UNSPECIFIED, TENDER_STATUS_OPEN));
  assert(tender::model::IsTerminal(TENDER_STATUS_FINALIZED));
  assert(tender::model::StatusName(TENDER_STATUS_EVALUATED) == "evaluated");
}

} // namespace

int main() {
  TestPriceScoreIsCappedAtHundred();
  TestPriceScoreRoundsDown();
  TestPriceScoreRejectsZeroPrice();
  TestPriceScoreAtUpperPriceBound();
  TestCombinedScoreWeighting();
  TestHigherQualityWinsAtEqualPriceScore();
  TestTieGoesToEarliestSubmission();
  TestZeroScoresStillProduceLeader();
  TestNoCandidatesNoLeader();
  TestStateMachineMovesOneStepForward();

  std::cout << "tender_manager_unit_scoring: pass\n";
  return 0;
}
