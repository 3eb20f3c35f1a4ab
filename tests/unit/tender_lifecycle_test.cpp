#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/core/core_context.hpp"
#include "internal/core/evaluation_engine.hpp"
#include "internal/core/offer_registry.hpp"
#include "internal/core/tender_locks.hpp"
#include "internal/core/tender_registry.hpp"
#include "internal/core/winner_selector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/scoring.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tender/manager/v1.hpp"

namespace {

using namespace std::chrono_literals;

using tender::manager::v1::TENDER_STATUS_CLOSED;
using tender::manager::v1::TENDER_STATUS_EVALUATED;
using tender::manager::v1::TENDER_STATUS_FINALIZED;
using tender::manager::v1::TENDER_STATUS_OPEN;

constexpr const char* kAuthority = "authority";
constexpr const char* kEvaluator = "evaluator";

constexpr auto kOneDay = std::chrono::milliseconds(24ll * 60 * 60 * 1000);

struct Harness {
  std::shared_ptr<tender::db::memory::MemoryRepository> repository;
  std::shared_ptr<tender::util::ManualTimeSource>       clock;
  std::shared_ptr<tender::access::AccessControl>        access;
  std::shared_ptr<tender::core::TenderLocks>            locks;

  std::shared_ptr<tender::core::TenderRegistry>   tenders;
  std::shared_ptr<tender::core::OfferRegistry>    offers;
  std::shared_ptr<tender::core::EvaluationEngine> evaluations;
  std::shared_ptr<tender::core::WinnerSelector>   winners;
};

Harness BuildHarness() {
  Harness h;
  h.repository = std::make_shared<tender::db::memory::MemoryRepository>();
  h.clock      = std::make_shared<tender::util::ManualTimeSource>();
  h.access     = std::make_shared<tender::access::AccessControl>(h.repository, h.clock);
  const bool bootstrapped = h.access->Bootstrap(kAuthority, {kEvaluator});
  assert(bootstrapped);
  (void)bootstrapped;

  h.locks = std::make_shared<tender::core::TenderLocks>();

  tender::core::CoreContext ctx{h.repository, h.access, h.locks, h.clock};
  h.tenders     = std::make_shared<tender::core::TenderRegistry>(ctx);
  h.offers      = std::make_shared<tender::core::OfferRegistry>(ctx);
  h.evaluations = std::make_shared<tender::core::EvaluationEngine>(ctx);
  h.winners     = std::make_shared<tender::core::WinnerSelector>(ctx);
  return h;
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

uint64_t CreateDefaultTender(Harness& h, uint32_t weight_price = 60, uint32_t weight_quality = 40) {
  return h.tenders->CreateTender(kAuthority, "bridge repair", 1000, 1, weight_price, weight_quality).id();
}

void PassDeadline(Harness& h) {
  h.clock->Advance(kOneDay + 1ms);
}

void TestFullLifecyclePicksHighestCombinedScore() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  assert(id == 1);
  assert(h.tenders->GetTender(id).status() == TENDER_STATUS_OPEN);

  h.offers->SubmitOffer("A", id, 500, "doc-a");
  h.offers->SubmitOffer("B", id, 1000, "doc-b");
  PassDeadline(h);

  auto closed = h.tenders->CloseOfferPeriod(kAuthority, id);
  assert(closed.status() == TENDER_STATUS_CLOSED);
  assert(closed.participant_count() == 2);

  auto offer_a = h.evaluations->EvaluateOffer(kEvaluator, id, "A", 50);
  assert(offer_a.evaluated());
  assert(offer_a.quality_score() == 50);
  assert(offer_a.evaluated_by() == kEvaluator);
  h.evaluations->EvaluateOffer(kEvaluator, id, "B", 90);

  assert(h.tenders->MarkAsEvaluated(kAuthority, id).status() == TENDER_STATUS_EVALUATED);

  auto offers = h.offers->GetOffers(id);
  assert(offers.providers_size() == 2);
  assert(offers.providers(0) == "A");
  assert(offers.combined_scores(0) == 80);
  assert(offers.combined_scores(1) == 96);

  auto result = h.winners->CalculateWinner(kAuthority, id);
  assert(result.winner() == "B");
  assert(result.combined_score() == 96);
  assert(result.tender().status() == TENDER_STATUS_FINALIZED);

  auto finalized = h.tenders->GetTender(id);
  assert(finalized.status() == TENDER_STATUS_FINALIZED);
  assert(finalized.has_winner());
  assert(finalized.winner() == "B");
  assert(finalized.participant_count() == 2);
}

void TestTieGoesToEarlierSubmission() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h, 50, 50);

  h.offers->SubmitOffer("late", id, 800, "doc");
  h.offers->SubmitOffer("later", id, 800, "doc");
  PassDeadline(h);
  h.tenders->CloseOfferPeriod(kAuthority, id);
  h.evaluations->EvaluateOffer(kEvaluator, id, "later", 70);
  h.evaluations->EvaluateOffer(kEvaluator, id, "late", 70);
  h.tenders->MarkAsEvaluated(kAuthority, id);

  assert(h.winners->CalculateWinner(kAuthority, id).winner() == "late");
}

void TestOfferPeriodBoundaries() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);

  h.offers->SubmitOffer("early", id, 900, "doc");

  // Exactly at the deadline: offers still accepted, closing still refused.
  h.clock->Advance(kOneDay);
  h.offers->SubmitOffer("on-time", id, 900, "doc");
  ExpectThrows<tender::util::DeadlineViolation>([&] { h.tenders->CloseOfferPeriod(kAuthority, id); });

  h.clock->Advance(1ms);
  ExpectThrows<tender::util::DeadlineViolation>([&] { h.offers->SubmitOffer("too-late", id, 900, "doc"); });
  h.tenders->CloseOfferPeriod(kAuthority, id);

  auto participants = h.offers->GetParticipants(id);
  assert(participants.providers_size() == 2);
  assert(participants.providers(0) == "early");
  assert(participants.providers(1) == "on-time");

  // Status is checked before the deadline.
  ExpectThrows<tender::util::InvalidState>([&] { h.offers->SubmitOffer("another", id, 900, "doc"); });
}

void TestCreateTenderValidation() {
  auto h = BuildHarness();

  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", 1000, 1, 60, 30); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", 1000, 1, 150, 0); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", 0, 1, 50, 50); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "", 1000, 1, 50, 50); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", 1000, 0, 50, 50); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", 1000, UINT64_MAX, 50, 50); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CreateTender(kAuthority, "x", tender::model::kMaxPrice + 1, 1, 50, 50); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CreateTender("someone", "x", 1000, 1, 50, 50); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CreateTender("", "x", 1000, 1, 50, 50); });

  assert(h.tenders->TenderCount() == 0);

  // Extreme weight splits are legal.
  assert(h.tenders->CreateTender(kAuthority, "price only", 1000, 1, 100, 0).weight_price() == 100);
  assert(h.tenders->CreateTender(kAuthority, "quality only", 1000, 1, 0, 100).weight_quality() == 100);
  assert(h.tenders->TenderCount() == 2);
}

void TestSubmitOfferValidation() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);

  ExpectThrows<tender::util::NotFound>([&] { h.offers->SubmitOffer("A", 42, 100, "doc"); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.offers->SubmitOffer("A", id, 0, "doc"); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.offers->SubmitOffer("A", id, 1001, "doc"); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.offers->SubmitOffer("A", id, 100, ""); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.offers->SubmitOffer("", id, 100, "doc"); });

  auto offer = h.offers->SubmitOffer("A", id, 1000, "doc");
  assert(offer.sequence() == 0);
  assert(!offer.evaluated());

  ExpectThrows<tender::util::AlreadyExists>([&] { h.offers->SubmitOffer("A", id, 900, "doc-2"); });

  // The rejected resubmission left the original offer untouched.
  auto stored = h.offers->GetOffer(id, "A");
  assert(stored.price() == 1000);
  assert(stored.documentation_reference() == "doc");
  assert(h.offers->GetParticipants(id).providers_size() == 1);
}

void TestEvaluationRules() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  h.offers->SubmitOffer("A", id, 500, "doc");

  // Not Closed yet.
  ExpectThrows<tender::util::InvalidState>([&] { h.evaluations->EvaluateOffer(kEvaluator, id, "A", 50); });

  PassDeadline(h);
  h.tenders->CloseOfferPeriod(kAuthority, id);

  ExpectThrows<tender::util::Unauthorized>([&] { h.evaluations->EvaluateOffer(kAuthority, id, "A", 50); });
  ExpectThrows<tender::util::InvalidInput>([&] { h.evaluations->EvaluateOffer(kEvaluator, id, "A", 101); });
  ExpectThrows<tender::util::NotFound>([&] { h.evaluations->EvaluateOffer(kEvaluator, id, "nobody", 50); });

  h.evaluations->EvaluateOffer(kEvaluator, id, "A", 0);
  ExpectThrows<tender::util::AlreadyExists>([&] { h.evaluations->EvaluateOffer(kEvaluator, id, "A", 70); });

  auto offer = h.offers->GetOffer(id, "A");
  assert(offer.evaluated());
  assert(offer.quality_score() == 0);
}

void TestMarkAsEvaluatedRequiresEveryOffer() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);

  ExpectThrows<tender::util::InvalidState>([&] { h.tenders->MarkAsEvaluated(kAuthority, id); });

  h.offers->SubmitOffer("A", id, 500, "doc");
  h.offers->SubmitOffer("B", id, 600, "doc");
  h.offers->SubmitOffer("C", id, 700, "doc");
  PassDeadline(h);
  h.tenders->CloseOfferPeriod(kAuthority, id);

  h.evaluations->EvaluateOffer(kEvaluator, id, "A", 10);
  h.evaluations->EvaluateOffer(kEvaluator, id, "C", 30);

  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->MarkAsEvaluated(kAuthority, id); });
  assert(h.tenders->GetTender(id).status() == TENDER_STATUS_CLOSED);

  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->MarkAsEvaluated(kEvaluator, id); });

  h.evaluations->EvaluateOffer(kEvaluator, id, "B", 20);
  assert(h.tenders->MarkAsEvaluated(kAuthority, id).status() == TENDER_STATUS_EVALUATED);

  // No further evaluation once the tender moved on.
  ExpectThrows<tender::util::InvalidState>([&] { h.tenders->MarkAsEvaluated(kAuthority, id); });
}

void TestCalculateWinnerOnlyOnce() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  h.offers->SubmitOffer("A", id, 500, "doc");

  ExpectThrows<tender::util::InvalidState>([&] { h.winners->CalculateWinner(kAuthority, id); });

  PassDeadline(h);
  h.tenders->CloseOfferPeriod(kAuthority, id);
  ExpectThrows<tender::util::InvalidState>([&] { h.winners->CalculateWinner(kAuthority, id); });

  h.evaluations->EvaluateOffer(kEvaluator, id, "A", 40);
  h.tenders->MarkAsEvaluated(kAuthority, id);

  ExpectThrows<tender::util::Unauthorized>([&] { h.winners->CalculateWinner("A", id); });
  assert(h.winners->CalculateWinner(kAuthority, id).winner() == "A");

  ExpectThrows<tender::util::AlreadyExists>([&] { h.winners->CalculateWinner(kAuthority, id); });

  auto tender = h.tenders->GetTender(id);
  assert(tender.status() == TENDER_STATUS_FINALIZED);
  assert(tender.winner() == "A");
}

void TestZeroOfferTenderStaysOpen() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  PassDeadline(h);

  ExpectThrows<tender::util::InvalidInput>([&] { h.tenders->CloseOfferPeriod(kAuthority, id); });
  assert(h.tenders->GetTender(id).status() == TENDER_STATUS_OPEN);
}

void TestProjections() {
  auto h = BuildHarness();

  ExpectThrows<tender::util::NotFound>([&] { h.tenders->GetTender(1); });
  ExpectThrows<tender::util::NotFound>([&] { h.offers->GetOffers(1); });
  ExpectThrows<tender::util::NotFound>([&] { h.offers->GetParticipants(1); });

  auto first  = CreateDefaultTender(h);
  auto second = CreateDefaultTender(h);
  auto third  = CreateDefaultTender(h);
  assert(first == 1 && second == 2 && third == 3);
  assert(h.tenders->TenderCount() == 3);

  auto empty = h.offers->GetOffers(second);
  assert(empty.providers_size() == 0);
  assert(empty.prices_size() == 0);
  assert(empty.quality_scores_size() == 0);
  assert(empty.combined_scores_size() == 0);
  assert(h.offers->GetParticipants(second).providers_size() == 0);

  h.offers->SubmitOffer("A", second, 250, "doc");
  auto pending = h.offers->GetOffers(second);
  assert(pending.providers_size() == 1);
  assert(pending.prices(0) == 250);
  assert(pending.quality_scores(0) == 0);
  assert(pending.combined_scores(0) == 0);

  ExpectThrows<tender::util::NotFound>([&] { h.offers->GetOffer(second, "B"); });

  auto page = h.tenders->ListTenders(1, 1);
  assert(page.total() == 3);
  assert(page.tenders_size() == 1);
  assert(page.tenders(0).id() == second);
  assert(page.tenders(0).participant_count() == 1);

  auto rest = h.tenders->ListTenders(1, 0);
  assert(rest.tenders_size() == 2);
  assert(h.tenders->ListTenders(10, 5).tenders_size() == 0);
}

void TestFinalizedTenderIsTerminal() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);

  h.offers->SubmitOffer("A", id, 500, "doc-a");
  h.offers->SubmitOffer("B", id, 1000, "doc-b");
  PassDeadline(h);
  h.tenders->CloseOfferPeriod(kAuthority, id);
  h.evaluations->EvaluateOffer(kEvaluator, id, "A", 50);
  h.evaluations->EvaluateOffer(kEvaluator, id, "B", 90);
  h.tenders->MarkAsEvaluated(kAuthority, id);
  assert(h.winners->CalculateWinner(kAuthority, id).winner() == "B");

  ExpectThrows<tender::util::InvalidState>([&] { h.offers->SubmitOffer("C", id, 400, "doc-c"); });
  ExpectThrows<tender::util::InvalidState>([&] { h.evaluations->EvaluateOffer(kEvaluator, id, "A", 100); });
  ExpectThrows<tender::util::InvalidState>([&] { h.tenders->CloseOfferPeriod(kAuthority, id); });
  ExpectThrows<tender::util::InvalidState>([&] { h.tenders->MarkAsEvaluated(kAuthority, id); });

  auto tender_after = h.tenders->GetTender(id);
  assert(tender_after.status() == TENDER_STATUS_FINALIZED);
  assert(tender_after.winner() == "B");

  auto participants = h.offers->GetParticipants(id);
  assert(participants.providers_size() == 2);
  assert(participants.providers(0) == "A");
  assert(participants.providers(1) == "B");

  auto offers = h.offers->GetOffers(id);
  assert(offers.providers_size() == 2);
  assert(offers.quality_scores(0) == 50);
  assert(offers.quality_scores(1) == 90);
  assert(offers.combined_scores(0) == 80);
  assert(offers.combined_scores(1) == 96);
  ExpectThrows<tender::util::NotFound>([&] { h.offers->GetOffer(id, "C"); });
}

void TestUnknownTendersDoNotGrowLockTable() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  assert(h.locks->Size() == 1);

  for (uint64_t unknown = 2; unknown < 5000; ++unknown) {
    ExpectThrows<tender::util::NotFound>([&] { h.tenders->GetTender(unknown); });
    ExpectThrows<tender::util::NotFound>([&] { h.offers->GetOffers(unknown); });
    ExpectThrows<tender::util::NotFound>([&] { h.offers->GetParticipants(unknown); });
    ExpectThrows<tender::util::NotFound>([&] { h.offers->GetOffer(unknown, "A"); });
    ExpectThrows<tender::util::NotFound>([&] { h.offers->SubmitOffer("A", unknown, 100, "doc"); });
  }
  ExpectThrows<tender::util::NotFound>([&] { h.tenders->GetTender(0); });
  ExpectThrows<tender::util::NotFound>([&] { h.tenders->GetTender(UINT64_MAX); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CloseOfferPeriod("provider", 77); });
  assert(h.locks->Size() == 1);

  // The next tender takes the next slot.
  assert(CreateDefaultTender(h) == id + 1);
  assert(h.locks->Size() == 2);
  h.offers->SubmitOffer("A", id + 1, 100, "doc");
  assert(h.offers->GetParticipants(id + 1).providers_size() == 1);
}

void TestTendersAlreadyInStoreAreRegisteredOnUse() {
  auto h = BuildHarness();

  // Written straight to the store, as after a restart.
  {
    auto tx = h.repository->Begin();
    for (uint64_t id = 1; id <= 3; ++id) {
      tender::db::model::TenderRecord record;
      record.id             = id;
      record.creator        = kAuthority;
      record.description    = "persisted";
      record.max_price      = 1000;
      record.deadline_ms    = h.clock->NowMillis() + kOneDay.count();
      record.weight_price   = 50;
      record.weight_quality = 50;
      record.status         = TENDER_STATUS_OPEN;
      record.version        = 1;
      assert(h.repository->InsertTender(*tx, record));
    }
    tx->Commit();
  }
  assert(h.locks->Size() == 0);

  h.offers->SubmitOffer("A", 2, 500, "doc");
  assert(h.locks->Size() == 3);
  assert(h.tenders->GetTender(2).participant_count() == 1);
  assert(CreateDefaultTender(h) == 4);
  assert(h.locks->Size() == 4);
}

void TestRenouncedAuthorityBlocksAuthorityOperations() {
  auto h  = BuildHarness();
  auto id = CreateDefaultTender(h);
  h.offers->SubmitOffer("A", id, 500, "doc");
  PassDeadline(h);

  h.access->RenounceAuthority(kAuthority);

  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CreateTender(kAuthority, "x", 1000, 1, 50, 50); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CloseOfferPeriod(kAuthority, id); });
  ExpectThrows<tender::util::Unauthorized>([&] { h.tenders->CloseOfferPeriod("", id); });
}

} // namespace

int main() {
  TestFullLifecyclePicksHighestCombinedScore();
  TestTieGoesToEarlierSubmission();
  TestOfferPeriodBoundaries();
  TestCreateTenderValidation();
  TestSubmitOfferValidation();
  TestEvaluationRules();
  TestMarkAsEvaluatedRequiresEveryOffer();
  TestCalculateWinnerOnlyOnce();
  TestZeroOfferTenderStaysOpen();
  TestProjections();
  TestFinalizedTenderIsTerminal();
  TestUnknownTendersDoNotGrowLockTable();
  TestTendersAlreadyInStoreAreRegisteredOnUse();
  TestRenouncedAuthorityBlocksAuthorityOperations();

  std::cout << "tender_manager_unit_tender_lifecycle: pass\n";
  return 0;
}
