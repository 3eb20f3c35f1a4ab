#include "tender_registry.hpp"

#include <chrono>
#include <mutex>
#include <shared_mutex>

#include "internal/core/lifecycle.hpp"
#include "internal/model/scoring.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace tender::core {

using namespace tender::manager::v1;

namespace {

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

// Latest instant a protobuf Timestamp can carry (9999-12-31T23:59:59.999Z).
constexpr uint64_t kMaxDeadlineMs = 253402300799999ull;

db::model::TenderRecord LoadTender(db::Repository& repository, db::Transaction& tx, uint64_t tender_id, const std::string& operation) {
  auto record = repository.GetTender(tx, tender_id);
  if (!record) {
    throw util::NotFound(operation + ": tender " + std::to_string(tender_id) + " not found");
  }
  return *record;
}

} // namespace

TenderRegistry::TenderRegistry(CoreContext ctx) : ctx_(std::move(ctx)) {
}

Tender TenderRegistry::CreateTender(const std::string& caller, const std::string& description, uint64_t max_price, uint64_t deadline_days,
                                    uint32_t weight_price, uint32_t weight_quality) {
  std::shared_lock access_lock(ctx_.access->Mutex());
  std::lock_guard  creation_lock(ctx_.locks->CreationMutex());
  std::unique_lock unallocated_lock(ctx_.locks->Unallocated());

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kCreateTender);

  if (weight_price > model::kWeightTotal || weight_quality > model::kWeightTotal) {
    throw util::InvalidInput("create tender: weights must each be at most 100");
  }
  if (weight_price + weight_quality != model::kWeightTotal) {
    throw util::InvalidInput("create tender: weights must sum to 100");
  }
  if (max_price == 0) {
    throw util::InvalidInput("create tender: max price must be positive");
  }
  if (max_price > model::kMaxPrice) {
    throw util::InvalidInput("create tender: max price exceeds supported range");
  }
  if (description.empty()) {
    throw util::InvalidInput("create tender: description is required");
  }

  const auto now_ms = ctx_.clock->NowMillis();
  if (deadline_days == 0) {
    throw util::InvalidInput("create tender: deadline must be at least one day");
  }
  if (now_ms > kMaxDeadlineMs || deadline_days > (kMaxDeadlineMs - now_ms) / kDayMs) {
    throw util::InvalidInput("create tender: deadline is out of range");
  }

  db::model::TenderRecord record;
  record.id             = ctx_.repository->CountTenders(*tx) + 1;
  record.creator        = caller;
  record.description    = description;
  record.max_price      = max_price;
  record.deadline_ms    = now_ms + deadline_days * kDayMs;
  record.created_at_ms  = now_ms;
  record.weight_price   = weight_price;
  record.weight_quality = weight_quality;
  record.status         = TENDER_STATUS_OPEN;
  record.version        = 1;

  util::ThrowIfDbError(ctx_.repository->InsertTender(*tx, record), "create tender");
  tx->Commit();
  ctx_.locks->Register(record.id);

  NoteTransition(record, caller);
  return ToTender(record, 0);
}

Tender TenderRegistry::CloseOfferPeriod(const std::string& caller, uint64_t tender_id) {
  static const std::string kOperation = "close offer period";

  std::shared_lock access_lock(ctx_.access->Mutex());
  auto tender_lock = LockTender<std::unique_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kCloseOfferPeriod);

  auto record = LoadTender(*ctx_.repository, *tx, tender_id, kOperation);
  RequireStatus(record, TENDER_STATUS_OPEN, kOperation);

  if (ctx_.clock->NowMillis() <= record.deadline_ms) {
    throw util::DeadlineViolation(kOperation + ": offer period of tender " + std::to_string(tender_id) + " is still running");
  }

  const auto participants = ctx_.repository->ListParticipants(*tx, tender_id);
  if (participants.empty()) {
    throw util::InvalidInput(kOperation + ": tender " + std::to_string(tender_id) + " has no offers");
  }

  Advance(record, TENDER_STATUS_CLOSED, kOperation);
  util::ThrowIfDbError(ctx_.repository->UpdateTender(*tx, record), kOperation);
  tx->Commit();

  NoteTransition(record, caller);
  return ToTender(record, participants.size());
}

Tender TenderRegistry::MarkAsEvaluated(const std::string& caller, uint64_t tender_id) {
  static const std::string kOperation = "mark as evaluated";

  std::shared_lock access_lock(ctx_.access->Mutex());
  auto tender_lock = LockTender<std::unique_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, caller, access::Operation::kMarkAsEvaluated);

  auto record = LoadTender(*ctx_.repository, *tx, tender_id, kOperation);
  RequireStatus(record, TENDER_STATUS_CLOSED, kOperation);

  const auto offers = ctx_.repository->ListOffers(*tx, tender_id);
  if (offers.empty()) {
    throw util::InvalidInput(kOperation + ": tender " + std::to_string(tender_id) + " has no offers");
  }
  for (const auto& offer : offers) {
    if (!offer.evaluated) {
      throw util::InvalidInput(kOperation + ": not all offers are evaluated (" + offer.provider + " pending)");
    }
  }

  Advance(record, TENDER_STATUS_EVALUATED, kOperation);
  util::ThrowIfDbError(ctx_.repository->UpdateTender(*tx, record), kOperation);
  tx->Commit();

  NoteTransition(record, caller);
  return ToTender(record, offers.size());
}

Tender TenderRegistry::GetTender(uint64_t tender_id) {
  auto tender_lock = LockTender<std::shared_lock<std::shared_mutex>>(ctx_, tender_id);

  auto tx     = ctx_.repository->Begin();
  auto record = LoadTender(*ctx_.repository, *tx, tender_id, "get tender");
  return ToTender(record, ctx_.repository->ListParticipants(*tx, tender_id).size());
}

uint64_t TenderRegistry::TenderCount() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->CountTenders(*tx);
}

ListTendersResponse TenderRegistry::ListTenders(uint64_t offset, uint64_t limit) {
  auto tx = ctx_.repository->Begin();

  ListTendersResponse resp;
  resp.set_total(ctx_.repository->CountTenders(*tx));
  for (const auto& record : ctx_.repository->ListTenders(*tx, offset, limit)) {
    *resp.add_tenders() = ToTender(record, ctx_.repository->ListParticipants(*tx, record.id).size());
  }
  return resp;
}

} // namespace tender::core
