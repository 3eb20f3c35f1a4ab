#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace tender::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTender(Transaction& t, const model::TenderRecord& r) {
  auto& tx = TX(t);
  if (tx.View().tenders.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "tender " + std::to_string(r.id) + " exists");
  tx.InsertTender(r.id).tender = r;
  return Result::Ok();
}

std::optional<model::TenderRecord> MemoryRepository::GetTender(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.tenders.find(id);
  if (it == s.tenders.end()) return std::nullopt;
  return it->second.tender;
}

Result MemoryRepository::UpdateTender(Transaction& t, const model::TenderRecord& r) {
  auto* slot = TX(t).MutableTender(r.id);
  if (!slot) return Result::Err(ErrorCode::NotFound);
  slot->tender = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountTenders(Transaction& t) {
  return TX(t).View().tenders.size();
}

std::vector<model::TenderRecord> MemoryRepository::ListTenders(Transaction& t, uint64_t offset, uint64_t limit) {
  const auto&                      s = TX(t).View();
  std::vector<model::TenderRecord> out;
  uint64_t                         index = 0;
  for (const auto& [_, slot] : s.tenders) {
    if (index++ < offset) continue;
    if (limit != 0 && out.size() >= limit) break;
    out.push_back(slot.tender);
  }
  return out;
}

Result MemoryRepository::InsertOffer(Transaction& t, model::OfferRecord& r) {
  auto* slot = TX(t).MutableTender(r.tender_id);
  if (!slot) return Result::Err(ErrorCode::NotFound, "tender " + std::to_string(r.tender_id) + " not found");
  if (slot->offers.contains(r.provider)) return Result::Err(ErrorCode::AlreadyExists);

  r.sequence = slot->participants.size();
  slot->offers[r.provider] = r;
  slot->participants.push_back(r.provider);
  return Result::Ok();
}

std::optional<model::OfferRecord> MemoryRepository::GetOffer(Transaction& t, uint64_t tender_id, const std::string& provider) {
  const auto& s  = TX(t).View();
  auto        it = s.tenders.find(tender_id);
  if (it == s.tenders.end()) return std::nullopt;
  auto offer = it->second.offers.find(provider);
  if (offer == it->second.offers.end()) return std::nullopt;
  return offer->second;
}

Result MemoryRepository::UpdateOffer(Transaction& t, const model::OfferRecord& r) {
  auto* slot = TX(t).MutableTender(r.tender_id);
  if (!slot) return Result::Err(ErrorCode::NotFound);
  auto it = slot->offers.find(r.provider);
  if (it == slot->offers.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

std::vector<model::OfferRecord> MemoryRepository::ListOffers(Transaction& t, uint64_t tender_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::OfferRecord> out;
  auto                            it = s.tenders.find(tender_id);
  if (it == s.tenders.end()) return out;
  out.reserve(it->second.participants.size());
  for (const auto& provider : it->second.participants) {
    out.push_back(it->second.offers.at(provider));
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListParticipants(Transaction& t, uint64_t tender_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tenders.find(tender_id);
  if (it == s.tenders.end()) return {};
  return it->second.participants;
}

uint64_t MemoryRepository::CountOffers(Transaction& t) {
  uint64_t total = 0;
  for (const auto& [_, slot] : TX(t).View().tenders) {
    total += slot.offers.size();
  }
  return total;
}

std::optional<std::string> MemoryRepository::GetAuthority(Transaction& t) {
  return TX(t).View().authority;
}

Result MemoryRepository::SetAuthority(Transaction& t, const std::string& identity) {
  TX(t).MutableAccess().authority = identity;
  return Result::Ok();
}

Result MemoryRepository::InsertEvaluator(Transaction& t, const model::EvaluatorRecord& r) {
  auto& tx = TX(t);
  if (tx.View().evaluators.contains(r.identity)) return Result::Err(ErrorCode::AlreadyExists);
  tx.MutableAccess().evaluators[r.identity] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteEvaluator(Transaction& t, const std::string& identity) {
  auto& tx = TX(t);
  if (!tx.View().evaluators.contains(identity)) return Result::Err(ErrorCode::NotFound);
  tx.MutableAccess().evaluators.erase(identity);
  return Result::Ok();
}

bool MemoryRepository::HasEvaluator(Transaction& t, const std::string& identity) {
  return TX(t).View().evaluators.contains(identity);
}

std::vector<model::EvaluatorRecord> MemoryRepository::ListEvaluators(Transaction& t) {
  std::vector<model::EvaluatorRecord> out;
  for (const auto& [_, record] : TX(t).View().evaluators) {
    out.push_back(record);
  }
  return out;
}

} // namespace tender::db::memory
