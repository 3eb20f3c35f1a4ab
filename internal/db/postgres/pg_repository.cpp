#include "pg_repository.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>

#include "tender/manager/core/v1/types.pb.h"

namespace tender::db::postgres {

namespace {

std::optional<std::string> NullableText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::TenderRecord ReadTender(const pqxx::row& row) {
  model::TenderRecord r;
  r.id             = row[0].as<uint64_t>();
  r.creator        = row[1].c_str();
  r.description    = row[2].c_str();
  r.max_price      = row[3].as<uint64_t>();
  r.deadline_ms    = row[4].as<uint64_t>();
  r.created_at_ms  = row[5].as<uint64_t>();
  r.weight_price   = row[6].as<uint32_t>();
  r.weight_quality = row[7].as<uint32_t>();
  r.status         = (tender::manager::core::v1::TenderStatus)row[8].as<int>();
  r.winner         = NullableText(row[9]);
  r.version        = row[10].as<uint64_t>();
  return r;
}

model::OfferRecord ReadOffer(const pqxx::row& row) {
  model::OfferRecord r;
  r.tender_id               = row[0].as<uint64_t>();
  r.provider                = row[1].c_str();
  r.price                   = row[2].as<uint64_t>();
  r.documentation_reference = row[3].c_str();
  r.quality_score           = row[4].as<uint32_t>();
  r.evaluated               = row[5].as<bool>();
  r.sequence                = row[6].as<uint64_t>();
  r.submitted_at_ms         = row[7].as<uint64_t>();
  r.evaluated_by            = row[8].c_str();
  r.evaluated_at_ms         = row[9].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tenders
// ------------------------------------------------------------------

Result PgRepository::InsertTender(Transaction& t, const model::TenderRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_tender", r.id, r.creator, r.description, r.max_price, r.deadline_ms, r.created_at_ms, r.weight_price,
                               r.weight_quality, (int)r.status, r.winner, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TenderRecord> PgRepository::GetTender(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_tender", id);
  if (res.empty()) return std::nullopt;
  return ReadTender(res[0]);
}

Result PgRepository::UpdateTender(Transaction& t, const model::TenderRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_tender", r.id, (int)r.status, r.winner, r.version);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountTenders(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM tenders;");
  return res[0][0].as<uint64_t>();
}

std::vector<model::TenderRecord> PgRepository::ListTenders(Transaction& t, uint64_t offset, uint64_t limit) {
  // LIMIT NULL is LIMIT ALL. Both bounds are BIGINT on the server.
  constexpr uint64_t kMaxBound = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

  std::optional<int64_t> bounded;
  if (limit != 0) bounded = static_cast<int64_t>(std::min(limit, kMaxBound));
  auto res = TX(t).Work().exec_prepared("list_tenders", bounded, static_cast<int64_t>(std::min(offset, kMaxBound)));

  std::vector<model::TenderRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTender(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result PgRepository::InsertOffer(Transaction& t, model::OfferRecord& r) {
  try {
    auto& work = TX(t).Work();
    if (work.exec_prepared("lock_tender", r.tender_id).empty()) {
      return Result::Err(ErrorCode::NotFound, "tender " + std::to_string(r.tender_id) + " not found");
    }
    r.sequence = work.exec_prepared("next_offer_sequence", r.tender_id)[0][0].as<uint64_t>();
    work.exec_prepared("insert_offer", r.tender_id, r.provider, r.price, r.documentation_reference, r.quality_score, r.evaluated, r.sequence,
                       r.submitted_at_ms, r.evaluated_by, r.evaluated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OfferRecord> PgRepository::GetOffer(Transaction& t, uint64_t tender_id, const std::string& provider) {
  auto res = TX(t).Work().exec_prepared("get_offer", tender_id, provider);
  if (res.empty()) return std::nullopt;
  return ReadOffer(res[0]);
}

Result PgRepository::UpdateOffer(Transaction& t, const model::OfferRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_offer", r.tender_id, r.provider, r.quality_score, r.evaluated, r.evaluated_by, r.evaluated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OfferRecord> PgRepository::ListOffers(Transaction& t, uint64_t tender_id) {
  auto res = TX(t).Work().exec_prepared("list_offers", tender_id);

  std::vector<model::OfferRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadOffer(row));
  }
  return out;
}

std::vector<std::string> PgRepository::ListParticipants(Transaction& t, uint64_t tender_id) {
  auto res = TX(t).Work().exec_prepared("list_participants", tender_id);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

uint64_t PgRepository::CountOffers(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM offers;");
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Access control
// ------------------------------------------------------------------

std::optional<std::string> PgRepository::GetAuthority(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT authority FROM access_settings WHERE id=1;");
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::SetAuthority(Transaction& t, const std::string& identity) {
  try {
    TX(t).Work().exec_prepared("upsert_authority", identity);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertEvaluator(Transaction& t, const model::EvaluatorRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_evaluator", r.identity, r.added_by, r.added_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEvaluator(Transaction& t, const std::string& identity) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_evaluator", identity);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasEvaluator(Transaction& t, const std::string& identity) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM evaluators WHERE identity=$1;", identity);
  return !res.empty();
}

std::vector<model::EvaluatorRecord> PgRepository::ListEvaluators(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT identity,added_by,added_at_ms FROM evaluators ORDER BY identity ASC;");

  std::vector<model::EvaluatorRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EvaluatorRecord r;
    r.identity    = row[0].c_str();
    r.added_by    = row[1].c_str();
    r.added_at_ms = row[2].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace tender::db::postgres
