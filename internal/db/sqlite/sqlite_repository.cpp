#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>

#include "internal/db/sql/sql_queries.hpp"

namespace tender::db::sqlite {

using tender::db::ErrorCode;
using tender::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(SqliteTransaction& tx, const char* sql) {
    return Statement(tx.DB().Prepare(sql), &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order of SELECT_TENDER / LIST_TENDERS.
model::TenderRecord ReadTender(sqlite3_stmt* st) {
    model::TenderRecord r;
    r.id             = ColU64(st, 0);
    r.creator        = ColText(st, 1);
    r.description    = ColText(st, 2);
    r.max_price      = ColU64(st, 3);
    r.deadline_ms    = ColU64(st, 4);
    r.created_at_ms  = ColU64(st, 5);
    r.weight_price   = static_cast<uint32_t>(ColI32(st, 6));
    r.weight_quality = static_cast<uint32_t>(ColI32(st, 7));
    r.status         = static_cast<tender::manager::core::v1::TenderStatus>(ColI32(st, 8));
    if (sqlite3_column_type(st, 9) != SQLITE_NULL) r.winner = ColText(st, 9);
    r.version        = ColU64(st, 10);
    return r;
}

// Column order of SELECT_OFFER / LIST_OFFERS.
model::OfferRecord ReadOffer(sqlite3_stmt* st) {
    model::OfferRecord r;
    r.tender_id               = ColU64(st, 0);
    r.provider                = ColText(st, 1);
    r.price                   = ColU64(st, 2);
    r.documentation_reference = ColText(st, 3);
    r.quality_score           = static_cast<uint32_t>(ColI32(st, 4));
    r.evaluated               = ColI32(st, 5) != 0;
    r.sequence                = ColU64(st, 6);
    r.submitted_at_ms         = ColU64(st, 7);
    r.evaluated_by            = ColText(st, 8);
    r.evaluated_at_ms         = ColU64(st, 9);
    return r;
}

uint64_t ScalarU64(SqliteTransaction& tx, const char* sql) {
    auto st = Prepare(tx, sql);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Tenders
// ------------------------------------------------------------------

Result SqliteRepository::InsertTender(Transaction& t, const model::TenderRecord& r) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::INSERT_TENDER);

    BindU64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.creator);
    BindText(st.get(), 3, r.description);
    BindU64(st.get(), 4, r.max_price);
    BindU64(st.get(), 5, r.deadline_ms);
    BindU64(st.get(), 6, r.created_at_ms);
    BindI32(st.get(), 7, static_cast<int>(r.weight_price));
    BindI32(st.get(), 8, static_cast<int>(r.weight_quality));
    BindI32(st.get(), 9, static_cast<int>(r.status));
    if (r.winner) BindText(st.get(), 10, *r.winner);
    else sqlite3_bind_null(st.get(), 10);
    BindU64(st.get(), 11, r.version);

    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::TenderRecord> SqliteRepository::GetTender(Transaction& t, uint64_t id) {
    auto st = Prepare(TX(t), sql::SELECT_TENDER);
    BindU64(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadTender(st.get());
}

Result SqliteRepository::UpdateTender(Transaction& t, const model::TenderRecord& r) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::UPDATE_TENDER);

    // Only lifecycle columns change after creation.
    BindI32(st.get(), 1, static_cast<int>(r.status));
    if (r.winner) BindText(st.get(), 2, *r.winner);
    else sqlite3_bind_null(st.get(), 2);
    BindU64(st.get(), 3, r.version);
    BindU64(st.get(), 4, r.id);

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (result && sqlite3_changes(tx.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

uint64_t SqliteRepository::CountTenders(Transaction& t) {
    return ScalarU64(TX(t), sql::COUNT_TENDERS);
}

std::vector<model::TenderRecord> SqliteRepository::ListTenders(Transaction& t, uint64_t offset, uint64_t limit) {
    // SQLite reads a negative OFFSET as 0 and a negative LIMIT as unbounded,
    // so both are clamped to INT64_MAX before binding.
    constexpr uint64_t kMaxBound = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());

    auto st = Prepare(TX(t), sql::LIST_TENDERS);
    sqlite3_bind_int64(st.get(), 1, limit == 0 ? -1 : static_cast<sqlite3_int64>(std::min(limit, kMaxBound)));
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(std::min(offset, kMaxBound)));

    std::vector<model::TenderRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadTender(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Offers
// ------------------------------------------------------------------

Result SqliteRepository::InsertOffer(Transaction& t, model::OfferRecord& r) {
    auto& tx = TX(t);

    {
        auto exists = Prepare(tx, sql::TENDER_EXISTS);
        BindU64(exists.get(), 1, r.tender_id);
        if (sqlite3_step(exists.get()) != SQLITE_ROW) {
            return Result::Err(ErrorCode::NotFound, "tender " + std::to_string(r.tender_id) + " not found");
        }
    }

    {
        auto seq = Prepare(tx, sql::NEXT_OFFER_SEQUENCE);
        BindU64(seq.get(), 1, r.tender_id);
        if (sqlite3_step(seq.get()) != SQLITE_ROW) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(tx.Handle()));
        r.sequence = ColU64(seq.get(), 0);
    }

    auto st = Prepare(tx, sql::INSERT_OFFER);
    BindU64(st.get(), 1, r.tender_id);
    BindText(st.get(), 2, r.provider);
    BindU64(st.get(), 3, r.price);
    BindText(st.get(), 4, r.documentation_reference);
    BindI32(st.get(), 5, static_cast<int>(r.quality_score));
    BindI32(st.get(), 6, r.evaluated ? 1 : 0);
    BindU64(st.get(), 7, r.sequence);
    BindU64(st.get(), 8, r.submitted_at_ms);
    BindText(st.get(), 9, r.evaluated_by);
    BindU64(st.get(), 10, r.evaluated_at_ms);

    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

std::optional<model::OfferRecord> SqliteRepository::GetOffer(Transaction& t, uint64_t tender_id, const std::string& provider) {
    auto st = Prepare(TX(t), sql::SELECT_OFFER);
    BindU64(st.get(), 1, tender_id);
    BindText(st.get(), 2, provider);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadOffer(st.get());
}

Result SqliteRepository::UpdateOffer(Transaction& t, const model::OfferRecord& r) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::UPDATE_OFFER);

    BindI32(st.get(), 1, static_cast<int>(r.quality_score));
    BindI32(st.get(), 2, r.evaluated ? 1 : 0);
    BindText(st.get(), 3, r.evaluated_by);
    BindU64(st.get(), 4, r.evaluated_at_ms);
    BindU64(st.get(), 5, r.tender_id);
    BindText(st.get(), 6, r.provider);

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (result && sqlite3_changes(tx.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

std::vector<model::OfferRecord> SqliteRepository::ListOffers(Transaction& t, uint64_t tender_id) {
    auto st = Prepare(TX(t), sql::LIST_OFFERS);
    BindU64(st.get(), 1, tender_id);

    std::vector<model::OfferRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadOffer(st.get()));
    }
    return out;
}

std::vector<std::string> SqliteRepository::ListParticipants(Transaction& t, uint64_t tender_id) {
    auto st = Prepare(TX(t), sql::LIST_PARTICIPANTS);
    BindU64(st.get(), 1, tender_id);

    std::vector<std::string> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    return out;
}

uint64_t SqliteRepository::CountOffers(Transaction& t) {
    return ScalarU64(TX(t), sql::COUNT_OFFERS);
}

// ------------------------------------------------------------------
// Access control
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetAuthority(Transaction& t) {
    auto st = Prepare(TX(t), sql::SELECT_AUTHORITY);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ColText(st.get(), 0);
}

Result SqliteRepository::SetAuthority(Transaction& t, const std::string& identity) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::UPSERT_AUTHORITY);
    BindText(st.get(), 1, identity);
    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

Result SqliteRepository::InsertEvaluator(Transaction& t, const model::EvaluatorRecord& r) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::INSERT_EVALUATOR);
    BindText(st.get(), 1, r.identity);
    BindText(st.get(), 2, r.added_by);
    BindU64(st.get(), 3, r.added_at_ms);
    return Translate(tx.Handle(), sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteEvaluator(Transaction& t, const std::string& identity) {
    auto& tx = TX(t);
    auto  st = Prepare(tx, sql::DELETE_EVALUATOR);
    BindText(st.get(), 1, identity);

    auto result = Translate(tx.Handle(), sqlite3_step(st.get()));
    if (result && sqlite3_changes(tx.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
    return result;
}

bool SqliteRepository::HasEvaluator(Transaction& t, const std::string& identity) {
    auto st = Prepare(TX(t), sql::SELECT_EVALUATOR);
    BindText(st.get(), 1, identity);
    return sqlite3_step(st.get()) == SQLITE_ROW;
}

std::vector<model::EvaluatorRecord> SqliteRepository::ListEvaluators(Transaction& t) {
    auto st = Prepare(TX(t), sql::LIST_EVALUATORS);

    std::vector<model::EvaluatorRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::EvaluatorRecord r;
        r.identity    = ColText(st.get(), 0);
        r.added_by    = ColText(st.get(), 1);
        r.added_at_ms = ColU64(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace tender::db::sqlite
