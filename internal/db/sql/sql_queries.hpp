#pragma once

namespace tender::db::sql {

/*
  SQL used by the SQLite backend.

  Postgres uses the same statements with $n placeholders, installed as
  prepared statements per connection (see PgPool).
*/

// tenders

static constexpr const char* INSERT_TENDER =
    "INSERT INTO tenders(id,creator,description,max_price,deadline_ms,created_at_ms,"
    "weight_price,weight_quality,status,winner,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TENDER =
    "SELECT id,creator,description,max_price,deadline_ms,created_at_ms,"
    "weight_price,weight_quality,status,winner,version"
    " FROM tenders WHERE id=?;";

static constexpr const char* UPDATE_TENDER =
    "UPDATE tenders SET status=?,winner=?,version=? WHERE id=?;";

static constexpr const char* COUNT_TENDERS =
    "SELECT COUNT(*) FROM tenders;";

static constexpr const char* LIST_TENDERS =
    "SELECT id,creator,description,max_price,deadline_ms,created_at_ms,"
    "weight_price,weight_quality,status,winner,version"
    " FROM tenders ORDER BY id ASC LIMIT ? OFFSET ?;";

// offers

static constexpr const char* TENDER_EXISTS =
    "SELECT 1 FROM tenders WHERE id=?;";

static constexpr const char* NEXT_OFFER_SEQUENCE =
    "SELECT COUNT(*) FROM offers WHERE tender_id=?;";

static constexpr const char* INSERT_OFFER =
    "INSERT INTO offers(tender_id,provider,price,documentation_reference,quality_score,"
    "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_OFFER =
    "SELECT tender_id,provider,price,documentation_reference,quality_score,"
    "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms"
    " FROM offers WHERE tender_id=? AND provider=?;";

static constexpr const char* UPDATE_OFFER =
    "UPDATE offers SET quality_score=?,evaluated=?,evaluated_by=?,evaluated_at_ms=?"
    " WHERE tender_id=? AND provider=?;";

static constexpr const char* LIST_OFFERS =
    "SELECT tender_id,provider,price,documentation_reference,quality_score,"
    "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms"
    " FROM offers WHERE tender_id=? ORDER BY sequence ASC;";

static constexpr const char* LIST_PARTICIPANTS =
    "SELECT provider FROM offers WHERE tender_id=? ORDER BY sequence ASC;";

static constexpr const char* COUNT_OFFERS =
    "SELECT COUNT(*) FROM offers;";

// access control

static constexpr const char* SELECT_AUTHORITY =
    "SELECT authority FROM access_settings WHERE id=1;";

static constexpr const char* UPSERT_AUTHORITY =
    "INSERT INTO access_settings(id,authority) VALUES(1,?)"
    " ON CONFLICT(id) DO UPDATE SET authority=excluded.authority;";

static constexpr const char* INSERT_EVALUATOR =
    "INSERT INTO evaluators(identity,added_by,added_at_ms) VALUES(?,?,?);";

static constexpr const char* DELETE_EVALUATOR =
    "DELETE FROM evaluators WHERE identity=?;";

static constexpr const char* SELECT_EVALUATOR =
    "SELECT 1 FROM evaluators WHERE identity=?;";

static constexpr const char* LIST_EVALUATORS =
    "SELECT identity,added_by,added_at_ms FROM evaluators ORDER BY identity ASC;";

} // namespace tender::db::sql
