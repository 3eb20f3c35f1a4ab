#pragma once

#include <string>
#include <vector>

namespace tender::db::sql {

/*
  Tender schema, applied idempotently at startup.

  offers.sequence is the participant position inside its tender;
  (tender_id, sequence) is unique so the participant list can be read back
  in submission order with a plain ORDER BY.

  access_settings holds a single row (id = 1). Its absence means the store
  was never bootstrapped; an empty authority means it was renounced.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tenders (id INTEGER PRIMARY KEY, creator TEXT NOT NULL, description TEXT NOT NULL, max_price INTEGER NOT NULL, deadline_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, weight_price INTEGER NOT NULL, weight_quality INTEGER NOT NULL, status INTEGER NOT NULL, winner TEXT, version INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS offers (tender_id INTEGER NOT NULL REFERENCES tenders(id), provider TEXT NOT NULL, price INTEGER NOT NULL, documentation_reference TEXT NOT NULL, quality_score INTEGER NOT NULL DEFAULT 0, evaluated INTEGER NOT NULL DEFAULT 0, sequence INTEGER NOT NULL, submitted_at_ms INTEGER NOT NULL, evaluated_by TEXT NOT NULL DEFAULT '', evaluated_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (tender_id, provider), UNIQUE (tender_id, sequence));",
      "CREATE TABLE IF NOT EXISTS evaluators (identity TEXT PRIMARY KEY, added_by TEXT NOT NULL, added_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS access_settings (id INTEGER PRIMARY KEY CHECK (id = 1), authority TEXT NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tenders (id BIGINT PRIMARY KEY, creator TEXT NOT NULL, description TEXT NOT NULL, max_price BIGINT NOT NULL, deadline_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, weight_price INTEGER NOT NULL, weight_quality INTEGER NOT NULL, status SMALLINT NOT NULL, winner TEXT, version BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS offers (tender_id BIGINT NOT NULL REFERENCES tenders(id), provider TEXT NOT NULL, price BIGINT NOT NULL, documentation_reference TEXT NOT NULL, quality_score INTEGER NOT NULL DEFAULT 0, evaluated BOOLEAN NOT NULL DEFAULT FALSE, sequence BIGINT NOT NULL, submitted_at_ms BIGINT NOT NULL, evaluated_by TEXT NOT NULL DEFAULT '', evaluated_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (tender_id, provider), UNIQUE (tender_id, sequence));",
      "CREATE TABLE IF NOT EXISTS evaluators (identity TEXT PRIMARY KEY, added_by TEXT NOT NULL, added_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS access_settings (id SMALLINT PRIMARY KEY CHECK (id = 1), authority TEXT NOT NULL);"};
  return kSchema;
}

} // namespace tender::db::sql
