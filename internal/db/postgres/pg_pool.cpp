#include "pg_pool.hpp"

namespace tender::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_tender",
               "INSERT INTO tenders(id,creator,description,max_price,deadline_ms,created_at_ms,"
               "weight_price,weight_quality,status,winner,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("get_tender",
               "SELECT id,creator,description,max_price,deadline_ms,created_at_ms,"
               "weight_price,weight_quality,status,winner,version "
               "FROM tenders WHERE id=$1");

  conn.prepare("update_tender", "UPDATE tenders SET status=$2,winner=$3,version=$4 WHERE id=$1");

  conn.prepare("list_tenders",
               "SELECT id,creator,description,max_price,deadline_ms,created_at_ms,"
               "weight_price,weight_quality,status,winner,version "
               "FROM tenders ORDER BY id ASC LIMIT $1 OFFSET $2");

  // Row lock on the tender serializes sequence allocation across processes.
  conn.prepare("lock_tender", "SELECT id FROM tenders WHERE id=$1 FOR UPDATE");
  conn.prepare("next_offer_sequence", "SELECT COUNT(*) FROM offers WHERE tender_id=$1");

  conn.prepare("insert_offer",
               "INSERT INTO offers(tender_id,provider,price,documentation_reference,quality_score,"
               "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_offer",
               "SELECT tender_id,provider,price,documentation_reference,quality_score,"
               "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms "
               "FROM offers WHERE tender_id=$1 AND provider=$2");

  conn.prepare("update_offer",
               "UPDATE offers SET quality_score=$3,evaluated=$4,evaluated_by=$5,evaluated_at_ms=$6 "
               "WHERE tender_id=$1 AND provider=$2");

  conn.prepare("list_offers",
               "SELECT tender_id,provider,price,documentation_reference,quality_score,"
               "evaluated,sequence,submitted_at_ms,evaluated_by,evaluated_at_ms "
               "FROM offers WHERE tender_id=$1 ORDER BY sequence ASC");

  conn.prepare("list_participants", "SELECT provider FROM offers WHERE tender_id=$1 ORDER BY sequence ASC");

  conn.prepare("upsert_authority",
               "INSERT INTO access_settings(id,authority) VALUES(1,$1) "
               "ON CONFLICT(id) DO UPDATE SET authority=EXCLUDED.authority");

  conn.prepare("insert_evaluator", "INSERT INTO evaluators(identity,added_by,added_at_ms) VALUES($1,$2,$3)");

  conn.prepare("delete_evaluator", "DELETE FROM evaluators WHERE identity=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace tender::db::postgres
