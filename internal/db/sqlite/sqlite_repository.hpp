#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tender::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTender(Transaction&, const model::TenderRecord&) override;
  std::optional<model::TenderRecord> GetTender(Transaction&, uint64_t id) override;
  Result UpdateTender(Transaction&, const model::TenderRecord&) override;
  uint64_t CountTenders(Transaction&) override;
  std::vector<model::TenderRecord> ListTenders(Transaction&, uint64_t offset, uint64_t limit) override;

  Result InsertOffer(Transaction&, model::OfferRecord& record) override;
  std::optional<model::OfferRecord> GetOffer(Transaction&, uint64_t tender_id,
                                             const std::string& provider) override;
  Result UpdateOffer(Transaction&, const model::OfferRecord&) override;
  std::vector<model::OfferRecord> ListOffers(Transaction&, uint64_t tender_id) override;
  std::vector<std::string> ListParticipants(Transaction&, uint64_t tender_id) override;
  uint64_t CountOffers(Transaction&) override;

  std::optional<std::string> GetAuthority(Transaction&) override;
  Result SetAuthority(Transaction&, const std::string& identity) override;
  Result InsertEvaluator(Transaction&, const model::EvaluatorRecord&) override;
  Result DeleteEvaluator(Transaction&, const std::string& identity) override;
  bool HasEvaluator(Transaction&, const std::string& identity) override;
  std::vector<model::EvaluatorRecord> ListEvaluators(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
