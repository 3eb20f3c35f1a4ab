#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tender::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
