#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tender::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Everything owned by one tender; the unit of conflict detection.
  struct TenderSlot {
    model::TenderRecord                       tender;
    std::map<std::string, model::OfferRecord> offers;        // by provider
    std::vector<std::string>                  participants;  // submission order
    uint64_t                                  revision = 0;
  };

  struct State {
    std::map<uint64_t, TenderSlot> tenders;

    std::optional<std::string>                    authority;
    std::map<std::string, model::EvaluatorRecord> evaluators;
    uint64_t                                      access_revision = 0;
  };

  std::mutex mutex_;
  State committed_;
};

}
