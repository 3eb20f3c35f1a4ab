#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/evaluator_record.hpp"
#include "internal/db/model/offer_record.hpp"
#include "internal/db/model/tender_record.hpp"

namespace tender::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Nothing is ever deleted except evaluator memberships
  - An offer insert and its participant-list append are one write

  The DB is the source of truth for:
    tender state
    offers and participant order
    authority and evaluator set
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tenders
  // ---------------------------------------------------------------------

  // Fails with AlreadyExists if the id is taken.
  virtual Result InsertTender(Transaction&, const model::TenderRecord&) = 0;

  virtual std::optional<model::TenderRecord> GetTender(Transaction&, uint64_t id) = 0;

  virtual Result UpdateTender(Transaction&, const model::TenderRecord&) = 0;

  virtual uint64_t CountTenders(Transaction&) = 0;

  // Ascending id order. limit == 0 returns everything after offset.
  virtual std::vector<model::TenderRecord> ListTenders(Transaction&, uint64_t offset, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Offers / participants
  // ---------------------------------------------------------------------

  // Assigns record.sequence (next participant position) and appends the
  // provider to the tender's participant list.
  virtual Result InsertOffer(Transaction&, model::OfferRecord& record) = 0;

  virtual std::optional<model::OfferRecord> GetOffer(Transaction&, uint64_t tender_id, const std::string& provider) = 0;

  virtual Result UpdateOffer(Transaction&, const model::OfferRecord&) = 0;

  // Submission order.
  virtual std::vector<model::OfferRecord> ListOffers(Transaction&, uint64_t tender_id) = 0;

  // Submission order.
  virtual std::vector<std::string> ListParticipants(Transaction&, uint64_t tender_id) = 0;

  virtual uint64_t CountOffers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Access control
  // ---------------------------------------------------------------------

  // nullopt: never initialized. Empty string: renounced.
  virtual std::optional<std::string> GetAuthority(Transaction&) = 0;

  virtual Result SetAuthority(Transaction&, const std::string& identity) = 0;

  virtual Result InsertEvaluator(Transaction&, const model::EvaluatorRecord&) = 0;

  virtual Result DeleteEvaluator(Transaction&, const std::string& identity) = 0;

  virtual bool HasEvaluator(Transaction&, const std::string& identity) = 0;

  // Sorted by identity.
  virtual std::vector<model::EvaluatorRecord> ListEvaluators(Transaction&) = 0;
};

} // namespace tender::db
