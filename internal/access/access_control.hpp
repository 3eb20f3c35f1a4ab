#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace tender::access {

// Operation kinds that require an authorization decision.
enum class Operation {
  kCreateTender,
  kSubmitOffer,
  kCloseOfferPeriod,
  kEvaluateOffer,
  kMarkAsEvaluated,
  kCalculateWinner,
  kManageEvaluators,
  kManageAuthority,
};

std::string_view OperationName(Operation op);

/*
  AccessControl

  One authority identity plus a set of evaluator identities, both persisted
  through the repository.

  Locking:
    Mutex() is held shared by every authorized operation for its whole
    duration and exclusively by the mutations below, so a role change never
    interleaves with a decision that depends on it. Callers acquire it
    before any per-tender lock.
*/
class AccessControl {
 public:
  AccessControl(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock);

  // Throws util::Unauthorized. Caller must hold Mutex() (shared or unique).
  void Authorize(db::Transaction& tx, const std::string& caller, Operation op) const;

  // Writes the configured roles into a store that was never initialized.
  // Returns false when the store already carries access state.
  bool Bootstrap(const std::string& authority, const std::vector<std::string>& evaluators);

  void AddEvaluator(const std::string& caller, const std::string& identity);
  void RemoveEvaluator(const std::string& caller, const std::string& identity);
  void TransferAuthority(const std::string& caller, const std::string& new_authority);
  void RenounceAuthority(const std::string& caller);

  bool                     IsEvaluator(const std::string& identity) const;
  std::vector<std::string> ListEvaluators() const;

  // Empty when renounced.
  std::string Authority() const;

  std::shared_mutex& Mutex() const {
    return mutex_;
  }

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;

  mutable std::shared_mutex mutex_;
};

} // namespace tender::access
