#include "access_control.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace tender::access {

namespace {

bool IsAuthorityOnly(Operation op) {
  switch (op) {
    case Operation::kCreateTender:
    case Operation::kCloseOfferPeriod:
    case Operation::kMarkAsEvaluated:
    case Operation::kCalculateWinner:
    case Operation::kManageEvaluators:
    case Operation::kManageAuthority:
      return true;
    case Operation::kSubmitOffer:
    case Operation::kEvaluateOffer:
      return false;
  }
  return true;
}

} // namespace

std::string_view OperationName(Operation op) {
  switch (op) {
    case Operation::kCreateTender:
      return "create_tender";
    case Operation::kSubmitOffer:
      return "submit_offer";
    case Operation::kCloseOfferPeriod:
      return "close_offer_period";
    case Operation::kEvaluateOffer:
      return "evaluate_offer";
    case Operation::kMarkAsEvaluated:
      return "mark_as_evaluated";
    case Operation::kCalculateWinner:
      return "calculate_winner";
    case Operation::kManageEvaluators:
      return "manage_evaluators";
    case Operation::kManageAuthority:
      return "manage_authority";
  }
  return "unknown";
}

AccessControl::AccessControl(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void AccessControl::Authorize(db::Transaction& tx, const std::string& caller, Operation op) const {
  const auto name = std::string(OperationName(op));
  if (caller.empty()) {
    throw util::Unauthorized(name + ": caller identity is required");
  }

  if (IsAuthorityOnly(op)) {
    const auto authority = repository_->GetAuthority(tx);
    // A renounced (empty) authority matches nobody.
    if (!authority || authority->empty() || *authority != caller) {
      throw util::Unauthorized(name + ": caller is not the authority");
    }
    return;
  }

  if (op == Operation::kEvaluateOffer && !repository_->HasEvaluator(tx, caller)) {
    throw util::Unauthorized(name + ": caller is not an evaluator");
  }
}

bool AccessControl::Bootstrap(const std::string& authority, const std::vector<std::string>& evaluators) {
  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();

  if (repository_->GetAuthority(*tx)) {
    return false;
  }
  if (authority.empty()) {
    throw util::InvalidInput("bootstrap: an authority identity is required for a fresh store");
  }

  util::ThrowIfDbError(repository_->SetAuthority(*tx, authority), "bootstrap authority");
  for (const auto& identity : evaluators) {
    if (identity.empty() || repository_->HasEvaluator(*tx, identity)) {
      continue;
    }
    db::model::EvaluatorRecord record;
    record.identity    = identity;
    record.added_by    = authority;
    record.added_at_ms = clock_->NowMillis();
    util::ThrowIfDbError(repository_->InsertEvaluator(*tx, record), "bootstrap evaluator");
  }
  tx->Commit();

  TENDER_LOG_INFO("access control bootstrapped",
                  {observability::StringField("authority", authority), observability::IntField("evaluators", static_cast<std::int64_t>(evaluators.size()))});
  return true;
}

void AccessControl::AddEvaluator(const std::string& caller, const std::string& identity) {
  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();
  Authorize(*tx, caller, Operation::kManageEvaluators);

  if (identity.empty()) {
    throw util::InvalidInput("add evaluator: identity is required");
  }
  if (repository_->HasEvaluator(*tx, identity)) {
    throw util::AlreadyExists("add evaluator: " + identity + " is already an evaluator");
  }

  db::model::EvaluatorRecord record;
  record.identity    = identity;
  record.added_by    = caller;
  record.added_at_ms = clock_->NowMillis();
  util::ThrowIfDbError(repository_->InsertEvaluator(*tx, record), "add evaluator");
  tx->Commit();

  TENDER_LOG_INFO("evaluator added", {observability::StringField("evaluator", identity), observability::StringField("by", caller)});
}

void AccessControl::RemoveEvaluator(const std::string& caller, const std::string& identity) {
  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();
  Authorize(*tx, caller, Operation::kManageEvaluators);

  if (!repository_->HasEvaluator(*tx, identity)) {
    throw util::NotFound("remove evaluator: " + identity + " is not an evaluator");
  }
  util::ThrowIfDbError(repository_->DeleteEvaluator(*tx, identity), "remove evaluator");
  tx->Commit();

  TENDER_LOG_INFO("evaluator removed", {observability::StringField("evaluator", identity), observability::StringField("by", caller)});
}

void AccessControl::TransferAuthority(const std::string& caller, const std::string& new_authority) {
  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();
  Authorize(*tx, caller, Operation::kManageAuthority);

  if (new_authority.empty()) {
    throw util::InvalidInput("transfer authority: new authority is required");
  }
  util::ThrowIfDbError(repository_->SetAuthority(*tx, new_authority), "transfer authority");
  tx->Commit();

  TENDER_LOG_INFO("authority transferred", {observability::StringField("from", caller), observability::StringField("to", new_authority)});
}

void AccessControl::RenounceAuthority(const std::string& caller) {
  std::unique_lock lock(mutex_);
  auto             tx = repository_->Begin();
  Authorize(*tx, caller, Operation::kManageAuthority);

  util::ThrowIfDbError(repository_->SetAuthority(*tx, ""), "renounce authority");
  tx->Commit();

  TENDER_LOG_WARN("authority renounced", {observability::StringField("by", caller)});
}

bool AccessControl::IsEvaluator(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  auto             tx = repository_->Begin();
  return repository_->HasEvaluator(*tx, identity);
}

std::vector<std::string> AccessControl::ListEvaluators() const {
  std::shared_lock lock(mutex_);
  auto             tx = repository_->Begin();

  std::vector<std::string> identities;
  for (const auto& record : repository_->ListEvaluators(*tx)) {
    identities.push_back(record.identity);
  }
  return identities;
}

std::string AccessControl::Authority() const {
  std::shared_lock lock(mutex_);
  auto             tx = repository_->Begin();
  return repository_->GetAuthority(*tx).value_or("");
}

} // namespace tender::access
