#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace tender::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::TenderSlot* MemoryTransaction::MutableTender(uint64_t id) {
  auto it = working_.tenders.find(id);
  if (it == working_.tenders.end()) return nullptr;
  touched_tenders_.insert(id);
  return &it->second;
}

MemoryRepository::TenderSlot& MemoryTransaction::InsertTender(uint64_t id) {
  touched_tenders_.insert(id);
  inserted_tenders_.insert(id);
  return working_.tenders[id];
}

MemoryRepository::State& MemoryTransaction::MutableAccess() {
  access_touched_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  auto&            committed = repo_.committed_;

  for (const auto id : touched_tenders_) {
    const auto current = committed.tenders.find(id);
    if (inserted_tenders_.contains(id)) {
      if (current != committed.tenders.end()) {
        throw std::runtime_error("transaction conflict: tender " + std::to_string(id) + " was created by a concurrent transaction");
      }
      continue;
    }
    if (current == committed.tenders.end() || current->second.revision != working_.tenders.at(id).revision) {
      throw std::runtime_error("transaction conflict: tender " + std::to_string(id) + " was modified by a concurrent transaction");
    }
  }
  if (access_touched_ && committed.access_revision != working_.access_revision) {
    throw std::runtime_error("transaction conflict: access control state was modified by a concurrent transaction");
  }

  for (const auto id : touched_tenders_) {
    auto slot = std::move(working_.tenders.at(id));
    slot.revision++;
    committed.tenders[id] = std::move(slot);
  }
  if (access_touched_) {
    committed.authority  = std::move(working_.authority);
    committed.evaluators = std::move(working_.evaluators);
    committed.access_revision++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace tender::db::memory
