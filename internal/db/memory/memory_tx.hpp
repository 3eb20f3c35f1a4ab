#pragma once

#include <set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tender::db::memory {

/*
  Transaction = snapshot + write set

  Commit merges only the tenders (and access state) this transaction
  touched, so transactions on different tenders never conflict. A touched
  tender whose committed revision moved since the snapshot aborts the
  commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  // nullptr when the tender does not exist in this transaction's view.
  MemoryRepository::TenderSlot* MutableTender(uint64_t id);
  MemoryRepository::TenderSlot& InsertTender(uint64_t id);
  MemoryRepository::State&      MutableAccess();

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::set<uint64_t> touched_tenders_;
  std::set<uint64_t> inserted_tenders_;
  bool               access_touched_ = false;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace tender::db::memory
