#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "internal/access/access_control.hpp"
#include "internal/core/tender_locks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace tender::core {

// Shared by the four lifecycle components; all of them see the same store,
// the same lock table and the same clock.
struct CoreContext {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<access::AccessControl> access;
  std::shared_ptr<TenderLocks>           locks;
  std::shared_ptr<util::TimeSource>      clock;
};

/*
  Locks the mutex of tender_id with Lock (std::unique_lock or
  std::shared_lock over std::shared_mutex).

  Tenders already in the store but not registered yet (written before a
  restart or by another process) are registered from the repository
  count. Unknown ids lock the shared unallocated mutex, so lookups of ids
  that do not exist never grow the table.
*/
template <typename Lock>
Lock LockTender(const CoreContext& ctx, uint64_t tender_id) {
  if (tender_id != 0 && !ctx.locks->For(tender_id)) {
    auto       tx    = ctx.repository->Begin();
    const auto count = ctx.repository->CountTenders(*tx);
    tx->Commit();
    ctx.locks->Register(count);
  }

  for (;;) {
    if (auto mutex = ctx.locks->For(tender_id)) {
      return Lock(*mutex);
    }
    Lock unallocated(ctx.locks->Unallocated());
    // A concurrent CreateTender may have registered the id in between.
    if (!ctx.locks->For(tender_id)) {
      return unallocated;
    }
  }
}

} // namespace tender::core
