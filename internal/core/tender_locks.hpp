#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace tender::core {

/*
  Per-tender lock table.

  Mutations of a tender hold its mutex exclusively, reads hold it shared.
  Operations on different tenders never contend. Tender ids are dense, so
  the table holds one entry per registered tender and nothing else. Ids
  past the last registered tender share the unallocated mutex, which
  CreateTender holds exclusively while it allocates the next id.
*/
class TenderLocks {
 public:
  // nullptr when tender_id is 0 or not registered yet.
  std::shared_ptr<std::shared_mutex> For(uint64_t tender_id) const;

  // Registers tenders 1..count. Never shrinks.
  void Register(uint64_t count);

  std::size_t Size() const;

  std::shared_mutex& Unallocated() {
    return unallocated_;
  }

  // Serializes id allocation in CreateTender.
  std::mutex& CreationMutex() {
    return creation_mutex_;
  }

 private:
  mutable std::mutex                              guard_;
  std::vector<std::shared_ptr<std::shared_mutex>> mutexes_;
  std::shared_mutex                               unallocated_;
  std::mutex                                      creation_mutex_;
};

} // namespace tender::core
