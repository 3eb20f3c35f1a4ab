#include "tender_locks.hpp"

namespace tender::core {

std::shared_ptr<std::shared_mutex> TenderLocks::For(uint64_t tender_id) const {
  std::lock_guard<std::mutex> lock(guard_);
  if (tender_id == 0 || tender_id > mutexes_.size()) {
    return nullptr;
  }
  return mutexes_[tender_id - 1];
}

void TenderLocks::Register(uint64_t count) {
  std::lock_guard<std::mutex> lock(guard_);
  while (mutexes_.size() < count) {
    mutexes_.push_back(std::make_shared<std::shared_mutex>());
  }
}

std::size_t TenderLocks::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

} // namespace tender::core
