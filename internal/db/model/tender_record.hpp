#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "tender/manager/core/v1/types.pb.h"

namespace tender::db::model {

/*
  Persistent tender row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Rows are never deleted.
  - winner is written once, together with the FINALIZED status.
*/

struct TenderRecord {
  uint64_t id = 0;  // 1-based, allocated in creation order

  std::string creator;
  std::string description;

  uint64_t max_price = 0;

  // epoch ms
  uint64_t deadline_ms   = 0;
  uint64_t created_at_ms = 0;

  uint32_t weight_price   = 0;
  uint32_t weight_quality = 0;

  tender::manager::core::v1::TenderStatus status = tender::manager::core::v1::TENDER_STATUS_UNSPECIFIED;

  std::optional<std::string> winner;

  // Monotonic mutation counter
  uint64_t version = 0;
};

} // namespace tender::db::model
