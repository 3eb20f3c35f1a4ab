#pragma once

#include <string_view>

#include "tender/manager/core/v1/types.pb.h"

namespace tender::model {

using Status = tender::manager::core::v1::TenderStatus;

constexpr bool IsTerminal(Status state) {
  return state == tender::manager::core::v1::TENDER_STATUS_FINALIZED;
}

// Open -> Closed -> Evaluated -> Finalized, one step at a time.
constexpr bool CanTransition(Status from, Status to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == tender::manager::core::v1::TENDER_STATUS_UNSPECIFIED || to == tender::manager::core::v1::TENDER_STATUS_UNSPECIFIED) {
    return false;
  }

  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

constexpr std::string_view StatusName(Status state) {
  switch (state) {
    case tender::manager::core::v1::TENDER_STATUS_OPEN:
      return "open";
    case tender::manager::core::v1::TENDER_STATUS_CLOSED:
      return "closed";
    case tender::manager::core::v1::TENDER_STATUS_EVALUATED:
      return "evaluated";
    case tender::manager::core::v1::TENDER_STATUS_FINALIZED:
      return "finalized";
    default:
      return "unspecified";
  }
}

} // namespace tender::model
