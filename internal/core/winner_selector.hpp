#pragma once

#include <cstdint>
#include <string>

#include "internal/core/core_context.hpp"
#include "tender/manager/v1.hpp"

namespace tender::core {

/*
  WinnerSelector

  Scores every participant of an Evaluated tender, picks the strict
  maximum (earliest submission wins ties) and finalizes the tender with
  that winner in one transaction.
*/
class WinnerSelector {
 public:
  explicit WinnerSelector(CoreContext ctx);

  tender::manager::v1::CalculateWinnerResponse CalculateWinner(const std::string& caller, uint64_t tender_id);

 private:
  CoreContext ctx_;
};

} // namespace tender::core
