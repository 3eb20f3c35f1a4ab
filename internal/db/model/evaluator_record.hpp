#pragma once

#include <cstdint>
#include <string>

namespace tender::db::model {

struct EvaluatorRecord {
  std::string identity;
  std::string added_by;
  uint64_t    added_at_ms = 0;
};

} // namespace tender::db::model
