#pragma once

#include <cstdint>
#include <string>

namespace tender::db::model {

/*
  Persistent offer row, keyed by (tender_id, provider).

  Presence of the row is what marks an offer as submitted; a zero
  quality_score says nothing about existence.
*/

struct OfferRecord {
  uint64_t    tender_id = 0;
  std::string provider;

  uint64_t    price = 0;
  std::string documentation_reference;  // opaque (hash, URI, ...)

  uint32_t quality_score = 0;
  bool     evaluated     = false;

  // Position in the tender's participant list, assigned on insert.
  uint64_t sequence = 0;

  uint64_t    submitted_at_ms = 0;
  std::string evaluated_by;
  uint64_t    evaluated_at_ms = 0;
};

} // namespace tender::db::model
