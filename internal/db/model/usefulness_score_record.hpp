#pragma once

#include <cstdint>
#include <string>

namespace ainp::db::model {

struct UsefulnessScoreRecord {
  std::string agent_did;
  double      usefulness_score = 0.0;
  uint64_t    updated_at_ms    = 0;
};

} // namespace ainp::db::model
