#pragma once

#include <cstdint>
#include <string>

namespace ainp::db::model {

struct AccountRecord {
  std::string agent_did;
  uint64_t    balance       = 0;
  uint64_t    reserved      = 0;
  uint64_t    earned        = 0;
  uint64_t    spent         = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace ainp::db::model
