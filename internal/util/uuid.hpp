#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ainp::util {

/*
  Row ids for negotiation sessions and ledger entries: random RFC4122
  version 4 UUIDs, rendered lowercase 8-4-4-4-12.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

} // namespace ainp::util
