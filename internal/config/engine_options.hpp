#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace ainp::config {

/*
  Runtime knobs shared by the negotiation and settlement components.
  Built once from RuntimeConfig; zero / missing config values take the
  defaults below.
*/
struct EngineOptions {
  bool     negotiation_enabled = true;
  uint32_t default_max_rounds  = 10;
  uint32_t max_rounds_limit    = 20;
  uint32_t default_ttl_minutes = 60;

  bool        settlement_enabled = true;
  uint64_t    atomic_unit_scale  = 1000;
  std::string broker_did;

  std::chrono::milliseconds expiry_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds reconcile_interval{std::chrono::seconds(30)};
  uint32_t                  reconcile_batch = 100;
};

// Throws std::invalid_argument for inconsistent settings.
EngineOptions BuildEngineOptions(const ainp::runtime::config::RuntimeConfig& config);

} // namespace ainp::config
