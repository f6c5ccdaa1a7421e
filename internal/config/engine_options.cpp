#include "engine_options.hpp"

#include <google/protobuf/util/time_util.h>

#include <stdexcept>

namespace ainp::config {

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  const auto millis = google::protobuf::util::TimeUtil::DurationToMilliseconds(duration);
  if (millis <= 0) {
    return fallback;
  }
  return std::chrono::milliseconds(millis);
}

} // namespace

EngineOptions BuildEngineOptions(const ainp::runtime::config::RuntimeConfig& config) {
  EngineOptions options;

  const auto& negotiation = config.negotiation();
  if (negotiation.has_enabled()) options.negotiation_enabled = negotiation.enabled();
  if (negotiation.max_rounds_limit() > 0) options.max_rounds_limit = negotiation.max_rounds_limit();
  if (negotiation.default_max_rounds() > 0) options.default_max_rounds = negotiation.default_max_rounds();
  if (negotiation.default_ttl_minutes() > 0) options.default_ttl_minutes = negotiation.default_ttl_minutes();

  if (options.default_max_rounds > options.max_rounds_limit) {
    throw std::invalid_argument("negotiation.default_max_rounds exceeds negotiation.max_rounds_limit");
  }

  const auto& settlement = config.settlement();
  if (settlement.has_enabled()) options.settlement_enabled = settlement.enabled();
  if (settlement.atomic_unit_scale() > 0) options.atomic_unit_scale = settlement.atomic_unit_scale();
  options.broker_did = settlement.broker_did();

  const auto& maintenance = config.maintenance();
  options.expiry_interval    = ToMillis(maintenance.expiry_interval(), options.expiry_interval);
  options.reconcile_interval = ToMillis(maintenance.reconcile_interval(), options.reconcile_interval);
  if (maintenance.reconcile_batch() > 0) options.reconcile_batch = maintenance.reconcile_batch();

  return options;
}

} // namespace ainp::config
