#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/engine_options.hpp"
#include "internal/credit/credit_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/incentive/incentive_distributor.hpp"
#include "internal/negotiation/negotiation_engine.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "internal/usefulness/usefulness_cache.hpp"

namespace ainp::factory {

/*
  Application

  Owns every long-lived component of the broker core. Everything here
  lives for the lifetime of the process.
*/
struct Application {
  config::EngineOptions options;

  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<credit::CreditLedger>            ledger;
  std::shared_ptr<usefulness::UsefulnessCache>     usefulness;
  std::shared_ptr<incentive::IncentiveDistributor> distributor;
  std::shared_ptr<negotiation::NegotiationEngine>  engine;
  std::shared_ptr<settlement::SettlementCoordinator> coordinator;

  // Not started; the caller decides when background work begins.
  std::shared_ptr<runtime::MaintenanceWorker> maintenance;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema. This is the
  ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const ainp::runtime::config::RuntimeConfig& config);

// Build the full dependency graph.
Application Build(const ainp::runtime::config::RuntimeConfig& config);

} // namespace ainp::factory
