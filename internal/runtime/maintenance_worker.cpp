#include "internal/runtime/maintenance_worker.hpp"

#include <algorithm>

#include "internal/negotiation/negotiation_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/settlement/settlement_coordinator.hpp"

namespace ainp::runtime {

using ainp::observability::StringField;
using ainp::observability::UIntField;

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<negotiation::NegotiationEngine>    engine,
                                     std::shared_ptr<settlement::SettlementCoordinator> coordinator, Options options)
    : engine_(std::move(engine)), coordinator_(std::move(coordinator)), options_(options) {
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void MaintenanceWorker::RunOnce() {
  Expire();
  Reconcile();
}

void MaintenanceWorker::Expire() {
  try {
    engine_->ExpireStaleNegotiations();
  } catch (const std::exception& e) {
    AINP_LOG_ERROR("negotiation expiry sweep failed", {StringField("error", e.what())});
  }
}

void MaintenanceWorker::Reconcile() {
  try {
    const auto completed = coordinator_->ReconcilePendingSettlements(options_.reconcile_batch);
    if (completed > 0) {
      AINP_LOG_INFO("reconciled pending settlements", {UIntField("completed", completed)});
    }
  } catch (const std::exception& e) {
    AINP_LOG_ERROR("settlement reconciliation sweep failed", {StringField("error", e.what())});
  }
}

void MaintenanceWorker::Run() {
  using Clock = std::chrono::steady_clock;

  auto next_expiry    = Clock::now() + options_.expiry_interval;
  auto next_reconcile = Clock::now() + options_.reconcile_interval;

  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    cv_.wait_until(lock, std::min(next_expiry, next_reconcile), [this] { return !running_; });
    if (!running_) break;

    const auto now = Clock::now();
    lock.unlock();

    if (now >= next_expiry) {
      Expire();
      next_expiry = now + options_.expiry_interval;
    }
    if (now >= next_reconcile) {
      Reconcile();
      next_reconcile = now + options_.reconcile_interval;
    }

    lock.lock();
  }
}

} // namespace ainp::runtime
