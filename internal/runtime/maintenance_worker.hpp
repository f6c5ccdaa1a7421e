#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace ainp::negotiation {
class NegotiationEngine;
}
namespace ainp::settlement {
class SettlementCoordinator;
}

namespace ainp::runtime {

/*
  Background worker for the periodic broker chores:

      expire stale negotiations      every expiry_interval
      reconcile pending settlements  every reconcile_interval
*/
class MaintenanceWorker {
 public:
  struct Options {
    std::chrono::milliseconds expiry_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds reconcile_interval{std::chrono::seconds(30)};
    std::size_t               reconcile_batch = 100;
  };

  MaintenanceWorker(std::shared_ptr<negotiation::NegotiationEngine> engine,
                    std::shared_ptr<settlement::SettlementCoordinator> coordinator, Options options);
  ~MaintenanceWorker();

  MaintenanceWorker(const MaintenanceWorker&)            = delete;
  MaintenanceWorker& operator=(const MaintenanceWorker&) = delete;

  void Start();
  void Stop();

  // One pass of both chores, regardless of schedule.
  void RunOnce();

 private:
  void Run();
  void Expire();
  void Reconcile();

  std::shared_ptr<negotiation::NegotiationEngine>    engine_;
  std::shared_ptr<settlement::SettlementCoordinator> coordinator_;
  Options                                            options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace ainp::runtime
